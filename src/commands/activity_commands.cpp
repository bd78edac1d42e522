#include <ostream>

#include "planka/api/errors.hpp"
#include "planka/cli/table.hpp"
#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

constexpr int kDefaultLimit = 20;
constexpr size_t kDataColumnWidth = 50;

int limit_flag(const cli::CommandContext& ctx) {
    int limit = ctx.get_int_flag("limit");
    if (limit < 0) {
        throw UsageError("--limit must not be negative");
    }
    return limit;
}

void print_actions(CommandEnvironment& env, const std::string& title,
                   const nlohmann::json& actions, int limit) {
    cli::Table table(title);
    table.add_column("Type");
    table.add_column("User");
    table.add_column("Data", kDataColumnWidth);
    for (const auto& action : actions) {
        if (table.row_count() >= static_cast<size_t>(limit)) {
            break;
        }
        std::string data = "{}";
        if (action.is_object() && action.contains("data")) {
            data = action["data"].dump();
        }
        table.add_row({field_text(action, "type"),
                       field_text(action, "userId"), data});
    }
    table.print(env.out());
}

}  // namespace

void register_activity_commands(cli::Command& root, CommandEnvironment& env) {
    auto board = make_command(
        "activity", "Show board activity",
        [&env](cli::CommandContext& ctx) {
            int limit = limit_flag(ctx);
            auto client = env.open_client();
            print_actions(env, "Board Activity",
                          client->get_board_actions(ctx.arg(0)), limit);
            return 0;
        });
    board->add_argument("board_id", "Board ID");
    board->add_int_flag_with_short("limit", "l", "Number of actions to show",
                                   kDefaultLimit);
    root.add_command(board);

    auto card = make_command(
        "card-activity", "Show card activity",
        [&env](cli::CommandContext& ctx) {
            int limit = limit_flag(ctx);
            auto client = env.open_client();
            print_actions(env, "Card Activity",
                          client->get_card_actions(ctx.arg(0)), limit);
            return 0;
        });
    card->add_argument("card_id", "Card ID");
    card->add_int_flag_with_short("limit", "l", "Number of actions to show",
                                  kDefaultLimit);
    root.add_command(card);
}

}  // namespace planka::commands
