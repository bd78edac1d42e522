#include <ostream>

#include "planka/api/board_layout.hpp"
#include "planka/cli/table.hpp"
#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

int show_board(CommandEnvironment& env, const std::string& board_id) {
    auto client = env.open_client();
    auto columns = api::group_board(client->get_board(board_id));

    if (columns.empty()) {
        env.out() << "No lists" << std::endl;
        return 0;
    }

    for (const auto& column : columns) {
        std::string name = field_text(column.list, "name");
        cli::Table table((name.empty() ? "Unnamed" : name) + " (" +
                         std::to_string(column.cards.size()) + " cards)");
        table.add_column("ID");
        table.add_column("Name");
        for (const auto& card : column.cards) {
            table.add_row({field_text(card, "id"), field_text(card, "name")});
        }
        table.print(env.out());
        env.out() << std::endl;
    }
    return 0;
}

int update_board(CommandEnvironment& env, cli::CommandContext& ctx) {
    api::BoardUpdate update;
    if (ctx.is_user_provided("name")) {
        update.name = ctx.get_flag("name");
    }
    if (ctx.is_user_provided("position")) {
        update.position = ctx.get_double_flag("position");
    }
    if (!update.name.is_set() && !update.position.is_set()) {
        env.out() << "No updates provided" << std::endl;
        return 0;
    }

    auto client = env.open_client();
    auto board = client->update_board(ctx.arg(0), update);
    env.out() << "Updated board: " << field_text(board, "name") << std::endl;
    return 0;
}

}  // namespace

void register_board_commands(cli::Command& root, CommandEnvironment& env) {
    auto show = make_command("board", "Show board details with lists and cards",
                             [&env](cli::CommandContext& ctx) {
                                 return show_board(env, ctx.arg(0));
                             });
    show->add_argument("board_id", "Board ID");
    root.add_command(show);

    auto create = make_command(
        "board-create", "Create a new board in a project",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            print_entity(env.out(), "Created", "board",
                         client->create_board(ctx.arg(0), ctx.arg(1),
                                              ctx.get_double_flag("position")));
            return 0;
        });
    create->add_argument("project_id", "Project ID");
    create->add_argument("name", "Board name");
    create->add_double_flag_with_short("position", "p", "Position in project",
                                       DEFAULT_POSITION);
    root.add_command(create);

    auto update = make_command(
        "board-update", "Update a board",
        [&env](cli::CommandContext& ctx) { return update_board(env, ctx); });
    update->add_argument("board_id", "Board ID");
    update->add_flag_with_short("name", "n", "New board name");
    update->add_double_flag_with_short("position", "p", "New position");
    root.add_command(update);

    auto remove = make_command(
        "board-delete", "Delete a board",
        [&env](cli::CommandContext& ctx) {
            if (!env.confirm(ctx,
                             "Are you sure you want to delete this board?")) {
                return 1;
            }
            auto client = env.open_client();
            client->delete_board(ctx.arg(0));
            env.out() << "Board deleted" << std::endl;
            return 0;
        });
    remove->add_argument("board_id", "Board ID");
    add_yes_flag(*remove);
    root.add_command(remove);
}

}  // namespace planka::commands
