#include <ostream>

#include "planka/cli/table.hpp"
#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

int update_list(CommandEnvironment& env, cli::CommandContext& ctx) {
    api::ListUpdate update;
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
    auto list = client->update_list(ctx.arg(0), update);
    env.out() << "Updated list: " << field_text(list, "name") << std::endl;
    return 0;
}

int list_cards(CommandEnvironment& env, const std::string& list_id) {
    auto client = env.open_client();
    auto cards = client->get_cards(list_id);
    if (cards.empty()) {
        env.out() << "No cards" << std::endl;
        return 0;
    }

    cli::Table table("Cards");
    table.add_column("ID");
    table.add_column("Name");
    table.add_column("Due");
    for (const auto& card : cards) {
        table.add_row({field_text(card, "id"), field_text(card, "name"),
                       field_text(card, "dueDate")});
    }
    table.print(env.out());
    return 0;
}

}  // namespace

void register_list_commands(cli::Command& root, CommandEnvironment& env) {
    auto create = make_command(
        "list-create", "Create a new list in a board",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            print_entity(env.out(), "Created", "list",
                         client->create_list(ctx.arg(0), ctx.arg(1),
                                             ctx.get_double_flag("position")));
            return 0;
        });
    create->add_argument("board_id", "Board ID");
    create->add_argument("name", "List name");
    create->add_double_flag_with_short("position", "p", "Position in board",
                                       DEFAULT_POSITION);
    root.add_command(create);

    auto update = make_command(
        "list-update", "Update a list",
        [&env](cli::CommandContext& ctx) { return update_list(env, ctx); });
    update->add_argument("list_id", "List ID");
    update->add_flag_with_short("name", "n", "New list name");
    update->add_double_flag_with_short("position", "p", "New position");
    root.add_command(update);

    auto remove = make_command(
        "list-delete", "Delete a list",
        [&env](cli::CommandContext& ctx) {
            if (!env.confirm(ctx,
                             "Are you sure you want to delete this list?")) {
                return 1;
            }
            auto client = env.open_client();
            client->delete_list(ctx.arg(0));
            env.out() << "List deleted" << std::endl;
            return 0;
        });
    remove->add_argument("list_id", "List ID");
    add_yes_flag(*remove);
    root.add_command(remove);

    auto sort = make_command("list-sort", "Sort the cards of a list",
                             [&env](cli::CommandContext& ctx) {
                                 auto client = env.open_client();
                                 client->sort_list(ctx.arg(0));
                                 env.out() << "List sorted" << std::endl;
                                 return 0;
                             });
    sort->add_argument("list_id", "List ID");
    root.add_command(sort);

    auto cards = make_command("cards", "List the cards of a list",
                              [&env](cli::CommandContext& ctx) {
                                  return list_cards(env, ctx.arg(0));
                              });
    cards->add_argument("list_id", "List ID");
    root.add_command(cards);
}

}  // namespace planka::commands
