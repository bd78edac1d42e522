#include <ostream>

#include "planka/api/errors.hpp"
#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

int show_card(CommandEnvironment& env, const std::string& card_id) {
    auto client = env.open_client();
    auto card = client->get_card(card_id);
    auto& out = env.out();

    out << "Card: " << field_text(card, "name") << std::endl;
    out << "ID: " << field_text(card, "id") << std::endl;
    out << "List ID: " << field_text(card, "listId") << std::endl;
    if (auto due = field_text(card, "dueDate"); !due.empty()) {
        out << "Due: " << due << std::endl;
    }
    if (auto description = field_text(card, "description");
        !description.empty()) {
        out << std::endl << "Description:" << std::endl;
        out << description << std::endl;
    }
    return 0;
}

int create_card(CommandEnvironment& env, cli::CommandContext& ctx) {
    api::CardCreate extras;
    if (ctx.is_user_provided("description")) {
        extras.description = ctx.get_flag("description");
    }
    if (ctx.is_user_provided("due-date")) {
        extras.due_date = ctx.get_flag("due-date");
    }

    auto client = env.open_client();
    print_entity(env.out(), "Created", "card",
                 client->create_card(ctx.arg(0), ctx.arg(1),
                                     ctx.get_double_flag("position"), extras));
    return 0;
}

int update_card(CommandEnvironment& env, cli::CommandContext& ctx) {
    api::CardUpdate update;
    if (ctx.is_user_provided("name")) {
        update.name = ctx.get_flag("name");
    }
    if (ctx.is_user_provided("description")) {
        update.description = ctx.get_flag("description");
    }
    if (ctx.is_user_provided("list-id")) {
        update.list_id = ctx.get_flag("list-id");
    }
    if (ctx.is_user_provided("position")) {
        update.position = ctx.get_double_flag("position");
    }
    if (ctx.is_user_provided("due-date") && ctx.get_bool_flag("clear-due-date")) {
        throw UsageError("--due-date and --clear-due-date are exclusive");
    }
    if (ctx.is_user_provided("due-date")) {
        update.due_date = ctx.get_flag("due-date");
    } else if (ctx.get_bool_flag("clear-due-date")) {
        update.due_date = nullptr;
    }

    nlohmann::json body = update.to_json();
    if (body.empty()) {
        env.out() << "No updates provided" << std::endl;
        return 0;
    }

    auto client = env.open_client();
    auto card = client->update_card(ctx.arg(0), update);
    env.out() << "Updated card: " << field_text(card, "name") << std::endl;
    return 0;
}

}  // namespace

void register_card_commands(cli::Command& root, CommandEnvironment& env) {
    auto show = make_command("card", "Show card details",
                             [&env](cli::CommandContext& ctx) {
                                 return show_card(env, ctx.arg(0));
                             });
    show->add_argument("card_id", "Card ID");
    root.add_command(show);

    auto create = make_command(
        "card-create", "Create a new card in a list",
        [&env](cli::CommandContext& ctx) { return create_card(env, ctx); });
    create->add_argument("list_id", "List ID");
    create->add_argument("name", "Card name");
    create->add_double_flag_with_short("position", "p", "Position in list",
                                       DEFAULT_POSITION);
    create->add_flag_with_short("description", "d", "Card description");
    create->add_flag("due-date", "Due date (ISO format)");
    root.add_command(create);

    auto update = make_command(
        "card-update", "Update a card",
        [&env](cli::CommandContext& ctx) { return update_card(env, ctx); });
    update->add_argument("card_id", "Card ID");
    update->add_flag_with_short("name", "n", "New card name");
    update->add_flag_with_short("description", "d", "New card description");
    update->add_flag_with_short("list-id", "l", "Move to list ID");
    update->add_double_flag_with_short("position", "p", "New position");
    update->add_flag("due-date", "Due date (ISO format)");
    update->add_bool_flag("clear-due-date", "Remove the due date");
    root.add_command(update);

    auto move = make_command(
        "card-move", "Move a card to a different list",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            auto card = client->move_card(ctx.arg(0), ctx.arg(1),
                                          ctx.get_double_flag("position"));
            env.out() << "Moved card: " << field_text(card, "name")
                      << std::endl;
            return 0;
        });
    move->add_argument("card_id", "Card ID");
    move->add_argument("list_id", "Target list ID");
    move->add_double_flag_with_short("position", "p", "Position in new list",
                                     DEFAULT_POSITION);
    root.add_command(move);

    auto remove = make_command(
        "card-delete", "Delete a card",
        [&env](cli::CommandContext& ctx) {
            if (!env.confirm(ctx,
                             "Are you sure you want to delete this card?")) {
                return 1;
            }
            auto client = env.open_client();
            client->delete_card(ctx.arg(0));
            env.out() << "Card deleted" << std::endl;
            return 0;
        });
    remove->add_argument("card_id", "Card ID");
    add_yes_flag(*remove);
    root.add_command(remove);

    auto duplicate = make_command(
        "card-duplicate", "Duplicate a card",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            print_entity(env.out(), "Duplicated", "card",
                         client->duplicate_card(
                             ctx.arg(0), ctx.get_double_flag("position")));
            return 0;
        });
    duplicate->add_argument("card_id", "Card ID");
    duplicate->add_double_flag_with_short(
        "position", "p", "Position for duplicate", DEFAULT_POSITION);
    root.add_command(duplicate);
}

}  // namespace planka::commands
