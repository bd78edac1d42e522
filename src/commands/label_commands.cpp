#include <ostream>

#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

int update_label(CommandEnvironment& env, cli::CommandContext& ctx) {
    api::LabelUpdate update;
    if (ctx.is_user_provided("name")) {
        update.name = ctx.get_flag("name");
    }
    if (ctx.is_user_provided("color")) {
        update.color = ctx.get_flag("color");
    }
    if (ctx.is_user_provided("position")) {
        update.position = ctx.get_double_flag("position");
    }
    if (update.to_json().empty()) {
        env.out() << "No updates provided" << std::endl;
        return 0;
    }

    auto client = env.open_client();
    auto label = client->update_label(ctx.arg(0), update);
    env.out() << "Updated label: " << field_text(label, "name") << std::endl;
    return 0;
}

}  // namespace

void register_label_commands(cli::Command& root, CommandEnvironment& env) {
    auto create = make_command(
        "label-create", "Create a label on a board",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            print_entity(env.out(), "Created", "label",
                         client->create_label(ctx.arg(0), ctx.arg(1),
                                              ctx.get_flag("color"),
                                              ctx.get_double_flag("position")));
            return 0;
        });
    create->add_argument("board_id", "Board ID");
    create->add_argument("name", "Label name");
    create->add_flag_with_short("color", "c", "Label color",
                                DEFAULT_LABEL_COLOR);
    create->add_double_flag_with_short("position", "p", "Position",
                                       DEFAULT_POSITION);
    root.add_command(create);

    auto update = make_command(
        "label-update", "Update a label",
        [&env](cli::CommandContext& ctx) { return update_label(env, ctx); });
    update->add_argument("label_id", "Label ID");
    update->add_flag_with_short("name", "n", "New label name");
    update->add_flag_with_short("color", "c", "New label color");
    update->add_double_flag_with_short("position", "p", "New position");
    root.add_command(update);

    auto remove = make_command(
        "label-delete", "Delete a label",
        [&env](cli::CommandContext& ctx) {
            if (!env.confirm(ctx,
                             "Are you sure you want to delete this label?")) {
                return 1;
            }
            auto client = env.open_client();
            client->delete_label(ctx.arg(0));
            env.out() << "Label deleted" << std::endl;
            return 0;
        });
    remove->add_argument("label_id", "Label ID");
    add_yes_flag(*remove);
    root.add_command(remove);

    auto add = make_command("label-add", "Add a label to a card",
                            [&env](cli::CommandContext& ctx) {
                                auto client = env.open_client();
                                client->add_label_to_card(ctx.arg(0),
                                                          ctx.arg(1));
                                env.out() << "Label added to card"
                                          << std::endl;
                                return 0;
                            });
    add->add_argument("card_id", "Card ID");
    add->add_argument("label_id", "Label ID");
    root.add_command(add);

    auto remove_from_card = make_command(
        "label-remove", "Remove a label from a card",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            client->remove_label_from_card(ctx.arg(0), ctx.arg(1));
            env.out() << "Label removed from card" << std::endl;
            return 0;
        });
    remove_from_card->add_argument("card_id", "Card ID");
    remove_from_card->add_argument("label_id", "Label ID");
    root.add_command(remove_from_card);
}

}  // namespace planka::commands
