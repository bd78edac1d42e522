#include <ostream>

#include "planka/api/errors.hpp"
#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

bool parse_yes_no(const std::string& flag, const std::string& value) {
    if (value == "true" || value == "yes" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "0") {
        return false;
    }
    throw UsageError("Invalid value '" + value + "' for --" + flag +
                     " (expected true or false)");
}

void check_role(const std::string& role) {
    if (role != "editor" && role != "viewer") {
        throw UsageError("Invalid role '" + role +
                         "' (expected editor or viewer)");
    }
}

int update_board_member(CommandEnvironment& env, cli::CommandContext& ctx) {
    api::BoardMembershipUpdate update;
    if (ctx.is_user_provided("role")) {
        check_role(ctx.get_flag("role"));
        update.role = ctx.get_flag("role");
    }
    if (ctx.is_user_provided("can-comment")) {
        update.can_comment =
            parse_yes_no("can-comment", ctx.get_flag("can-comment"));
    }
    if (update.to_json().empty()) {
        env.out() << "No updates provided" << std::endl;
        return 0;
    }

    auto client = env.open_client();
    auto membership = client->update_board_membership(ctx.arg(0), update);
    env.out() << "Updated board membership (ID: "
              << field_text(membership, "id") << ")" << std::endl;
    return 0;
}

}  // namespace

void register_membership_commands(cli::Command& root,
                                  CommandEnvironment& env) {
    auto card_add = make_command(
        "card-member-add", "Add a user to a card",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            client->add_member_to_card(ctx.arg(0), ctx.arg(1));
            env.out() << "Member added to card" << std::endl;
            return 0;
        });
    card_add->add_argument("card_id", "Card ID");
    card_add->add_argument("user_id", "User ID");
    root.add_command(card_add);

    auto card_remove = make_command(
        "card-member-remove", "Remove a user from a card",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            client->remove_member_from_card(ctx.arg(0), ctx.arg(1));
            env.out() << "Member removed from card" << std::endl;
            return 0;
        });
    card_remove->add_argument("card_id", "Card ID");
    card_remove->add_argument("user_id", "User ID");
    root.add_command(card_remove);

    auto board_add = make_command(
        "board-member-add", "Add a user to a board",
        [&env](cli::CommandContext& ctx) {
            std::string role = ctx.get_flag("role");
            check_role(role);
            auto client = env.open_client();
            auto membership =
                client->add_member_to_board(ctx.arg(0), ctx.arg(1), role);
            env.out() << "Added board member as " << role
                      << " (ID: " << field_text(membership, "id") << ")"
                      << std::endl;
            return 0;
        });
    board_add->add_argument("board_id", "Board ID");
    board_add->add_argument("user_id", "User ID");
    board_add->add_flag_with_short("role", "r", "editor or viewer", "editor");
    root.add_command(board_add);

    auto board_update = make_command(
        "board-member-update", "Change a board membership",
        [&env](cli::CommandContext& ctx) {
            return update_board_member(env, ctx);
        });
    board_update->add_argument("membership_id", "Board membership ID");
    board_update->add_flag_with_short("role", "r", "editor or viewer");
    board_update->add_flag("can-comment",
                           "Whether a viewer may comment (true or false)");
    root.add_command(board_update);

    auto board_remove = make_command(
        "board-member-remove", "Remove a board membership",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            client->remove_board_membership(ctx.arg(0));
            env.out() << "Board member removed" << std::endl;
            return 0;
        });
    board_remove->add_argument("membership_id", "Board membership ID");
    root.add_command(board_remove);
}

}  // namespace planka::commands
