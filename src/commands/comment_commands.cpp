#include <ostream>

#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

void register_comment_commands(cli::Command& root, CommandEnvironment& env) {
    auto list = make_command(
        "comments", "List comments on a card",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            auto comments = client->get_comments(ctx.arg(0));
            if (comments.empty()) {
                env.out() << "No comments" << std::endl;
                return 0;
            }
            for (const auto& comment : comments) {
                env.out() << field_text(comment, "id") << ": "
                          << field_text(comment, "text") << std::endl;
            }
            return 0;
        });
    list->add_argument("card_id", "Card ID");
    root.add_command(list);

    auto add = make_command(
        "comment-add", "Add a comment to a card",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            auto comment = client->create_comment(ctx.arg(0), ctx.arg(1));
            env.out() << "Added comment (ID: " << field_text(comment, "id")
                      << ")" << std::endl;
            return 0;
        });
    add->add_argument("card_id", "Card ID");
    add->add_argument("text", "Comment text");
    root.add_command(add);

    auto update = make_command(
        "comment-update", "Change the text of a comment",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            auto comment = client->update_comment(ctx.arg(0), ctx.arg(1));
            env.out() << "Updated comment (ID: " << field_text(comment, "id")
                      << ")" << std::endl;
            return 0;
        });
    update->add_argument("comment_id", "Comment ID");
    update->add_argument("text", "New comment text");
    root.add_command(update);

    auto remove = make_command(
        "comment-delete", "Delete a comment",
        [&env](cli::CommandContext& ctx) {
            if (!env.confirm(ctx,
                             "Are you sure you want to delete this comment?")) {
                return 1;
            }
            auto client = env.open_client();
            client->delete_comment(ctx.arg(0));
            env.out() << "Comment deleted" << std::endl;
            return 0;
        });
    remove->add_argument("comment_id", "Comment ID");
    add_yes_flag(*remove);
    root.add_command(remove);
}

}  // namespace planka::commands
