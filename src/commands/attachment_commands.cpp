#include <ostream>

#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

void register_attachment_commands(cli::Command& root,
                                  CommandEnvironment& env) {
    auto upload = make_command(
        "attachment-upload", "Upload a file to a card",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            print_entity(env.out(), "Uploaded", "attachment",
                         client->create_attachment(ctx.arg(0), ctx.arg(1)));
            return 0;
        });
    upload->add_argument("card_id", "Card ID");
    upload->add_argument("file", "Path of the file to upload");
    root.add_command(upload);

    auto rename = make_command(
        "attachment-rename", "Rename an attachment",
        [&env](cli::CommandContext& ctx) {
            api::AttachmentUpdate update;
            update.name = ctx.arg(1);
            auto client = env.open_client();
            auto attachment = client->update_attachment(ctx.arg(0), update);
            env.out() << "Renamed attachment: "
                      << field_text(attachment, "name") << std::endl;
            return 0;
        });
    rename->add_argument("attachment_id", "Attachment ID");
    rename->add_argument("name", "New attachment name");
    root.add_command(rename);

    auto remove = make_command(
        "attachment-delete", "Delete an attachment",
        [&env](cli::CommandContext& ctx) {
            if (!env.confirm(
                    ctx, "Are you sure you want to delete this attachment?")) {
                return 1;
            }
            auto client = env.open_client();
            client->delete_attachment(ctx.arg(0));
            env.out() << "Attachment deleted" << std::endl;
            return 0;
        });
    remove->add_argument("attachment_id", "Attachment ID");
    add_yes_flag(*remove);
    root.add_command(remove);
}

}  // namespace planka::commands
