#include <ostream>

#include "planka/cli/table.hpp"
#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

int list_notifications(CommandEnvironment& env) {
    auto client = env.open_client();
    auto notifications = client->get_notifications();
    if (notifications.empty()) {
        env.out() << "No notifications" << std::endl;
        return 0;
    }

    cli::Table table("Notifications");
    table.add_column("ID");
    table.add_column("Type");
    table.add_column("Read");
    for (const auto& notification : notifications) {
        auto it = notification.find("isRead");
        bool is_read = it != notification.end() && it->is_boolean() &&
                       it->get<bool>();
        table.add_row({field_text(notification, "id"),
                       field_text(notification, "type"),
                       is_read ? "Yes" : "No"});
    }
    table.print(env.out());
    return 0;
}

}  // namespace

void register_notification_commands(cli::Command& root,
                                    CommandEnvironment& env) {
    root.add_command(make_command(
        "notifications", "List notifications",
        [&env](cli::CommandContext&) { return list_notifications(env); }));

    auto read = make_command(
        "notification-read", "Mark a notification as read",
        [&env](cli::CommandContext& ctx) {
            api::NotificationUpdate update;
            update.is_read = true;
            auto client = env.open_client();
            client->update_notification(ctx.arg(0), update);
            env.out() << "Notification marked as read" << std::endl;
            return 0;
        });
    read->add_argument("notification_id", "Notification ID");
    root.add_command(read);

    root.add_command(make_command(
        "notifications-read-all", "Mark all notifications as read",
        [&env](cli::CommandContext&) {
            auto client = env.open_client();
            client->read_all_notifications();
            env.out() << "All notifications marked as read" << std::endl;
            return 0;
        }));
}

}  // namespace planka::commands
