#include "planka/commands/all_commands.hpp"

namespace planka::commands {

std::shared_ptr<cli::FunctionCommand> make_command(
    const std::string& name, const std::string& description,
    cli::FunctionCommand::Handler handler) {
    return std::make_shared<cli::FunctionCommand>(name, description,
                                                  std::move(handler));
}

void add_yes_flag(cli::Command& cmd) {
    cmd.add_bool_flag_with_short("yes", "y",
                                 "Confirm the action without prompting");
}

void register_all_commands(cli::Command& root, CommandEnvironment& env) {
    register_auth_commands(root, env);
    register_project_commands(root, env);
    register_board_commands(root, env);
    register_list_commands(root, env);
    register_card_commands(root, env);
    register_comment_commands(root, env);
    register_label_commands(root, env);
    register_task_commands(root, env);
    register_attachment_commands(root, env);
    register_membership_commands(root, env);
    register_user_commands(root, env);
    register_notification_commands(root, env);
    register_activity_commands(root, env);
}

}  // namespace planka::commands
