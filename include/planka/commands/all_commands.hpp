#pragma once

#include <memory>
#include <string>

#include "planka/cli/command.hpp"
#include "planka/commands/command_environment.hpp"

namespace planka::commands {

std::shared_ptr<cli::FunctionCommand> make_command(
    const std::string& name, const std::string& description,
    cli::FunctionCommand::Handler handler);

// Adds --yes/-y to skip the confirmation prompt
void add_yes_flag(cli::Command& cmd);

void register_auth_commands(cli::Command& root, CommandEnvironment& env);
void register_project_commands(cli::Command& root, CommandEnvironment& env);
void register_board_commands(cli::Command& root, CommandEnvironment& env);
void register_list_commands(cli::Command& root, CommandEnvironment& env);
void register_card_commands(cli::Command& root, CommandEnvironment& env);
void register_comment_commands(cli::Command& root, CommandEnvironment& env);
void register_label_commands(cli::Command& root, CommandEnvironment& env);
void register_task_commands(cli::Command& root, CommandEnvironment& env);
void register_attachment_commands(cli::Command& root,
                                  CommandEnvironment& env);
void register_membership_commands(cli::Command& root,
                                  CommandEnvironment& env);
void register_user_commands(cli::Command& root, CommandEnvironment& env);
void register_notification_commands(cli::Command& root,
                                    CommandEnvironment& env);
void register_activity_commands(cli::Command& root, CommandEnvironment& env);

void register_all_commands(cli::Command& root, CommandEnvironment& env);

}  // namespace planka::commands
