#pragma once
#include <memory>

#include "planka/cli/command.hpp"
#include "planka/commands/command_environment.hpp"

namespace planka::cli {

constexpr const char* LOG_LEVEL_ENV = "PLANKA_LOG_LEVEL";

// Root command that manages all subcommands and the global flags
class RootCommand : public Command {
public:
    static std::shared_ptr<RootCommand> create(
        commands::CommandEnvironment& env);

    int run(CommandContext& ctx) override;

protected:
    // Loads settings, sets up logging and the client configuration
    void prepare(CommandContext& ctx) override;

private:
    explicit RootCommand(commands::CommandEnvironment& env);

    commands::CommandEnvironment& env_;
};

}  // namespace planka::cli
