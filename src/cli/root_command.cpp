#include "planka/cli/root_command.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "planka/commands/all_commands.hpp"
#include "planka/config/client_config.hpp"
#include "planka/config/config.hpp"
#include "planka/log/logger.hpp"
#include "planka/version.hpp"

namespace planka::cli {

RootCommand::RootCommand(commands::CommandEnvironment& env)
    : Command("planka",
              "Planka CLI - Manage your Planka boards from the command line"),
      env_(env) {
    set_long_description(
        "Talks to a Planka server through its REST API. Run 'planka login' "
        "once to store the server URL and an access token; PLANKA_URL and "
        "PLANKA_TOKEN override them for a single invocation.")
        .set_usage("planka [GLOBAL_OPTIONS] <COMMAND> [COMMAND_OPTIONS]")
        .set_example(
            "  planka login --url https://planka.example.com\n"
            "  planka projects\n"
            "  planka board 1234567890\n"
            "  planka card-create 1234567891 \"Fix login page\" -d \"500 on "
            "submit\"");

    // Add global flags
    add_bool_flag_with_short("version", "V", "Show version information");
    add_bool_flag_with_short("verbose", "v", "Log requests to stderr");
    add_flag("settings", "Settings file (default: " +
                             config::ConfigPaths::settings_file().string() +
                             ")");

    commands::register_all_commands(*this, env_);
}

std::shared_ptr<RootCommand> RootCommand::create(
    commands::CommandEnvironment& env) {
    return std::shared_ptr<RootCommand>(new RootCommand(env));
}

void RootCommand::prepare(CommandContext& ctx) {
    config::ConfigManager manager;
    auto log_config = std::make_shared<log::LogConfig>();
    auto client_config = std::make_shared<config::ClientConfig>();
    manager.register_configuration_properties(log_config);
    manager.register_configuration_properties(client_config);

    if (ctx.is_user_provided("settings")) {
        std::string settings = ctx.get_flag("settings");
        manager.load_config(settings, config::format_from_path(settings));
    } else {
        manager.load_optional_config(config::ConfigPaths::settings_file());
    }

    std::string bad_level;
    if (const char* level = std::getenv(LOG_LEVEL_ENV);
        level != nullptr && *level != '\0') {
        try {
            log_config->global_level = log::Logger::level_from_string(level);
        } catch (const std::invalid_argument&) {
            bad_level = level;
        }
    }
    if (ctx.get_bool_flag("verbose")) {
        log_config->global_level = log::LogConfig::LogLevel::DEBUG;
    }

    log::Logger::init(*log_config);
    if (!bad_level.empty()) {
        PLANKA_LOG_WARN << "Ignoring unknown " << LOG_LEVEL_ENV << " '"
                        << bad_level << "'";
    }

    env_.set_client_config(*client_config);
}

int RootCommand::run(CommandContext& ctx) {
    // Handle global flags
    if (ctx.get_bool_flag("version")) {
        print_version(out());
        return 0;
    }

    print_help();
    return 0;
}

}  // namespace planka::cli
