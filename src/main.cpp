#include <iostream>

#include "planka/cli/prompter.hpp"
#include "planka/cli/root_command.hpp"
#include "planka/commands/command_environment.hpp"
#include "planka/config/config_store.hpp"
#include "planka/log/logger.hpp"

int main(int argc, char* argv[]) {
    try {
        planka::log::Logger::init(planka::log::LogConfig{});

        planka::config::ConfigStore store(
            planka::config::ConfigStore::default_path());
        planka::cli::Prompter prompter(std::cin, std::cout);
        planka::commands::CommandEnvironment env(store, std::cout, std::cerr,
                                                 prompter);

        auto root_cmd = planka::cli::RootCommand::create(env);
        int exit_code = root_cmd->execute(argc, argv);

        planka::log::Logger::shutdown();
        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
