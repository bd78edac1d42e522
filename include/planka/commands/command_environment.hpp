#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "planka/api/planka_client.hpp"
#include "planka/cli/command.hpp"
#include "planka/cli/prompter.hpp"
#include "planka/config/client_config.hpp"
#include "planka/config/config_store.hpp"

namespace planka::commands {

constexpr double DEFAULT_POSITION = 65535.0;
constexpr const char* DEFAULT_LABEL_COLOR = "berry-red";

/// @brief Everything a subcommand needs besides its arguments: the session
/// store, client settings, output streams, the prompter and a way to build
/// a PlankaClient.
///
/// Tests replace the client factory to run commands against a scripted
/// transport.
class CommandEnvironment {
public:
    using ClientFactory = std::function<std::unique_ptr<api::PlankaClient>(
        const std::string& url, const std::optional<std::string>& token)>;

    CommandEnvironment(config::ConfigStore& store, std::ostream& out,
                       std::ostream& err, cli::Prompter& prompter);

    config::ConfigStore& store() { return store_; }
    std::ostream& out() { return out_; }
    std::ostream& err() { return err_; }
    cli::Prompter& prompter() { return prompter_; }

    const config::ClientConfig& client_config() const {
        return client_config_;
    }
    void set_client_config(const config::ClientConfig& client_config) {
        client_config_ = client_config;
    }

    void set_client_factory(ClientFactory factory) {
        client_factory_ = std::move(factory);
    }

    std::unique_ptr<api::PlankaClient> create_client(
        const std::string& url, const std::optional<std::string>& token);

    /// @brief Client for the resolved session.
    /// @throws NotConfiguredError if no server url is known.
    std::unique_ptr<api::PlankaClient> open_client();

    /// @brief Asks before a destructive action unless --yes was given.
    /// Prints "Aborted!" when the user declines.
    bool confirm(const cli::CommandContext& ctx, const std::string& question);

private:
    config::ConfigStore& store_;
    std::ostream& out_;
    std::ostream& err_;
    cli::Prompter& prompter_;
    config::ClientConfig client_config_;
    ClientFactory client_factory_;
};

}  // namespace planka::commands
