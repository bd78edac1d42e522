#include "planka/commands/command_environment.hpp"

#include <ostream>

#include "planka/config/session.hpp"
#include "planka/http/beast_http_transport.hpp"
#include "planka/log/logger.hpp"

namespace planka::commands {

CommandEnvironment::CommandEnvironment(config::ConfigStore& store,
                                       std::ostream& out, std::ostream& err,
                                       cli::Prompter& prompter)
    : store_(store), out_(out), err_(err), prompter_(prompter) {}

std::unique_ptr<api::PlankaClient> CommandEnvironment::create_client(
    const std::string& url, const std::optional<std::string>& token) {
    if (client_factory_) {
        return client_factory_(url, token);
    }
    PLANKA_LOG_DEBUG << "Connecting to " << url << " (timeout "
                     << client_config_.timeout_seconds << "s)";
    return std::make_unique<api::PlankaClient>(
        url, token,
        std::make_unique<http::BeastHttpTransport>(url, client_config_));
}

std::unique_ptr<api::PlankaClient> CommandEnvironment::open_client() {
    config::Session session = config::resolve_session(store_);
    if (!session.token) {
        PLANKA_LOG_WARN << "No access token; requests are unauthenticated";
    }
    return create_client(session.url, session.token);
}

bool CommandEnvironment::confirm(const cli::CommandContext& ctx,
                                 const std::string& question) {
    if (ctx.get_bool_flag("yes") || prompter_.confirm(question)) {
        return true;
    }
    err_ << "Aborted!" << std::endl;
    return false;
}

}  // namespace planka::commands
