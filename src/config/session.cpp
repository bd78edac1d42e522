#include "planka/config/session.hpp"

#include <cstdlib>

#include "planka/api/errors.hpp"
#include "planka/log/logger.hpp"

namespace planka::config {

namespace {

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

Session resolve_session(const ConfigStore& store) {
    Session session;

    if (auto url = env_value(URL_ENV)) {
        PLANKA_LOG_DEBUG << "Using server url from " << URL_ENV;
        session.url = *url;
    } else if (auto stored = store.get_url(); stored && !stored->empty()) {
        session.url = *stored;
    } else {
        throw NotConfiguredError(
            "No Planka URL configured. Run 'planka login' first.");
    }

    if (auto token = env_value(TOKEN_ENV)) {
        PLANKA_LOG_DEBUG << "Using token from " << TOKEN_ENV;
        session.token = token;
    } else if (auto stored = store.get_token(); stored && !stored->empty()) {
        session.token = stored;
    }

    return session;
}

}  // namespace planka::config
