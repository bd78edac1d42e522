#pragma once

#include <optional>
#include <string>

#include "planka/config/config_store.hpp"

namespace planka::config {

constexpr const char* URL_ENV = "PLANKA_URL";
constexpr const char* TOKEN_ENV = "PLANKA_TOKEN";

// Credentials used for one invocation
struct Session {
    std::string url;
    std::optional<std::string> token;
};

// PLANKA_URL / PLANKA_TOKEN take precedence over the persisted values and
// are never written back. Throws NotConfiguredError without a url.
Session resolve_session(const ConfigStore& store);

}  // namespace planka::config
