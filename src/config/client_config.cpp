#include "planka/config/client_config.hpp"

#include <stdexcept>

#include "planka/version.hpp"

namespace planka::config {

ClientConfig::ClientConfig()
    : user_agent(std::string(APP_NAME) + "-cli/" + VERSION) {}

void ClientConfig::from_ptree(const boost::property_tree::ptree& pt) {
    timeout_seconds = get_value(pt, "timeout_seconds", timeout_seconds);
    verify_tls = get_value(pt, "verify_tls", verify_tls);
    ca_file = get_value(pt, "ca_file", ca_file);
    user_agent = get_value(pt, "user_agent", user_agent);
}

void ClientConfig::validate() const {
    if (timeout_seconds <= 0) {
        throw std::invalid_argument(
            "client.timeout_seconds must be greater than 0");
    }
    if (user_agent.empty()) {
        throw std::invalid_argument("client.user_agent cannot be empty");
    }
}

}  // namespace planka::config
