#pragma once

#include <string>

#include "planka/config/config.hpp"

namespace planka::config {

// HTTP client settings, bound to the "client" section of settings.yaml
class ClientConfig
    : public ClonableConfigurationProperties<ClientConfig> {
public:
    static constexpr int DEFAULT_TIMEOUT_SECONDS = 30;

    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    bool verify_tls = true;
    // Extra CA bundle for self-hosted servers
    std::string ca_file;
    std::string user_agent;

    ClientConfig();

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "client"; }
};

}  // namespace planka::config
