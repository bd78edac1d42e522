#pragma once

#include <cstdint>
#include <string>

#include "planka/config/config.hpp"

namespace planka::log {

// Log configuration, bound to the "log" section of settings.yaml
class LogConfig : public config::ClonableConfigurationProperties<LogConfig> {
public:
    enum class LogLevel {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        FATAL = 5
    };

    // Console output goes to stderr; stdout is reserved for command output
    struct ConsoleConfig {
        bool enabled = true;
        std::string pattern = "%Severity%: %Message%";
    };

    struct FileConfig {
        bool enabled = false;
        std::string log_file = "planka.log";
        int64_t max_file_size = 1048576;  // 1MB
        int max_files = 3;
        std::string pattern =
            "[%TimeStamp%] [%Severity%] %Message%";
    };

    LogLevel global_level = LogLevel::WARN;
    ConsoleConfig console;
    FileConfig file;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "log"; }

    static LogLevel level_from_string(const std::string& level_str);
    static std::string level_to_string(LogLevel level);
};

}  // namespace planka::log
