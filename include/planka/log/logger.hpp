#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "planka/log/log_config.hpp"

namespace planka::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);

private:
    static LogConfig config_;
};

}  // namespace planka::log

#define PLANKA_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define PLANKA_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define PLANKA_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define PLANKA_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define PLANKA_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define PLANKA_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
