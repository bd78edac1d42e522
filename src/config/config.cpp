#include "planka/config/config.hpp"

#include <pwd.h>
#include <unistd.h>

#include <algorithm>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "planka/log/logger.hpp"

namespace planka::config {

std::filesystem::path ConfigPaths::home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    throw std::runtime_error("Cannot determine the home directory");
}

std::filesystem::path ConfigPaths::config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / APP_DIR_NAME;
    }
    return home_dir() / ".config" / APP_DIR_NAME;
}

ConfigFormat format_from_path(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (ext == ".json") return ConfigFormat::JSON;
    if (ext == ".ini") return ConfigFormat::INI;
    return ConfigFormat::YAML;
}

// Helper to convert YAML::Node to boost::property_tree::ptree
boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child("", yaml_to_ptree(*it));
        }
    } else if (node.IsScalar()) {
        pt.put("", node.as<std::string>());
    }
    return pt;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    PLANKA_LOG_DEBUG << "Loading settings file: " << config_file;

    try {
        switch (format) {
            case ConfigFormat::YAML: {
                YAML::Node yaml_node = YAML::LoadFile(config_file);
                config_tree_ = yaml_to_ptree(yaml_node);
                break;
            }
            case ConfigFormat::JSON: {
                boost::property_tree::read_json(config_file, config_tree_);
                break;
            }
            case ConfigFormat::INI: {
                boost::property_tree::read_ini(config_file, config_tree_);
                break;
            }
        }
        load_component_configs();
    } catch (const std::exception& e) {
        PLANKA_LOG_ERROR << "Failed to load settings file: " << config_file
                         << ", Error: " << e.what();
        throw std::runtime_error("Failed to load settings file: " +
                                 config_file + ", Error: " + e.what());
    }
}

bool ConfigManager::load_optional_config(
    const std::filesystem::path& config_file) {
    std::error_code ec;
    if (!std::filesystem::exists(config_file, ec)) {
        PLANKA_LOG_DEBUG << "No settings file at " << config_file.string()
                         << ", using defaults";
        return false;
    }
    load_config(config_file.string(), format_from_path(config_file));
    return true;
}

void ConfigManager::load_component_configs() {
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();
        auto section = config_tree_.get_child_optional(properties_name);
        if (!section) {
            PLANKA_LOG_DEBUG << "No settings for " << properties_name
                             << ", using defaults";
            continue;
        }
        config->from_ptree(*section);
        config->validate();
        PLANKA_LOG_DEBUG << "Loaded settings for: " << properties_name;
    }
}

}  // namespace planka::config
