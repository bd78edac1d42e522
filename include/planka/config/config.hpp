#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace planka::config {

// Per-user configuration locations
class ConfigPaths {
public:
    static constexpr const char* APP_DIR_NAME = "planka";
    static constexpr const char* SESSION_FILE = "config.json";
    static constexpr const char* SETTINGS_FILE = "settings.yaml";

    // $XDG_CONFIG_HOME/planka, else ~/.config/planka
    static std::filesystem::path config_dir();
    static std::filesystem::path session_file() {
        return config_dir() / SESSION_FILE;
    }
    static std::filesystem::path settings_file() {
        return config_dir() / SETTINGS_FILE;
    }

    static std::filesystem::path home_dir();
};

enum class ConfigFormat { YAML, JSON, INI };

// Picks the format from the file extension, YAML when unknown
ConfigFormat format_from_path(const std::filesystem::path& path);

// Typed view over one section of the settings tree
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;
    virtual std::unique_ptr<ConfigurationProperties> clone() const = 0;

protected:
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }

    template <typename T>
    void load_vector(const boost::property_tree::ptree& pt,
                     const std::string& path, std::vector<T>& vec) {
        vec.clear();
        if (auto child_pt = pt.get_child_optional(path)) {
            for (const auto& v : *child_pt) {
                vec.push_back(v.second.get_value<T>());
            }
        }
    }
};

// CRTP template for providing automatic clone() implementation
template <typename Derived>
class ClonableConfigurationProperties : public ConfigurationProperties {
public:
    std::unique_ptr<ConfigurationProperties> clone() const override {
        return std::make_unique<Derived>(static_cast<const Derived&>(*this));
    }
};

// Loads settings files and binds registered properties to their sections.
// Owned by the application, not a process-wide singleton.
class ConfigManager {
public:
    ConfigManager() = default;

    // Throws std::runtime_error if the file is missing or unparseable
    void load_config(const std::string& config_file,
                     ConfigFormat format = ConfigFormat::YAML);

    // Like load_config, but a missing file keeps the defaults
    bool load_optional_config(const std::filesystem::path& config_file);

    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> config) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        configs_[std::type_index(typeid(T))] = config;
        config_by_name_[config->properties_name()] = config;
    }

    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        auto it = configs_.find(std::type_index(typeid(T)));
        if (it != configs_.end()) {
            return std::static_pointer_cast<T>(it->second);
        }
        return nullptr;
    }

    std::shared_ptr<ConfigurationProperties> get_config_by_name(
        const std::string& name) const {
        auto it = config_by_name_.find(name);
        return (it != config_by_name_.end()) ? it->second : nullptr;
    }

    void reset() {
        configs_.clear();
        config_by_name_.clear();
        config_tree_ = boost::property_tree::ptree();
    }

    const boost::property_tree::ptree& get_config_tree() const {
        return config_tree_;
    }

private:
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        configs_;
    std::unordered_map<std::string, std::shared_ptr<ConfigurationProperties>>
        config_by_name_;
    boost::property_tree::ptree config_tree_;

    void load_component_configs();

    boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);
};

}  // namespace planka::config
