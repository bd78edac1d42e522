#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace planka::config {

/// @brief Persists the session (server url and bearer token) as a JSON
/// object in a single owner-only file.
///
/// Every setter performs a full load-merge-save cycle; concurrent writers
/// are not coordinated and the last one wins. Keys other than "url" and
/// "token" found in the file are preserved.
class ConfigStore {
public:
    static constexpr const char* URL_KEY = "url";
    static constexpr const char* TOKEN_KEY = "token";

    explicit ConfigStore(std::filesystem::path config_file);

    /// @brief The default per-user location, ~/.config/planka/config.json.
    static std::filesystem::path default_path();

    /// @brief Reads the persisted object.
    /// @return An empty object if the file does not exist.
    /// @throws ConfigCorruptError if the file is not a JSON object.
    nlohmann::json load() const;

    /// @brief Writes the whole object, replacing the file atomically and
    /// restricting it to owner read/write.
    /// @throws IoError if the directory or file cannot be written.
    void save(const nlohmann::json& config) const;

    std::optional<std::string> get_url() const;
    std::optional<std::string> get_token() const;
    void set_url(const std::string& url) const;
    void set_token(const std::string& token) const;

    /// @brief Deletes the file; does nothing if it does not exist.
    void clear() const;

    const std::filesystem::path& path() const { return config_file_; }

private:
    std::optional<std::string> get_string(const char* key) const;
    void set_string(const char* key, const std::string& value) const;

    std::filesystem::path config_file_;
};

}  // namespace planka::config
