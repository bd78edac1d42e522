#include "planka/config/config_store.hpp"

#include <fstream>
#include <system_error>

#include "planka/api/errors.hpp"
#include "planka/config/config.hpp"
#include "planka/log/logger.hpp"

namespace fs = std::filesystem;

namespace planka::config {

ConfigStore::ConfigStore(fs::path config_file)
    : config_file_(std::move(config_file)) {}

fs::path ConfigStore::default_path() { return ConfigPaths::session_file(); }

nlohmann::json ConfigStore::load() const {
    std::error_code ec;
    const bool present = fs::exists(config_file_, ec);
    if (ec) {
        throw IoError(config_file_, "cannot access: " + ec.message());
    }
    if (!present) {
        return nlohmann::json::object();
    }

    std::ifstream ifs(config_file_);
    if (!ifs) {
        throw IoError(config_file_, "cannot open for reading");
    }

    nlohmann::json config;
    try {
        config = nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigCorruptError(config_file_, e.what());
    }

    if (!config.is_object()) {
        throw ConfigCorruptError(config_file_, "expected a JSON object");
    }
    return config;
}

void ConfigStore::save(const nlohmann::json& config) const {
    std::error_code ec;
    const fs::path dir = config_file_.parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            throw IoError(dir, "cannot create directory: " + ec.message());
        }
    }

    // Write next to the target and rename over it so readers never see a
    // half-written file.
    fs::path tmp_file = config_file_;
    tmp_file += ".tmp";

    {
        std::ofstream ofs(tmp_file, std::ios::out | std::ios::trunc);
        if (!ofs) {
            throw IoError(tmp_file, "cannot open for writing");
        }

        // Owner read/write only, before the token is written
        fs::permissions(tmp_file,
                        fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            ofs.close();
            fs::remove(tmp_file, ec);
            throw IoError(tmp_file, "cannot restrict permissions");
        }

        ofs << config.dump(2) << "\n";
        ofs.flush();
        if (!ofs) {
            ofs.close();
            fs::remove(tmp_file, ec);
            throw IoError(tmp_file, "write failed");
        }
    }

    fs::rename(tmp_file, config_file_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_file, ignored);
        throw IoError(config_file_, "cannot replace file: " + ec.message());
    }

    PLANKA_LOG_DEBUG << "Saved config to " << config_file_.string();
}

std::optional<std::string> ConfigStore::get_url() const {
    return get_string(URL_KEY);
}

std::optional<std::string> ConfigStore::get_token() const {
    return get_string(TOKEN_KEY);
}

void ConfigStore::set_url(const std::string& url) const {
    set_string(URL_KEY, url);
}

void ConfigStore::set_token(const std::string& token) const {
    set_string(TOKEN_KEY, token);
}

void ConfigStore::clear() const {
    std::error_code ec;
    if (!fs::remove(config_file_, ec) && ec) {
        throw IoError(config_file_, "cannot remove: " + ec.message());
    }
}

std::optional<std::string> ConfigStore::get_string(const char* key) const {
    const auto config = load();
    auto it = config.find(key);
    if (it == config.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ConfigCorruptError(config_file_,
                                 std::string("'") + key +
                                     "' must be a string");
    }
    return it->get<std::string>();
}

void ConfigStore::set_string(const char* key, const std::string& value) const {
    auto config = load();
    config[key] = value;
    save(config);
}

}  // namespace planka::config
