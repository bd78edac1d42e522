// tests/config/test_config_store.cpp
#define BOOST_TEST_MODULE ConfigStoreTests
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "planka/api/errors.hpp"
#include "planka/config/config_store.hpp"

namespace fs = std::filesystem;
using planka::config::ConfigStore;

// Each test case gets its own empty directory
struct StoreFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / "planka_test_config_store";
    const fs::path config_file = temp_dir / "nested" / "config.json";

    StoreFixture() {
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    ~StoreFixture() { fs::remove_all(temp_dir); }

    void write_raw(const std::string& content) {
        fs::create_directories(config_file.parent_path());
        std::ofstream ofs(config_file);
        ofs << content;
    }

    std::string read_raw() const {
        std::ifstream ifs(config_file);
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }
};

BOOST_FIXTURE_TEST_SUITE(ConfigStoreTestSuite, StoreFixture)

BOOST_AUTO_TEST_CASE(test_missing_file_loads_empty) {
    ConfigStore store(config_file);
    BOOST_CHECK(store.load() == nlohmann::json::object());
    BOOST_CHECK(!store.get_url());
    BOOST_CHECK(!store.get_token());
}

BOOST_AUTO_TEST_CASE(test_unreadable_location_raises) {
    // A path component longer than NAME_MAX fails the existence check itself
    ConfigStore store(temp_dir / std::string(300, 'x') / "config.json");
    BOOST_CHECK_THROW(store.load(), planka::IoError);
    BOOST_CHECK_THROW(store.get_url(), planka::IoError);
}

BOOST_AUTO_TEST_CASE(test_round_trip) {
    ConfigStore store(config_file);
    store.set_url("https://planka.example.com");
    store.set_token("abc");

    BOOST_CHECK(fs::exists(config_file));
    BOOST_CHECK_EQUAL(*store.get_url(), "https://planka.example.com");
    BOOST_CHECK_EQUAL(*store.get_token(), "abc");

    // A second store on the same file sees the same values
    ConfigStore other(config_file);
    BOOST_CHECK_EQUAL(*other.get_token(), "abc");
}

BOOST_AUTO_TEST_CASE(test_file_is_pretty_printed_json) {
    ConfigStore store(config_file);
    store.set_url("https://planka.example.com");

    std::string raw = read_raw();
    BOOST_CHECK(raw.find("\n  \"url\": \"https://planka.example.com\"") !=
                std::string::npos);
    BOOST_CHECK_EQUAL(raw.back(), '\n');
}

BOOST_AUTO_TEST_CASE(test_owner_only_permissions) {
    ConfigStore store(config_file);
    store.set_token("secret");

    auto perms = fs::status(config_file).permissions();
    BOOST_CHECK((perms & fs::perms::owner_read) != fs::perms::none);
    BOOST_CHECK((perms & fs::perms::owner_write) != fs::perms::none);
    BOOST_CHECK((perms & (fs::perms::group_all | fs::perms::others_all)) ==
                fs::perms::none);

    fs::path tmp_file = config_file;
    tmp_file += ".tmp";
    BOOST_CHECK(!fs::exists(tmp_file));
}

BOOST_AUTO_TEST_CASE(test_unknown_keys_preserved) {
    write_raw(R"({"url": "http://old", "theme": "dark"})");

    ConfigStore store(config_file);
    store.set_url("http://new");

    auto config = store.load();
    BOOST_CHECK_EQUAL(config["url"].get<std::string>(), "http://new");
    BOOST_CHECK_EQUAL(config["theme"].get<std::string>(), "dark");
}

BOOST_AUTO_TEST_CASE(test_corrupt_file_raises) {
    write_raw("{not json");

    ConfigStore store(config_file);
    BOOST_CHECK_THROW(store.load(), planka::ConfigCorruptError);
    BOOST_CHECK_THROW(store.set_url("http://x"), planka::ConfigCorruptError);

    // Never silently reset
    BOOST_CHECK_EQUAL(read_raw(), "{not json");
}

BOOST_AUTO_TEST_CASE(test_non_object_raises) {
    write_raw("[1, 2, 3]");
    ConfigStore store(config_file);
    BOOST_CHECK_THROW(store.load(), planka::ConfigCorruptError);
}

BOOST_AUTO_TEST_CASE(test_wrong_type_raises) {
    write_raw(R"({"token": 42})");
    ConfigStore store(config_file);
    BOOST_CHECK_THROW(store.get_token(), planka::ConfigCorruptError);
}

BOOST_AUTO_TEST_CASE(test_null_value_is_absent) {
    write_raw(R"({"token": null})");
    ConfigStore store(config_file);
    BOOST_CHECK(!store.get_token());
}

BOOST_AUTO_TEST_CASE(test_clear) {
    ConfigStore store(config_file);
    store.set_token("abc");
    store.clear();

    BOOST_CHECK(!fs::exists(config_file));
    BOOST_CHECK(!store.get_token());

    // No-op when already gone
    BOOST_CHECK_NO_THROW(store.clear());
}

BOOST_AUTO_TEST_CASE(test_path_accessor) {
    ConfigStore store(config_file);
    BOOST_CHECK(store.path() == config_file);
}

BOOST_AUTO_TEST_SUITE_END()
