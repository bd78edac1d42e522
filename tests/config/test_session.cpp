// tests/config/test_session.cpp
#define BOOST_TEST_MODULE SessionTests
#include <boost/test/unit_test.hpp>
#include <cstdlib>
#include <filesystem>

#include "planka/api/errors.hpp"
#include "planka/config/session.hpp"

namespace fs = std::filesystem;
using planka::config::ConfigStore;
using planka::config::resolve_session;

struct SessionFixture {
    const fs::path temp_dir = fs::temp_directory_path() / "planka_test_session";
    ConfigStore store{temp_dir / "config.json"};

    SessionFixture() {
        fs::remove_all(temp_dir);
        unsetenv(planka::config::URL_ENV);
        unsetenv(planka::config::TOKEN_ENV);
    }

    ~SessionFixture() {
        unsetenv(planka::config::URL_ENV);
        unsetenv(planka::config::TOKEN_ENV);
        fs::remove_all(temp_dir);
    }
};

BOOST_FIXTURE_TEST_SUITE(SessionTestSuite, SessionFixture)

BOOST_AUTO_TEST_CASE(test_not_configured) {
    try {
        resolve_session(store);
        BOOST_FAIL("expected NotConfiguredError");
    } catch (const planka::NotConfiguredError& e) {
        BOOST_CHECK_EQUAL(std::string(e.what()),
                          "No Planka URL configured. Run 'planka login' "
                          "first.");
    }
}

BOOST_AUTO_TEST_CASE(test_persisted_values) {
    store.set_url("https://stored.example.com");
    store.set_token("stored-token");

    auto session = resolve_session(store);
    BOOST_CHECK_EQUAL(session.url, "https://stored.example.com");
    BOOST_REQUIRE(session.token);
    BOOST_CHECK_EQUAL(*session.token, "stored-token");
}

BOOST_AUTO_TEST_CASE(test_environment_overrides_without_writing_back) {
    store.set_url("https://stored.example.com");
    store.set_token("stored-token");
    setenv(planka::config::URL_ENV, "https://env.example.com", 1);
    setenv(planka::config::TOKEN_ENV, "env-token", 1);

    auto session = resolve_session(store);
    BOOST_CHECK_EQUAL(session.url, "https://env.example.com");
    BOOST_CHECK_EQUAL(*session.token, "env-token");

    BOOST_CHECK_EQUAL(*store.get_url(), "https://stored.example.com");
    BOOST_CHECK_EQUAL(*store.get_token(), "stored-token");
}

BOOST_AUTO_TEST_CASE(test_environment_url_only) {
    setenv(planka::config::URL_ENV, "https://env.example.com", 1);
    auto session = resolve_session(store);
    BOOST_CHECK_EQUAL(session.url, "https://env.example.com");
    BOOST_CHECK(!session.token);
}

BOOST_AUTO_TEST_CASE(test_empty_environment_is_ignored) {
    store.set_url("https://stored.example.com");
    setenv(planka::config::URL_ENV, "", 1);
    BOOST_CHECK_EQUAL(resolve_session(store).url,
                      "https://stored.example.com");
}

BOOST_AUTO_TEST_SUITE_END()
