// tests/commands/test_commands.cpp
#define BOOST_TEST_MODULE CommandsTests
#include <boost/test/unit_test.hpp>
#include <boost/log/core.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "planka/api/planka_client.hpp"
#include "planka/cli/prompter.hpp"
#include "planka/cli/root_command.hpp"
#include "planka/commands/command_environment.hpp"
#include "planka/config/config_store.hpp"
#include "planka/config/session.hpp"
#include "planka/log/logger.hpp"
#include "support/scripted_transport.hpp"

namespace fs = std::filesystem;
using nlohmann::json;
using planka::testing::respond;
using planka::testing::ScriptedTransport;

// Runs the full command tree against a scripted server, with session and
// settings files in a scratch directory.
struct CliFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / "planka_test_commands";

    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    planka::cli::Prompter prompter{in, out};
    planka::config::ConfigStore store{temp_dir / "planka" / "config.json"};
    planka::commands::CommandEnvironment env{store, out, err, prompter};

    std::shared_ptr<ScriptedTransport::Log> log =
        std::make_shared<ScriptedTransport::Log>();
    std::deque<planka::http::HttpResponse> responses;
    std::vector<std::string> client_urls;

    CliFixture() {
        fs::remove_all(temp_dir);
        setenv("XDG_CONFIG_HOME", temp_dir.c_str(), 1);
        unsetenv(planka::config::URL_ENV);
        unsetenv(planka::config::TOKEN_ENV);
        unsetenv(planka::cli::LOG_LEVEL_ENV);

        env.set_client_factory(
            [this](const std::string& url,
                   const std::optional<std::string>& token) {
                client_urls.push_back(url);
                return std::make_unique<planka::api::PlankaClient>(
                    url, token,
                    std::make_unique<ScriptedTransport>(log,
                                                        std::move(responses)));
            });
    }

    ~CliFixture() {
        unsetenv("XDG_CONFIG_HOME");
        unsetenv(planka::cli::LOG_LEVEL_ENV);
        fs::remove_all(temp_dir);
    }

    void logged_in() {
        store.set_url("http://planka.test");
        store.set_token("tok-123");
    }

    int run(const std::vector<std::string>& args,
            const std::string& input = "") {
        in.str(input);
        in.clear();
        auto root = planka::cli::RootCommand::create(env);
        root->set_output(out);
        root->set_error_output(err);
        return root->execute(args);
    }

    const planka::http::HttpRequest& last() const {
        BOOST_REQUIRE(!log->requests.empty());
        return log->requests.back();
    }

    json last_body() const { return json::parse(last().body); }
};

BOOST_FIXTURE_TEST_SUITE(CommandsTestSuite, CliFixture)

BOOST_AUTO_TEST_CASE(test_login_with_flags) {
    responses.push_back(respond(200, R"({"item": "new-token"})"));

    int rc = run({"login", "-s", "http://planka.test", "-u", "admin", "-p",
                  "secret"});
    BOOST_CHECK_EQUAL(rc, 0);
    BOOST_CHECK_EQUAL(*store.get_url(), "http://planka.test");
    BOOST_CHECK_EQUAL(*store.get_token(), "new-token");

    BOOST_CHECK_EQUAL(last().target, "/api/access-tokens");
    BOOST_CHECK_EQUAL(last().headers.count("Authorization"), 0u);
    BOOST_CHECK_EQUAL(last_body()["emailOrUsername"], "admin");
    BOOST_CHECK_EQUAL(last_body()["password"], "secret");

    BOOST_CHECK(out.str().find("Login successful!") != std::string::npos);
    BOOST_CHECK(out.str().find("Config saved to " + store.path().string()) !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_login_prompts) {
    responses.push_back(respond(200, R"({"item": "t"})"));

    int rc = run({"login"}, "http://planka.test\nadmin\nsecret\n");
    BOOST_CHECK_EQUAL(rc, 0);
    BOOST_CHECK(out.str().find("Planka URL (e.g. https://planka.example.com): "
                               "Username/Email: Password: ") !=
                std::string::npos);
    BOOST_CHECK_EQUAL(last_body()["password"], "secret");
    BOOST_CHECK_EQUAL(*store.get_token(), "t");
}

BOOST_AUTO_TEST_CASE(test_login_rejected_keeps_url) {
    responses.push_back(respond(401, R"({"code":"E_UNAUTHORIZED"})"));

    int rc = run({"login", "-s", "http://planka.test", "-u", "a", "-p", "b"});
    BOOST_CHECK_EQUAL(rc, 1);
    BOOST_CHECK(err.str().find("Error: Authentication failed") !=
                std::string::npos);
    BOOST_CHECK_EQUAL(*store.get_url(), "http://planka.test");
    BOOST_CHECK(!store.get_token());
}

BOOST_AUTO_TEST_CASE(test_config_show) {
    store.set_url("http://planka.test");
    store.set_token("abcdefghijklmnopqrstuvwxyz");

    BOOST_CHECK_EQUAL(run({"config-show"}), 0);
    BOOST_CHECK(out.str().find("URL: http://planka.test\n") !=
                std::string::npos);
    BOOST_CHECK(out.str().find("Token: abcdefghijklmnopqrst...\n") !=
                std::string::npos);
    BOOST_CHECK(log->requests.empty());
}

BOOST_AUTO_TEST_CASE(test_config_show_empty) {
    BOOST_CHECK_EQUAL(run({"config-show"}), 0);
    BOOST_CHECK(out.str().find("URL: not set\n") != std::string::npos);
    BOOST_CHECK(out.str().find("Token: not set\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_config_set_url) {
    BOOST_CHECK_EQUAL(run({"config-set-url", "http://other"}), 0);
    BOOST_CHECK_EQUAL(*store.get_url(), "http://other");
    BOOST_CHECK(out.str().find("URL set to: http://other") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_logout_clears_store) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"logout"}), 0);
    BOOST_CHECK_EQUAL(last().method, "DELETE");
    BOOST_CHECK_EQUAL(last().target, "/api/access-tokens/me");
    BOOST_CHECK(!fs::exists(store.path()));
    BOOST_CHECK(out.str().find("Logged out - credentials cleared") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_logout_survives_server_error) {
    logged_in();
    responses.push_back(respond(500, "boom"));
    BOOST_CHECK_EQUAL(run({"logout"}), 0);
    BOOST_CHECK(!store.get_token());
}

BOOST_AUTO_TEST_CASE(test_requires_configured_url) {
    BOOST_CHECK_EQUAL(run({"projects"}), 1);
    BOOST_CHECK_EQUAL(err.str(),
                      "Error: No Planka URL configured. Run 'planka login' "
                      "first.\n");
    BOOST_CHECK(log->requests.empty());
}

BOOST_AUTO_TEST_CASE(test_environment_session) {
    setenv(planka::config::URL_ENV, "http://env.test", 1);
    setenv(planka::config::TOKEN_ENV, "env-token", 1);
    responses.push_back(respond(200, R"({"items": []})"));

    BOOST_CHECK_EQUAL(run({"projects"}), 0);
    BOOST_REQUIRE_EQUAL(client_urls.size(), 1u);
    BOOST_CHECK_EQUAL(client_urls.front(), "http://env.test");
    BOOST_CHECK_EQUAL(last().headers.at("Authorization"), "Bearer env-token");
    BOOST_CHECK(!fs::exists(store.path()));

    unsetenv(planka::config::URL_ENV);
    unsetenv(planka::config::TOKEN_ENV);
}

BOOST_AUTO_TEST_CASE(test_projects_table) {
    logged_in();
    responses.push_back(respond(
        200, R"({"items": [{"id": "1", "name": "Alpha"},
                           {"id": "22", "name": "Beta"}]})"));

    BOOST_CHECK_EQUAL(run({"projects"}), 0);
    BOOST_CHECK_EQUAL(last().target, "/api/projects");
    BOOST_CHECK(out.str().find("Projects\n"
                               "ID  Name\n"
                               "--  -----\n"
                               "1   Alpha\n"
                               "22  Beta\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_project_without_boards) {
    logged_in();
    responses.push_back(
        respond(200, R"({"item": {"id": "1", "name": "Alpha"},
                         "included": {"boards": []}})"));

    BOOST_CHECK_EQUAL(run({"project", "1"}), 0);
    BOOST_CHECK(out.str().find("Project: Alpha\nID: 1\nNo boards\n") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_board_grouped_by_list) {
    logged_in();
    responses.push_back(respond(200, R"({
        "item": {"id": "b1", "name": "Board"},
        "included": {
            "lists": [{"id": "L2", "name": "Done", "position": 2},
                      {"id": "L1", "name": "Todo", "position": 1}],
            "cards": [{"id": "c1", "name": "Write tests", "listId": "L1"},
                      {"id": "c2", "name": "Orphan", "listId": "L9"}]
        }
    })"));

    BOOST_CHECK_EQUAL(run({"board", "b1"}), 0);
    const std::string text = out.str();
    auto todo = text.find("Todo (1 cards)");
    auto done = text.find("Done (0 cards)");
    BOOST_REQUIRE(todo != std::string::npos);
    BOOST_REQUIRE(done != std::string::npos);
    BOOST_CHECK(todo < done);
    BOOST_CHECK(text.find("Write tests") != std::string::npos);
    BOOST_CHECK(text.find("Orphan") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_card_create_body) {
    logged_in();
    responses.push_back(
        respond(200, R"({"item": {"id": "c9", "name": "Fix login"}})"));

    int rc = run({"card-create", "L1", "Fix login", "-d", "500 on submit",
                  "--due-date", "2026-11-01T00:00:00Z"});
    BOOST_CHECK_EQUAL(rc, 0);
    BOOST_CHECK_EQUAL(last().method, "POST");
    BOOST_CHECK_EQUAL(last().target, "/api/lists/L1/cards");
    BOOST_CHECK_EQUAL(last().headers.at("Authorization"), "Bearer tok-123");

    json body = last_body();
    BOOST_CHECK_EQUAL(body["name"], "Fix login");
    BOOST_CHECK_EQUAL(body["position"].get<double>(), 65535.0);
    BOOST_CHECK_EQUAL(body["description"], "500 on submit");
    BOOST_CHECK_EQUAL(body["dueDate"], "2026-11-01T00:00:00Z");
    BOOST_CHECK_EQUAL(out.str(), "Created card: Fix login (ID: c9)\n");
}

BOOST_AUTO_TEST_CASE(test_card_create_minimal_body) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"card-create", "L1", "Plain", "-p", "10"}), 0);

    json body = last_body();
    BOOST_CHECK_EQUAL(body["position"].get<double>(), 10.0);
    BOOST_CHECK(!body.contains("description"));
    BOOST_CHECK(!body.contains("dueDate"));
}

BOOST_AUTO_TEST_CASE(test_card_update_sends_only_given_fields) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"card-update", "c1", "-n", "Renamed",
                           "--clear-due-date"}),
                      0);
    BOOST_CHECK_EQUAL(last().method, "PATCH");
    BOOST_CHECK_EQUAL(last().target, "/api/cards/c1");
    BOOST_CHECK_EQUAL(last_body(), json::parse(R"({"name": "Renamed",
                                                   "dueDate": null})"));
}

BOOST_AUTO_TEST_CASE(test_update_without_fields) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"card-update", "c1"}), 0);
    BOOST_CHECK_EQUAL(out.str(), "No updates provided\n");
    BOOST_CHECK(log->requests.empty());
}

BOOST_AUTO_TEST_CASE(test_card_update_conflicting_due_flags) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"card-update", "c1", "--due-date", "2026-01-01",
                           "--clear-due-date"}),
                      1);
    BOOST_CHECK(log->requests.empty());
}

BOOST_AUTO_TEST_CASE(test_card_move) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"card-move", "c1", "L2"}), 0);
    BOOST_CHECK_EQUAL(last().target, "/api/cards/c1");
    BOOST_CHECK_EQUAL(last_body()["listId"], "L2");
    BOOST_CHECK_EQUAL(last_body()["position"].get<double>(), 65535.0);
}

BOOST_AUTO_TEST_CASE(test_delete_declined) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"card-delete", "c1"}, "n\n"), 1);
    BOOST_CHECK(out.str().find(
                    "Are you sure you want to delete this card? [y/N]: ") !=
                std::string::npos);
    BOOST_CHECK_EQUAL(err.str(), "Aborted!\n");
    BOOST_CHECK(log->requests.empty());
}

BOOST_AUTO_TEST_CASE(test_delete_confirmed) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"card-delete", "c1"}, "y\n"), 0);
    BOOST_CHECK_EQUAL(last().method, "DELETE");
    BOOST_CHECK_EQUAL(last().target, "/api/cards/c1");
    BOOST_CHECK(out.str().find("Card deleted\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_delete_with_yes_flag) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"project-delete", "p1", "--yes"}), 0);
    BOOST_CHECK_EQUAL(last().target, "/api/projects/p1");
    BOOST_CHECK(out.str().find("[y/N]") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_api_error_is_reported) {
    logged_in();
    responses.push_back(respond(404, R"({"code":"E_NOT_FOUND"})"));

    BOOST_CHECK_EQUAL(run({"card", "missing"}), 1);
    BOOST_CHECK_EQUAL(err.str(), "Error: HTTP 404: {\"code\":\"E_NOT_FOUND\"}\n");
}

BOOST_AUTO_TEST_CASE(test_comments_listing) {
    logged_in();
    responses.push_back(
        respond(200, R"({"items": [{"id": "m1", "text": "Looks good"}]})"));

    BOOST_CHECK_EQUAL(run({"comments", "c1"}), 0);
    BOOST_CHECK(out.str().find("m1: Looks good") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_activity_negative_limit) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"activity", "b1", "--limit", "-1"}), 1);
    BOOST_CHECK(log->requests.empty());
}

BOOST_AUTO_TEST_CASE(test_board_member_role_validated) {
    logged_in();
    BOOST_CHECK_EQUAL(run({"board-member-add", "b1", "u1", "-r", "owner"}), 1);
    BOOST_CHECK(log->requests.empty());

    BOOST_CHECK_EQUAL(run({"board-member-add", "b1", "u1", "-r", "viewer"}), 0);
    BOOST_CHECK_EQUAL(last().target, "/api/boards/b1/board-memberships");
    BOOST_CHECK_EQUAL(last_body()["role"], "viewer");
}

BOOST_AUTO_TEST_CASE(test_attachment_upload) {
    logged_in();
    const fs::path file = temp_dir / "notes.txt";
    fs::create_directories(temp_dir);
    {
        std::ofstream ofs(file, std::ios::binary);
        ofs << "hello";
    }
    responses.push_back(
        respond(200, R"({"item": {"id": "a1", "name": "notes.txt"}})"));

    BOOST_CHECK_EQUAL(run({"attachment-upload", "c1", file.string()}), 0);
    BOOST_CHECK_EQUAL(last().target, "/api/cards/c1/attachments");
    BOOST_CHECK(last().headers.at("Content-Type").rfind(
                    "multipart/form-data; boundary=", 0) == 0);
    BOOST_CHECK(last().body.find("hello") != std::string::npos);
    BOOST_CHECK(out.str().find("Uploaded attachment: notes.txt (ID: a1)") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_version_flag) {
    BOOST_CHECK_EQUAL(run({"--version"}), 0);
    BOOST_CHECK(out.str().find("0.3.0") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_settings_file_flag) {
    const fs::path settings = temp_dir / "custom.yaml";
    fs::create_directories(temp_dir);
    {
        std::ofstream ofs(settings);
        ofs << "client:\n  timeout_seconds: 7\n";
    }

    BOOST_CHECK_EQUAL(run({"--settings", settings.string(), "config-show"}), 0);
    BOOST_CHECK_EQUAL(env.client_config().timeout_seconds, 7);
}

BOOST_AUTO_TEST_CASE(test_broken_settings_file) {
    const fs::path settings = temp_dir / "planka" / "settings.yaml";
    fs::create_directories(settings.parent_path());
    {
        std::ofstream ofs(settings);
        ofs << "client:\n  timeout_seconds: -5\n";
    }

    BOOST_CHECK_EQUAL(run({"config-show"}), 1);
    BOOST_CHECK(err.str().find("Failed to load settings file") !=
                std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_read_all_accepts_bare_acknowledgement) {
    logged_in();
    responses.push_back(respond(200, "{}"));

    BOOST_CHECK_EQUAL(run({"notifications-read-all"}), 0);
    BOOST_CHECK_EQUAL(last().method, "POST");
    BOOST_CHECK_EQUAL(last().target, "/api/notifications/read-all");
    BOOST_CHECK_EQUAL(out.str(), "All notifications marked as read\n");
    BOOST_CHECK(err.str().empty());
}

BOOST_AUTO_TEST_CASE(test_log_level_from_environment) {
    setenv(planka::cli::LOG_LEVEL_ENV, "error", 1);
    BOOST_CHECK_EQUAL(run({"config-show"}), 0);

    std::ostringstream captured;
    auto sink = boost::log::add_console_log(captured);
    PLANKA_LOG_WARN << "filtered warning";
    PLANKA_LOG_ERROR << "kept error";
    sink->flush();
    boost::log::core::get()->remove_sink(sink);

    BOOST_CHECK(captured.str().find("filtered warning") == std::string::npos);
    BOOST_CHECK(captured.str().find("kept error") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(test_unknown_log_level_is_ignored) {
    setenv(planka::cli::LOG_LEVEL_ENV, "chatty", 1);
    BOOST_CHECK_EQUAL(run({"config-show"}), 0);
    BOOST_CHECK(out.str().find("URL: not set") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
