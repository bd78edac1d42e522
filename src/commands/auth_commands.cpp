#include <ostream>

#include "planka/api/errors.hpp"
#include "planka/commands/all_commands.hpp"
#include "planka/config/session.hpp"
#include "planka/log/logger.hpp"

namespace planka::commands {

namespace {

constexpr size_t kTokenPreviewLength = 20;

int login(CommandEnvironment& env, cli::CommandContext& ctx) {
    auto& store = env.store();

    std::string url = ctx.get_flag("url");
    if (url.empty()) {
        auto current = store.get_url();
        url = current ? env.prompter().prompt("Planka URL", *current)
                      : env.prompter().prompt(
                            "Planka URL (e.g. https://planka.example.com)");
    }
    store.set_url(url);

    std::string username = ctx.get_flag("username");
    if (username.empty()) {
        username = env.prompter().prompt("Username/Email");
    }
    std::string password = ctx.get_flag("password");
    if (password.empty()) {
        password = env.prompter().prompt_hidden("Password");
    }

    auto client = env.create_client(url, std::nullopt);
    std::string token = client->login(username, password);
    client->close();

    store.set_token(token);
    env.out() << "Login successful!" << std::endl;
    env.out() << "Config saved to " << store.path().string() << std::endl;
    return 0;
}

int logout(CommandEnvironment& env) {
    try {
        config::Session session = config::resolve_session(env.store());
        if (session.token) {
            auto client = env.create_client(session.url, session.token);
            client->logout();
        }
    } catch (const NotConfiguredError&) {
        PLANKA_LOG_DEBUG << "No server configured, clearing local state only";
    } catch (const PlankaError& e) {
        PLANKA_LOG_WARN << "Server-side logout failed: " << e.what();
    }

    env.store().clear();
    env.out() << "Logged out - credentials cleared" << std::endl;
    return 0;
}

int config_show(CommandEnvironment& env) {
    auto& store = env.store();
    auto& out = env.out();

    out << "Config file: " << store.path().string() << std::endl;
    auto url = store.get_url();
    out << "URL: " << (url ? *url : "not set") << std::endl;
    auto token = store.get_token();
    if (token) {
        out << "Token: " << token->substr(0, kTokenPreviewLength) << "..."
            << std::endl;
    } else {
        out << "Token: not set" << std::endl;
    }
    return 0;
}

}  // namespace

void register_auth_commands(cli::Command& root, CommandEnvironment& env) {
    auto login_cmd = make_command(
        "login", "Login and save credentials",
        [&env](cli::CommandContext& ctx) { return login(env, ctx); });
    login_cmd->add_flag_with_short("url", "s", "Planka server URL");
    login_cmd->add_flag_with_short("username", "u", "Email or username");
    login_cmd->add_flag_with_short("password", "p", "Password");
    login_cmd->set_example(
        "  planka login --url https://planka.example.com -u admin");
    root.add_command(login_cmd);

    root.add_command(make_command(
        "logout", "Invalidate the session and clear saved credentials",
        [&env](cli::CommandContext&) { return logout(env); }));

    root.add_command(make_command(
        "config-show", "Show current configuration",
        [&env](cli::CommandContext&) { return config_show(env); }));

    auto set_url = make_command(
        "config-set-url", "Set the Planka server URL",
        [&env](cli::CommandContext& ctx) {
            env.store().set_url(ctx.arg(0));
            env.out() << "URL set to: " << ctx.arg(0) << std::endl;
            return 0;
        });
    set_url->add_argument("url", "Server URL");
    root.add_command(set_url);

    root.add_command(make_command(
        "server-config", "Show the server's public configuration",
        [&env](cli::CommandContext&) {
            auto client = env.open_client();
            env.out() << client->get_config().dump(2) << std::endl;
            return 0;
        }));
}

}  // namespace planka::commands
