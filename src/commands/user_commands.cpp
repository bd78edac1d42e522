#include <ostream>
#include <utility>

#include "planka/cli/table.hpp"
#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

int list_users(CommandEnvironment& env) {
    auto client = env.open_client();
    auto users = client->get_users();

    cli::Table table("Users");
    table.add_column("ID");
    table.add_column("Name");
    table.add_column("Username");
    table.add_column("Email");
    for (const auto& user : users) {
        table.add_row({field_text(user, "id"), field_text(user, "name"),
                       field_text(user, "username"),
                       field_text(user, "email")});
    }
    table.print(env.out());
    return 0;
}

int show_user(CommandEnvironment& env, const std::string& user_id) {
    auto client = env.open_client();
    auto user = client->get_user(user_id);
    auto& out = env.out();

    out << "User: " << field_text(user, "name") << std::endl;
    out << "ID: " << field_text(user, "id") << std::endl;
    for (const auto& [label, key] :
         {std::pair{"Username", "username"}, std::pair{"Email", "email"},
          std::pair{"Organization", "organization"},
          std::pair{"Phone", "phone"}}) {
        if (auto value = field_text(user, key); !value.empty()) {
            out << label << ": " << value << std::endl;
        }
    }
    return 0;
}

}  // namespace

void register_user_commands(cli::Command& root, CommandEnvironment& env) {
    root.add_command(make_command(
        "users", "List all users",
        [&env](cli::CommandContext&) { return list_users(env); }));

    auto show = make_command("user", "Show a user",
                             [&env](cli::CommandContext& ctx) {
                                 return show_user(env, ctx.arg(0));
                             });
    show->add_argument("user_id", "User ID");
    root.add_command(show);
}

}  // namespace planka::commands
