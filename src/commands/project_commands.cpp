#include <ostream>

#include "planka/cli/table.hpp"
#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

int list_projects(CommandEnvironment& env) {
    auto client = env.open_client();
    auto projects = client->get_projects();

    cli::Table table("Projects");
    table.add_column("ID");
    table.add_column("Name");
    for (const auto& project : projects) {
        table.add_row({field_text(project, "id"), field_text(project, "name")});
    }
    table.print(env.out());
    return 0;
}

int show_project(CommandEnvironment& env, const std::string& project_id) {
    auto client = env.open_client();
    auto response = client->get_project(project_id);
    const auto& project = response.value("item", nlohmann::json::object());

    env.out() << "Project: " << field_text(project, "name") << std::endl;
    env.out() << "ID: " << field_text(project, "id") << std::endl;

    nlohmann::json boards;
    if (auto included = response.find("included");
        included != response.end() && included->is_object()) {
        boards = included->value("boards", nlohmann::json::array());
    }
    if (boards.empty()) {
        env.out() << "No boards" << std::endl;
        return 0;
    }

    cli::Table table("Boards");
    table.add_column("ID");
    table.add_column("Name");
    for (const auto& board : boards) {
        table.add_row({field_text(board, "id"), field_text(board, "name")});
    }
    env.out() << std::endl;
    table.print(env.out());
    return 0;
}

int update_project(CommandEnvironment& env, cli::CommandContext& ctx) {
    api::ProjectUpdate update;
    if (ctx.is_user_provided("name")) {
        update.name = ctx.get_flag("name");
    }
    if (!update.name.is_set()) {
        env.out() << "No updates provided" << std::endl;
        return 0;
    }

    auto client = env.open_client();
    auto project = client->update_project(ctx.arg(0), update);
    env.out() << "Updated project: " << field_text(project, "name")
              << std::endl;
    return 0;
}

}  // namespace

void register_project_commands(cli::Command& root, CommandEnvironment& env) {
    root.add_command(make_command(
        "projects", "List all projects",
        [&env](cli::CommandContext&) { return list_projects(env); }));

    auto show = make_command("project", "Show a project and its boards",
                             [&env](cli::CommandContext& ctx) {
                                 return show_project(env, ctx.arg(0));
                             });
    show->add_argument("project_id", "Project ID");
    root.add_command(show);

    auto create = make_command(
        "project-create", "Create a new project",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            print_entity(env.out(), "Created", "project",
                         client->create_project(ctx.arg(0)));
            return 0;
        });
    create->add_argument("name", "Project name");
    root.add_command(create);

    auto update = make_command(
        "project-update", "Update a project",
        [&env](cli::CommandContext& ctx) { return update_project(env, ctx); });
    update->add_argument("project_id", "Project ID");
    update->add_flag_with_short("name", "n", "New project name");
    root.add_command(update);

    auto remove = make_command(
        "project-delete", "Delete a project",
        [&env](cli::CommandContext& ctx) {
            if (!env.confirm(ctx,
                             "Are you sure you want to delete this project?")) {
                return 1;
            }
            auto client = env.open_client();
            client->delete_project(ctx.arg(0));
            env.out() << "Project deleted" << std::endl;
            return 0;
        });
    remove->add_argument("project_id", "Project ID");
    add_yes_flag(*remove);
    root.add_command(remove);
}

}  // namespace planka::commands
