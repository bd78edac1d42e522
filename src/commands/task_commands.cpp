#include <ostream>

#include "planka/commands/all_commands.hpp"
#include "planka/commands/output.hpp"

namespace planka::commands {

namespace {

int update_task_list(CommandEnvironment& env, cli::CommandContext& ctx) {
    api::TaskListUpdate update;
    if (ctx.is_user_provided("name")) {
        update.name = ctx.get_flag("name");
    }
    if (ctx.is_user_provided("position")) {
        update.position = ctx.get_double_flag("position");
    }
    if (update.to_json().empty()) {
        env.out() << "No updates provided" << std::endl;
        return 0;
    }

    auto client = env.open_client();
    auto task_list = client->update_task_list(ctx.arg(0), update);
    env.out() << "Updated task list: " << field_text(task_list, "name")
              << std::endl;
    return 0;
}

int update_task(CommandEnvironment& env, cli::CommandContext& ctx) {
    api::TaskUpdate update;
    if (ctx.is_user_provided("name")) {
        update.name = ctx.get_flag("name");
    }
    if (ctx.is_user_provided("position")) {
        update.position = ctx.get_double_flag("position");
    }
    if (update.to_json().empty()) {
        env.out() << "No updates provided" << std::endl;
        return 0;
    }

    auto client = env.open_client();
    auto task = client->update_task(ctx.arg(0), update);
    env.out() << "Updated task: " << field_text(task, "name") << std::endl;
    return 0;
}

int complete_task(CommandEnvironment& env, cli::CommandContext& ctx) {
    bool undo = ctx.get_bool_flag("undo");
    api::TaskUpdate update;
    update.is_completed = !undo;

    auto client = env.open_client();
    auto task = client->update_task(ctx.arg(0), update);
    env.out() << "Marked task as " << (undo ? "incomplete" : "complete")
              << ": " << field_text(task, "name") << std::endl;
    return 0;
}

}  // namespace

void register_task_commands(cli::Command& root, CommandEnvironment& env) {
    auto create_list = make_command(
        "tasklist-create", "Create a task list on a card",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            print_entity(env.out(), "Created", "task list",
                         client->create_task_list(
                             ctx.arg(0), ctx.arg(1),
                             ctx.get_double_flag("position")));
            return 0;
        });
    create_list->add_argument("card_id", "Card ID");
    create_list->add_argument("name", "Task list name");
    create_list->add_double_flag_with_short("position", "p", "Position",
                                            DEFAULT_POSITION);
    root.add_command(create_list);

    auto update_list = make_command(
        "tasklist-update", "Update a task list",
        [&env](cli::CommandContext& ctx) {
            return update_task_list(env, ctx);
        });
    update_list->add_argument("tasklist_id", "Task list ID");
    update_list->add_flag_with_short("name", "n", "New task list name");
    update_list->add_double_flag_with_short("position", "p", "New position");
    root.add_command(update_list);

    auto delete_list = make_command(
        "tasklist-delete", "Delete a task list",
        [&env](cli::CommandContext& ctx) {
            if (!env.confirm(
                    ctx, "Are you sure you want to delete this task list?")) {
                return 1;
            }
            auto client = env.open_client();
            client->delete_task_list(ctx.arg(0));
            env.out() << "Task list deleted" << std::endl;
            return 0;
        });
    delete_list->add_argument("tasklist_id", "Task list ID");
    add_yes_flag(*delete_list);
    root.add_command(delete_list);

    auto create = make_command(
        "task-create", "Create a task in a task list",
        [&env](cli::CommandContext& ctx) {
            auto client = env.open_client();
            print_entity(env.out(), "Created", "task",
                         client->create_task(ctx.arg(0), ctx.arg(1),
                                             ctx.get_double_flag("position")));
            return 0;
        });
    create->add_argument("tasklist_id", "Task list ID");
    create->add_argument("name", "Task name");
    create->add_double_flag_with_short("position", "p", "Position",
                                       DEFAULT_POSITION);
    root.add_command(create);

    auto update = make_command(
        "task-update", "Update a task",
        [&env](cli::CommandContext& ctx) { return update_task(env, ctx); });
    update->add_argument("task_id", "Task ID");
    update->add_flag_with_short("name", "n", "New task name");
    update->add_double_flag_with_short("position", "p", "New position");
    root.add_command(update);

    auto complete = make_command(
        "task-complete", "Mark a task as complete",
        [&env](cli::CommandContext& ctx) { return complete_task(env, ctx); });
    complete->add_argument("task_id", "Task ID");
    complete->add_bool_flag("undo", "Mark as incomplete");
    root.add_command(complete);

    auto remove = make_command(
        "task-delete", "Delete a task",
        [&env](cli::CommandContext& ctx) {
            if (!env.confirm(ctx,
                             "Are you sure you want to delete this task?")) {
                return 1;
            }
            auto client = env.open_client();
            client->delete_task(ctx.arg(0));
            env.out() << "Task deleted" << std::endl;
            return 0;
        });
    remove->add_argument("task_id", "Task ID");
    add_yes_flag(*remove);
    root.add_command(remove);
}

}  // namespace planka::commands
