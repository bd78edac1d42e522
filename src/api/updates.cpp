#include "planka/api/updates.hpp"

namespace planka::api {

using nlohmann::json;

json ProjectUpdate::to_json() const {
    json body = json::object();
    name.write_to(body, "name");
    return body;
}

json BoardUpdate::to_json() const {
    json body = json::object();
    name.write_to(body, "name");
    position.write_to(body, "position");
    return body;
}

json ListUpdate::to_json() const {
    json body = json::object();
    name.write_to(body, "name");
    position.write_to(body, "position");
    return body;
}

json CardCreate::to_json() const {
    json body = json::object();
    description.write_to(body, "description");
    due_date.write_to(body, "dueDate");
    return body;
}

json CardUpdate::to_json() const {
    json body = json::object();
    name.write_to(body, "name");
    description.write_to(body, "description");
    list_id.write_to(body, "listId");
    board_id.write_to(body, "boardId");
    position.write_to(body, "position");
    due_date.write_to(body, "dueDate");
    is_due_date_completed.write_to(body, "isDueDateCompleted");
    cover_attachment_id.write_to(body, "coverAttachmentId");
    return body;
}

json LabelUpdate::to_json() const {
    json body = json::object();
    name.write_to(body, "name");
    color.write_to(body, "color");
    position.write_to(body, "position");
    return body;
}

json TaskListUpdate::to_json() const {
    json body = json::object();
    name.write_to(body, "name");
    position.write_to(body, "position");
    show_on_front_of_card.write_to(body, "showOnFrontOfCard");
    return body;
}

json TaskUpdate::to_json() const {
    json body = json::object();
    name.write_to(body, "name");
    position.write_to(body, "position");
    is_completed.write_to(body, "isCompleted");
    return body;
}

json AttachmentUpdate::to_json() const {
    json body = json::object();
    name.write_to(body, "name");
    return body;
}

json BoardMembershipUpdate::to_json() const {
    json body = json::object();
    role.write_to(body, "role");
    can_comment.write_to(body, "canComment");
    return body;
}

json UserUpdate::to_json() const {
    json body = json::object();
    name.write_to(body, "name");
    username.write_to(body, "username");
    email.write_to(body, "email");
    phone.write_to(body, "phone");
    organization.write_to(body, "organization");
    language.write_to(body, "language");
    return body;
}

json NotificationUpdate::to_json() const {
    json body = json::object();
    is_read.write_to(body, "isRead");
    return body;
}

}  // namespace planka::api
