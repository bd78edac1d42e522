#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "planka/api/field.hpp"

namespace planka::api {

// Partial updates: only fields that were assigned end up in the PATCH body.
// to_json() returns an object using the server's camelCase keys.

struct ProjectUpdate {
    Field<std::string> name;

    nlohmann::json to_json() const;
};

struct BoardUpdate {
    Field<std::string> name;
    Field<double> position;

    nlohmann::json to_json() const;
};

struct ListUpdate {
    Field<std::string> name;
    Field<double> position;

    nlohmann::json to_json() const;
};

// Optional extras for card creation
struct CardCreate {
    Field<std::string> description;
    Field<std::string> due_date;

    nlohmann::json to_json() const;
};

struct CardUpdate {
    Field<std::string> name;
    Field<std::string> description;
    Field<std::string> list_id;
    Field<std::string> board_id;
    Field<double> position;
    Field<std::string> due_date;  // ISO 8601
    Field<bool> is_due_date_completed;
    Field<std::string> cover_attachment_id;

    nlohmann::json to_json() const;
};

struct LabelUpdate {
    Field<std::string> name;
    Field<std::string> color;
    Field<double> position;

    nlohmann::json to_json() const;
};

struct TaskListUpdate {
    Field<std::string> name;
    Field<double> position;
    Field<bool> show_on_front_of_card;

    nlohmann::json to_json() const;
};

struct TaskUpdate {
    Field<std::string> name;
    Field<double> position;
    Field<bool> is_completed;

    nlohmann::json to_json() const;
};

struct AttachmentUpdate {
    Field<std::string> name;

    nlohmann::json to_json() const;
};

struct BoardMembershipUpdate {
    Field<std::string> role;  // "editor" or "viewer"
    Field<bool> can_comment;

    nlohmann::json to_json() const;
};

struct UserUpdate {
    Field<std::string> name;
    Field<std::string> username;
    Field<std::string> email;
    Field<std::string> phone;
    Field<std::string> organization;
    Field<std::string> language;

    nlohmann::json to_json() const;
};

struct NotificationUpdate {
    Field<bool> is_read;

    nlohmann::json to_json() const;
};

}  // namespace planka::api
