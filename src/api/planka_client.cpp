#include "planka/api/planka_client.hpp"

#include <fstream>
#include <iterator>

#include "planka/api/errors.hpp"
#include "planka/http/multipart.hpp"
#include "planka/log/logger.hpp"

namespace planka::api {

using nlohmann::json;

namespace {

std::string strip_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

}  // namespace

PlankaClient::PlankaClient(std::string base_url,
                           std::optional<std::string> token,
                           std::unique_ptr<http::IHttpTransport> transport)
    : base_url_(strip_trailing_slashes(std::move(base_url))),
      token_(std::move(token)),
      transport_(std::move(transport)) {}

PlankaClient::~PlankaClient() { close(); }

void PlankaClient::close() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

http::IHttpTransport& PlankaClient::transport() {
    if (!transport_) {
        throw PlankaError("Client is closed");
    }
    return *transport_;
}

http::HttpResponse PlankaClient::send(http::HttpRequest request,
                                      bool authorize) {
    if (request.headers.find("Content-Type") == request.headers.end()) {
        request.headers["Content-Type"] = "application/json";
    }
    if (authorize && token_) {
        request.headers["Authorization"] = "Bearer " + *token_;
    }

    http::HttpResponse response = transport().send(request);
    PLANKA_LOG_DEBUG << request.method << " " << request.target << " -> "
                     << response.status_code;
    return response;
}

void PlankaClient::check_status(const http::HttpResponse& response) {
    if (response.ok()) {
        return;
    }
    if (response.status_code == 401 || response.status_code == 403) {
        throw AuthError(response.status_code, response.body);
    }
    throw ApiError(response.status_code, response.body);
}

json PlankaClient::parse_body(const http::HttpResponse& response) {
    if (response.body.empty()) {
        return nullptr;
    }
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw ApiError(response.status_code, response.body,
                       std::string("Invalid JSON in response: ") + e.what());
    }
}

json PlankaClient::unwrap(const http::HttpResponse& response,
                          const char* key) {
    json parsed = parse_body(response);
    if (!parsed.is_object() || !parsed.contains(key)) {
        throw ApiError(response.status_code, response.body,
                       std::string("Response has no '") + key + "' field");
    }
    return parsed[key];
}

http::HttpResponse PlankaClient::call(const std::string& method,
                                      const std::string& path,
                                      const std::optional<json>& body) {
    http::HttpRequest request;
    request.method = method;
    request.target = path;
    if (body) {
        request.body = body->dump();
    }

    http::HttpResponse response = send(std::move(request), true);
    check_status(response);
    return response;
}

json PlankaClient::request(const std::string& method, const std::string& path,
                           const std::optional<json>& body) {
    return parse_body(call(method, path, body));
}

json PlankaClient::request_item(const std::string& method,
                                const std::string& path,
                                const std::optional<json>& body) {
    return unwrap(call(method, path, body), "item");
}

json PlankaClient::request_items(const std::string& method,
                                 const std::string& path,
                                 const std::optional<json>& body) {
    return unwrap(call(method, path, body), "items");
}

// Authentication

std::string PlankaClient::login(const std::string& email_or_username,
                                const std::string& password) {
    http::HttpRequest request;
    request.method = "POST";
    request.target = "/api/access-tokens";
    request.body =
        json{{"emailOrUsername", email_or_username}, {"password", password}}
            .dump();

    http::HttpResponse response = send(std::move(request), false);
    if (!response.ok()) {
        throw AuthError(response.status_code, response.body);
    }

    json token = unwrap(response, "item");
    if (!token.is_string()) {
        throw ApiError(response.status_code, response.body,
                       "Access token is not a string");
    }
    token_ = token.get<std::string>();
    return *token_;
}

json PlankaClient::logout() {
    return request_item("DELETE", "/api/access-tokens/me");
}

// Projects

json PlankaClient::get_projects() {
    return request_items("GET", "/api/projects");
}

json PlankaClient::get_project(const std::string& project_id) {
    return request("GET", "/api/projects/" + project_id);
}

json PlankaClient::create_project(const std::string& name) {
    return request_item("POST", "/api/projects", json{{"name", name}});
}

json PlankaClient::update_project(const std::string& project_id,
                                  const ProjectUpdate& update) {
    return request_item("PATCH", "/api/projects/" + project_id,
                        update.to_json());
}

json PlankaClient::delete_project(const std::string& project_id) {
    return request_item("DELETE", "/api/projects/" + project_id);
}

// Boards

json PlankaClient::create_board(const std::string& project_id,
                                const std::string& name, double position) {
    return request_item("POST", "/api/projects/" + project_id + "/boards",
                        json{{"name", name}, {"position", position}});
}

json PlankaClient::get_board(const std::string& board_id) {
    return request("GET", "/api/boards/" + board_id);
}

json PlankaClient::update_board(const std::string& board_id,
                                const BoardUpdate& update) {
    return request_item("PATCH", "/api/boards/" + board_id, update.to_json());
}

json PlankaClient::delete_board(const std::string& board_id) {
    return request_item("DELETE", "/api/boards/" + board_id);
}

// Lists

json PlankaClient::create_list(const std::string& board_id,
                               const std::string& name, double position) {
    return request_item("POST", "/api/boards/" + board_id + "/lists",
                        json{{"name", name}, {"position", position}});
}

json PlankaClient::get_list(const std::string& list_id) {
    return request("GET", "/api/lists/" + list_id);
}

json PlankaClient::update_list(const std::string& list_id,
                               const ListUpdate& update) {
    return request_item("PATCH", "/api/lists/" + list_id, update.to_json());
}

json PlankaClient::delete_list(const std::string& list_id) {
    return request_item("DELETE", "/api/lists/" + list_id);
}

json PlankaClient::sort_list(const std::string& list_id) {
    return request("POST", "/api/lists/" + list_id + "/sort",
                   json::object());
}

// Cards

json PlankaClient::create_card(const std::string& list_id,
                               const std::string& name, double position,
                               const CardCreate& extras) {
    json body = extras.to_json();
    body["name"] = name;
    body["position"] = position;
    return request_item("POST", "/api/lists/" + list_id + "/cards", body);
}

json PlankaClient::get_cards(const std::string& list_id) {
    return request_items("GET", "/api/lists/" + list_id + "/cards");
}

json PlankaClient::get_card(const std::string& card_id) {
    return request_item("GET", "/api/cards/" + card_id);
}

json PlankaClient::update_card(const std::string& card_id,
                               const CardUpdate& update) {
    return request_item("PATCH", "/api/cards/" + card_id, update.to_json());
}

json PlankaClient::delete_card(const std::string& card_id) {
    return request_item("DELETE", "/api/cards/" + card_id);
}

json PlankaClient::duplicate_card(const std::string& card_id,
                                  double position) {
    return request_item("POST", "/api/cards/" + card_id + "/duplicate",
                        json{{"position", position}});
}

json PlankaClient::move_card(const std::string& card_id,
                             const std::string& list_id, double position) {
    CardUpdate update;
    update.list_id = list_id;
    update.position = position;
    return update_card(card_id, update);
}

// Labels

json PlankaClient::create_label(const std::string& board_id,
                                const std::string& name,
                                const std::string& color, double position) {
    return request_item(
        "POST", "/api/boards/" + board_id + "/labels",
        json{{"name", name}, {"color", color}, {"position", position}});
}

json PlankaClient::update_label(const std::string& label_id,
                                const LabelUpdate& update) {
    return request_item("PATCH", "/api/labels/" + label_id, update.to_json());
}

json PlankaClient::delete_label(const std::string& label_id) {
    return request_item("DELETE", "/api/labels/" + label_id);
}

json PlankaClient::add_label_to_card(const std::string& card_id,
                                     const std::string& label_id) {
    return request_item("POST", "/api/cards/" + card_id + "/card-labels",
                        json{{"labelId", label_id}});
}

json PlankaClient::remove_label_from_card(const std::string& card_id,
                                          const std::string& label_id) {
    return request_item(
        "DELETE", "/api/cards/" + card_id + "/card-labels/labelId:" + label_id);
}

// Task lists and tasks

json PlankaClient::create_task_list(const std::string& card_id,
                                    const std::string& name,
                                    double position) {
    return request_item("POST", "/api/cards/" + card_id + "/task-lists",
                        json{{"name", name}, {"position", position}});
}

json PlankaClient::get_task_list(const std::string& task_list_id) {
    return request("GET", "/api/task-lists/" + task_list_id);
}

json PlankaClient::update_task_list(const std::string& task_list_id,
                                    const TaskListUpdate& update) {
    return request_item("PATCH", "/api/task-lists/" + task_list_id,
                        update.to_json());
}

json PlankaClient::delete_task_list(const std::string& task_list_id) {
    return request_item("DELETE", "/api/task-lists/" + task_list_id);
}

json PlankaClient::create_task(const std::string& task_list_id,
                               const std::string& name, double position) {
    return request_item("POST", "/api/task-lists/" + task_list_id + "/tasks",
                        json{{"name", name}, {"position", position}});
}

json PlankaClient::update_task(const std::string& task_id,
                               const TaskUpdate& update) {
    return request_item("PATCH", "/api/tasks/" + task_id, update.to_json());
}

json PlankaClient::delete_task(const std::string& task_id) {
    return request_item("DELETE", "/api/tasks/" + task_id);
}

// Comments

json PlankaClient::create_comment(const std::string& card_id,
                                  const std::string& text) {
    return request_item("POST", "/api/cards/" + card_id + "/comments",
                        json{{"text", text}});
}

json PlankaClient::get_comments(const std::string& card_id) {
    return request_items("GET", "/api/cards/" + card_id + "/comments");
}

json PlankaClient::update_comment(const std::string& comment_id,
                                  const std::string& text) {
    return request_item("PATCH", "/api/comments/" + comment_id,
                        json{{"text", text}});
}

json PlankaClient::delete_comment(const std::string& comment_id) {
    return request_item("DELETE", "/api/comments/" + comment_id);
}

// Attachments

json PlankaClient::create_attachment(const std::string& card_id,
                                     const std::filesystem::path& file) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) {
        throw IoError(file, "cannot open for reading");
    }
    std::string content((std::istreambuf_iterator<char>(ifs)),
                        std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        throw IoError(file, "read failed");
    }

    http::MultipartFormData form;
    form.add_file("file", file.filename().string(), content);

    http::HttpRequest request;
    request.method = "POST";
    request.target = "/api/cards/" + card_id + "/attachments";
    request.headers["Content-Type"] = form.content_type();
    request.body = form.body();

    http::HttpResponse response = send(std::move(request), true);
    check_status(response);
    return unwrap(response, "item");
}

json PlankaClient::update_attachment(const std::string& attachment_id,
                                     const AttachmentUpdate& update) {
    return request_item("PATCH", "/api/attachments/" + attachment_id,
                        update.to_json());
}

json PlankaClient::delete_attachment(const std::string& attachment_id) {
    return request_item("DELETE", "/api/attachments/" + attachment_id);
}

// Memberships

json PlankaClient::add_member_to_card(const std::string& card_id,
                                      const std::string& user_id) {
    return request_item("POST", "/api/cards/" + card_id + "/card-memberships",
                        json{{"userId", user_id}});
}

json PlankaClient::remove_member_from_card(const std::string& card_id,
                                           const std::string& user_id) {
    return request_item("DELETE", "/api/cards/" + card_id +
                                      "/card-memberships/userId:" + user_id);
}

json PlankaClient::add_member_to_board(const std::string& board_id,
                                       const std::string& user_id,
                                       const std::string& role) {
    return request_item("POST",
                        "/api/boards/" + board_id + "/board-memberships",
                        json{{"userId", user_id}, {"role", role}});
}

json PlankaClient::update_board_membership(
    const std::string& membership_id, const BoardMembershipUpdate& update) {
    return request_item("PATCH", "/api/board-memberships/" + membership_id,
                        update.to_json());
}

json PlankaClient::remove_board_membership(const std::string& membership_id) {
    return request_item("DELETE", "/api/board-memberships/" + membership_id);
}

// Users

json PlankaClient::get_users() { return request_items("GET", "/api/users"); }

json PlankaClient::get_user(const std::string& user_id) {
    return request_item("GET", "/api/users/" + user_id);
}

json PlankaClient::create_user(const std::string& email,
                               const std::string& password,
                               const std::string& name,
                               const std::optional<std::string>& username) {
    json body = {{"email", email}, {"password", password}, {"name", name}};
    if (username) {
        body["username"] = *username;
    }
    return request_item("POST", "/api/users", body);
}

json PlankaClient::update_user(const std::string& user_id,
                               const UserUpdate& update) {
    return request_item("PATCH", "/api/users/" + user_id, update.to_json());
}

json PlankaClient::delete_user(const std::string& user_id) {
    return request_item("DELETE", "/api/users/" + user_id);
}

// Notifications

json PlankaClient::get_notifications() {
    return request_items("GET", "/api/notifications");
}

json PlankaClient::get_notification(const std::string& notification_id) {
    return request_item("GET", "/api/notifications/" + notification_id);
}

json PlankaClient::update_notification(const std::string& notification_id,
                                       const NotificationUpdate& update) {
    return request_item("PATCH", "/api/notifications/" + notification_id,
                        update.to_json());
}

json PlankaClient::read_all_notifications() {
    return request("POST", "/api/notifications/read-all", json::object());
}

// Activity

json PlankaClient::get_board_actions(const std::string& board_id) {
    return request_items("GET", "/api/boards/" + board_id + "/actions");
}

json PlankaClient::get_card_actions(const std::string& card_id) {
    return request_items("GET", "/api/cards/" + card_id + "/actions");
}

json PlankaClient::get_config() { return request("GET", "/api/config"); }

}  // namespace planka::api
