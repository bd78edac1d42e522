#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "nlohmann/json.hpp"
#include "planka/api/updates.hpp"
#include "planka/http/http_transport.hpp"

namespace planka::api {

/// @brief Typed access to the Planka REST API.
///
/// Every action issues exactly one request through the owned transport.
/// Singular actions return the response's "item", plural actions its
/// "items"; get_project, get_board, get_list, get_task_list, sort_list and
/// get_config return the whole body so callers can read "included".
///
/// Errors: AuthError on 401/403 (and on any failed login), ApiError on
/// other non-2xx statuses or a malformed envelope, NetworkError or
/// TimeoutError from the transport.
class PlankaClient {
public:
    PlankaClient(std::string base_url, std::optional<std::string> token,
                 std::unique_ptr<http::IHttpTransport> transport);
    ~PlankaClient();

    PlankaClient(const PlankaClient&) = delete;
    PlankaClient& operator=(const PlankaClient&) = delete;

    const std::string& base_url() const { return base_url_; }
    const std::optional<std::string>& token() const { return token_; }
    void set_token(std::optional<std::string> token) {
        token_ = std::move(token);
    }

    /// @brief Releases the transport. Further actions are not allowed.
    void close();

    // Authentication
    /// @brief Exchanges credentials for an access token. The token becomes
    /// the active token of this client and is returned.
    std::string login(const std::string& email_or_username,
                      const std::string& password);
    nlohmann::json logout();

    // Projects
    nlohmann::json get_projects();
    nlohmann::json get_project(const std::string& project_id);
    nlohmann::json create_project(const std::string& name);
    nlohmann::json update_project(const std::string& project_id,
                                  const ProjectUpdate& update);
    nlohmann::json delete_project(const std::string& project_id);

    // Boards
    nlohmann::json create_board(const std::string& project_id,
                                const std::string& name, double position);
    nlohmann::json get_board(const std::string& board_id);
    nlohmann::json update_board(const std::string& board_id,
                                const BoardUpdate& update);
    nlohmann::json delete_board(const std::string& board_id);

    // Lists
    nlohmann::json create_list(const std::string& board_id,
                               const std::string& name, double position);
    nlohmann::json get_list(const std::string& list_id);
    nlohmann::json update_list(const std::string& list_id,
                               const ListUpdate& update);
    nlohmann::json delete_list(const std::string& list_id);
    nlohmann::json sort_list(const std::string& list_id);

    // Cards
    nlohmann::json create_card(const std::string& list_id,
                               const std::string& name, double position,
                               const CardCreate& extras = {});
    nlohmann::json get_cards(const std::string& list_id);
    nlohmann::json get_card(const std::string& card_id);
    nlohmann::json update_card(const std::string& card_id,
                               const CardUpdate& update);
    nlohmann::json delete_card(const std::string& card_id);
    nlohmann::json duplicate_card(const std::string& card_id,
                                  double position);
    nlohmann::json move_card(const std::string& card_id,
                             const std::string& list_id, double position);

    // Labels
    nlohmann::json create_label(const std::string& board_id,
                                const std::string& name,
                                const std::string& color, double position);
    nlohmann::json update_label(const std::string& label_id,
                                const LabelUpdate& update);
    nlohmann::json delete_label(const std::string& label_id);
    nlohmann::json add_label_to_card(const std::string& card_id,
                                     const std::string& label_id);
    nlohmann::json remove_label_from_card(const std::string& card_id,
                                          const std::string& label_id);

    // Task lists and tasks
    nlohmann::json create_task_list(const std::string& card_id,
                                    const std::string& name,
                                    double position);
    nlohmann::json get_task_list(const std::string& task_list_id);
    nlohmann::json update_task_list(const std::string& task_list_id,
                                    const TaskListUpdate& update);
    nlohmann::json delete_task_list(const std::string& task_list_id);
    nlohmann::json create_task(const std::string& task_list_id,
                               const std::string& name, double position);
    nlohmann::json update_task(const std::string& task_id,
                               const TaskUpdate& update);
    nlohmann::json delete_task(const std::string& task_id);

    // Comments
    nlohmann::json create_comment(const std::string& card_id,
                                  const std::string& text);
    nlohmann::json get_comments(const std::string& card_id);
    nlohmann::json update_comment(const std::string& comment_id,
                                  const std::string& text);
    nlohmann::json delete_comment(const std::string& comment_id);

    // Attachments
    /// @brief Uploads a local file as multipart/form-data.
    /// @throws IoError if the file cannot be read; nothing is sent then.
    nlohmann::json create_attachment(const std::string& card_id,
                                     const std::filesystem::path& file);
    nlohmann::json update_attachment(const std::string& attachment_id,
                                     const AttachmentUpdate& update);
    nlohmann::json delete_attachment(const std::string& attachment_id);

    // Memberships
    nlohmann::json add_member_to_card(const std::string& card_id,
                                      const std::string& user_id);
    nlohmann::json remove_member_from_card(const std::string& card_id,
                                           const std::string& user_id);
    nlohmann::json add_member_to_board(const std::string& board_id,
                                       const std::string& user_id,
                                       const std::string& role = "editor");
    nlohmann::json update_board_membership(
        const std::string& membership_id, const BoardMembershipUpdate& update);
    nlohmann::json remove_board_membership(const std::string& membership_id);

    // Users
    nlohmann::json get_users();
    nlohmann::json get_user(const std::string& user_id);
    nlohmann::json create_user(
        const std::string& email, const std::string& password,
        const std::string& name,
        const std::optional<std::string>& username = std::nullopt);
    nlohmann::json update_user(const std::string& user_id,
                               const UserUpdate& update);
    nlohmann::json delete_user(const std::string& user_id);

    // Notifications
    nlohmann::json get_notifications();
    nlohmann::json get_notification(const std::string& notification_id);
    nlohmann::json update_notification(const std::string& notification_id,
                                       const NotificationUpdate& update);
    nlohmann::json read_all_notifications();

    // Activity
    nlohmann::json get_board_actions(const std::string& board_id);
    nlohmann::json get_card_actions(const std::string& card_id);

    // Server
    nlohmann::json get_config();

private:
    http::HttpResponse send(http::HttpRequest request, bool authorize);
    // Authorized request; error statuses are raised
    http::HttpResponse call(const std::string& method, const std::string& path,
                            const std::optional<nlohmann::json>& body);
    nlohmann::json request(const std::string& method, const std::string& path,
                           const std::optional<nlohmann::json>& body =
                               std::nullopt);
    nlohmann::json request_item(const std::string& method,
                                const std::string& path,
                                const std::optional<nlohmann::json>& body =
                                    std::nullopt);
    nlohmann::json request_items(const std::string& method,
                                 const std::string& path,
                                 const std::optional<nlohmann::json>& body =
                                     std::nullopt);

    static void check_status(const http::HttpResponse& response);
    static nlohmann::json parse_body(const http::HttpResponse& response);
    static nlohmann::json unwrap(const http::HttpResponse& response,
                                 const char* key);
    http::IHttpTransport& transport();

    std::string base_url_;
    std::optional<std::string> token_;
    std::unique_ptr<http::IHttpTransport> transport_;
};

}  // namespace planka::api
