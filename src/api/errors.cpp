#include "planka/api/errors.hpp"

#include <utility>

namespace planka {

namespace {

// Error bodies can be whole HTML pages; keep the message readable.
constexpr std::size_t kMaxBodyInMessage = 512;

std::string describe_response(int status, const std::string& body) {
    std::string message = "HTTP " + std::to_string(status);
    if (!body.empty()) {
        message += ": ";
        if (body.size() > kMaxBodyInMessage) {
            message += body.substr(0, kMaxBodyInMessage) + "...";
        } else {
            message += body;
        }
    }
    return message;
}

}  // namespace

ConfigCorruptError::ConfigCorruptError(const std::filesystem::path& path,
                                       const std::string& reason)
    : PlankaError("Config file " + path.string() + " is corrupt: " + reason),
      path_(path) {}

IoError::IoError(const std::filesystem::path& path, const std::string& reason)
    : PlankaError(path.string() + ": " + reason), path_(path) {}

ApiError::ApiError(int status, std::string body)
    : PlankaError(describe_response(status, body)),
      status_(status),
      body_(std::move(body)) {}

ApiError::ApiError(int status, std::string body, const std::string& message)
    : PlankaError(message), status_(status), body_(std::move(body)) {}

AuthError::AuthError(int status, std::string body)
    : ApiError(status, body,
               "Authentication failed (" + describe_response(status, body) +
                   ")") {}

}  // namespace planka
