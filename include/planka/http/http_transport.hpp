#pragma once

#include <map>
#include <string>

namespace planka::http {

// Outgoing request. target is the path relative to the server base url,
// e.g. "/api/cards/42".
struct HttpRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

/// @brief Carries one request at a time to the server.
/// Implementations report transport failures as NetworkError/TimeoutError;
/// HTTP error statuses are returned, not thrown.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;

    /// @brief Releases the underlying connection. Safe to call repeatedly.
    virtual void close() = 0;
};

}  // namespace planka::http
