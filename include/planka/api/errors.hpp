#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace planka {

// Root of every error raised by the client, the config store and the
// transport. The command layer catches this type to print a message and
// exit non-zero.
class PlankaError : public std::runtime_error {
public:
    explicit PlankaError(const std::string& message)
        : std::runtime_error(message) {}
};

// The persisted config file exists but cannot be parsed.
class ConfigCorruptError : public PlankaError {
public:
    ConfigCorruptError(const std::filesystem::path& path,
                       const std::string& reason);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Local file could not be read or written (upload source, config file).
class IoError : public PlankaError {
public:
    IoError(const std::filesystem::path& path, const std::string& reason);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Non-2xx response from the server. The body is kept verbatim.
class ApiError : public PlankaError {
public:
    ApiError(int status, std::string body);
    ApiError(int status, std::string body, const std::string& message);

    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    int status_;
    std::string body_;
};

// Rejected credentials: any non-2xx on login, 401/403 elsewhere.
class AuthError : public ApiError {
public:
    AuthError(int status, std::string body);
};

// Resolve, connect, TLS or socket failure.
class NetworkError : public PlankaError {
public:
    explicit NetworkError(const std::string& message) : PlankaError(message) {}
};

class TimeoutError : public NetworkError {
public:
    explicit TimeoutError(const std::string& message)
        : NetworkError(message) {}
};

// No server URL in the environment or the persisted config.
class NotConfiguredError : public PlankaError {
public:
    explicit NotConfiguredError(const std::string& message)
        : PlankaError(message) {}
};

// Malformed command line.
class UsageError : public PlankaError {
public:
    explicit UsageError(const std::string& message) : PlankaError(message) {}
};

}  // namespace planka
