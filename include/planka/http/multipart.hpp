#pragma once

#include <string>

namespace planka::http {

// multipart/form-data body builder for file uploads
class MultipartFormData {
public:
    MultipartFormData();
    explicit MultipartFormData(std::string boundary);

    void add_file(const std::string& field_name, const std::string& filename,
                  const std::string& content,
                  const std::string& content_type =
                      "application/octet-stream");

    const std::string& boundary() const { return boundary_; }

    // Value for the Content-Type header
    std::string content_type() const;

    // Encoded payload including the closing delimiter
    std::string body() const;

private:
    static std::string generate_boundary();
    static std::string quote(const std::string& value);

    std::string boundary_;
    std::string parts_;
};

}  // namespace planka::http
