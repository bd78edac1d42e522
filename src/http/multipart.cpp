#include "planka/http/multipart.hpp"

#include <random>

namespace planka::http {

MultipartFormData::MultipartFormData() : boundary_(generate_boundary()) {}

MultipartFormData::MultipartFormData(std::string boundary)
    : boundary_(std::move(boundary)) {}

std::string MultipartFormData::generate_boundary() {
    static constexpr char kAlphabet[] =
        "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> distrib(0, sizeof(kAlphabet) - 2);

    std::string boundary = "----PlankaFormBoundary";
    for (int i = 0; i < 24; ++i) {
        boundary += kAlphabet[distrib(gen)];
    }
    return boundary;
}

// Quoted-string for Content-Disposition parameters
std::string MultipartFormData::quote(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        } else if (c == '\r' || c == '\n') {
            continue;
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void MultipartFormData::add_file(const std::string& field_name,
                                 const std::string& filename,
                                 const std::string& content,
                                 const std::string& content_type) {
    parts_ += "--" + boundary_ + "\r\n";
    parts_ += "Content-Disposition: form-data; name=" + quote(field_name) +
              "; filename=" + quote(filename) + "\r\n";
    parts_ += "Content-Type: " + content_type + "\r\n";
    parts_ += "\r\n";
    parts_ += content;
    parts_ += "\r\n";
}

std::string MultipartFormData::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string MultipartFormData::body() const {
    return parts_ + "--" + boundary_ + "--\r\n";
}

}  // namespace planka::http
