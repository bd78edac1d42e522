#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "planka/config/client_config.hpp"
#include "planka/http/http_transport.hpp"

namespace planka::http {

namespace beast = boost::beast;     // from <boost/beast/core.hpp>
namespace bhttp = beast::http;      // from <boost/beast/http.hpp>
namespace net = boost::asio;        // from <boost/asio/io_context.hpp>
namespace ssl = boost::asio::ssl;   // from <boost/asio/ssl.hpp>
using tcp = boost::asio::ip::tcp;   // from <boost/asio/ip/tcp.hpp>

/// @brief Synchronous HTTP/1.1 transport over plain TCP or TLS.
///
/// One connection is opened lazily and kept alive for the following
/// requests of the same invocation. Every step of a request (resolve,
/// connect, handshake, write, read) is bounded by the configured timeout.
class BeastHttpTransport : public IHttpTransport {
public:
    /// @param base_url Server root, e.g. "https://planka.example.com" or
    /// "http://10.0.0.5:3000/planka". A path is prepended to every target.
    /// @throws NetworkError if the url is not an http(s) url.
    BeastHttpTransport(const std::string& base_url,
                       const config::ClientConfig& config);
    ~BeastHttpTransport() override;

    // Non-copyable
    BeastHttpTransport(const BeastHttpTransport&) = delete;
    BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

    HttpResponse send(const HttpRequest& request) override;
    void close() override;

    bool is_open() const;
    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    // Value sent as the Host header, e.g. "[::1]:8080"
    const std::string& host_header() const { return host_header_; }
    const std::string& base_path() const { return base_path_; }
    bool use_tls() const { return use_tls_; }

private:
    void connect();
    tcp::resolver::results_type resolve();
    beast::tcp_stream& lowest_layer();

    template <typename Stream>
    HttpResponse exchange(Stream& stream, const HttpRequest& request);

    // Runs queued async operations to completion
    void run_io();

    [[noreturn]] void fail(const beast::error_code& ec,
                           const std::string& what);

    std::string host_;
    std::string port_;
    std::string host_header_;
    std::string base_path_;
    bool use_tls_ = false;
    std::chrono::seconds timeout_;
    std::string user_agent_;

    net::io_context ioc_;
    ssl::context ssl_ctx_;
    std::unique_ptr<beast::tcp_stream> tcp_stream_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_stream_;
    beast::flat_buffer buffer_;
};

}  // namespace planka::http
