#include "planka/http/beast_http_transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/url/host_type.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <stdexcept>

#include "planka/api/errors.hpp"
#include "planka/log/logger.hpp"

namespace planka::http {

namespace {

// Large boards come back in one response
constexpr std::uint64_t kMaxResponseBodySize = 64 * 1024 * 1024;

}  // namespace

BeastHttpTransport::BeastHttpTransport(const std::string& base_url,
                                       const config::ClientConfig& config)
    : timeout_(config.timeout_seconds),
      user_agent_(config.user_agent),
      ssl_ctx_(ssl::context::tlsv12_client) {
    auto parsed = boost::urls::parse_uri(base_url);
    if (!parsed) {
        throw NetworkError("Invalid server url '" + base_url +
                           "': " + parsed.error().message());
    }
    boost::urls::url_view u = *parsed;

    const std::string scheme(u.scheme());
    if (scheme == "https") {
        use_tls_ = true;
    } else if (scheme != "http") {
        throw NetworkError("Unsupported url scheme '" + scheme + "' in " +
                           base_url);
    }

    host_ = std::string(u.host_address());
    if (host_.empty()) {
        throw NetworkError("Missing host in server url " + base_url);
    }
    port_ = u.has_port() ? std::string(u.port()) : (use_tls_ ? "443" : "80");

    // IPv6 literals keep their brackets in the Host header
    host_header_ = u.host_type() == boost::urls::host_type::ipv6
                       ? "[" + host_ + "]"
                       : host_;
    if ((use_tls_ && port_ != "443") || (!use_tls_ && port_ != "80")) {
        host_header_ += ":" + port_;
    }
    base_path_ = std::string(u.encoded_path());
    while (!base_path_.empty() && base_path_.back() == '/') {
        base_path_.pop_back();
    }

    if (use_tls_) {
        ssl_ctx_.set_default_verify_paths();
        if (config.verify_tls) {
            ssl_ctx_.set_verify_mode(ssl::verify_peer);
            if (!config.ca_file.empty()) {
                beast::error_code ec;
                ssl_ctx_.load_verify_file(config.ca_file, ec);
                if (ec) {
                    throw NetworkError("Failed to load CA file '" +
                                       config.ca_file + "': " + ec.message());
                }
                PLANKA_LOG_DEBUG << "Loaded CA file " << config.ca_file;
            }
        } else {
            ssl_ctx_.set_verify_mode(ssl::verify_none);
            PLANKA_LOG_WARN
                << "TLS certificate verification disabled (insecure)";
        }
    }
}

BeastHttpTransport::~BeastHttpTransport() { close(); }

bool BeastHttpTransport::is_open() const {
    if (use_tls_) {
        return tls_stream_ &&
               beast::get_lowest_layer(*tls_stream_).socket().is_open();
    }
    return tcp_stream_ && tcp_stream_->socket().is_open();
}

beast::tcp_stream& BeastHttpTransport::lowest_layer() {
    if (use_tls_) {
        return beast::get_lowest_layer(*tls_stream_);
    }
    return *tcp_stream_;
}

void BeastHttpTransport::run_io() {
    ioc_.restart();
    ioc_.run();
}

tcp::resolver::results_type BeastHttpTransport::resolve() {
    tcp::resolver resolver(ioc_);
    beast::error_code ec;
    tcp::resolver::results_type results;
    bool done = false;

    resolver.async_resolve(
        host_, port_,
        [&](const beast::error_code& e, tcp::resolver::results_type r) {
            ec = e;
            results = std::move(r);
            done = true;
        });

    ioc_.restart();
    ioc_.run_for(timeout_);
    if (!done) {
        resolver.cancel();
        run_io();
        fail(beast::error::timeout, "Resolving " + host_);
    }
    if (ec) {
        fail(ec, "Resolving " + host_);
    }
    return results;
}

void BeastHttpTransport::connect() {
    auto const results = resolve();
    beast::error_code ec;

    if (use_tls_) {
        tls_stream_ =
            std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc_,
                                                                   ssl_ctx_);
        // SNI and host name verification
        if (!SSL_set_tlsext_host_name(tls_stream_->native_handle(),
                                      host_.c_str())) {
            ec.assign(static_cast<int>(::ERR_get_error()),
                      net::error::get_ssl_category());
            fail(ec, "Setting SNI host name");
        }
        tls_stream_->set_verify_callback(ssl::host_name_verification(host_));
    } else {
        tcp_stream_ = std::make_unique<beast::tcp_stream>(ioc_);
    }

    lowest_layer().expires_after(timeout_);
    lowest_layer().async_connect(
        results, [&](const beast::error_code& e,
                     const tcp::resolver::results_type::endpoint_type&) {
            ec = e;
        });
    run_io();
    if (ec) {
        fail(ec, "Connecting to " + host_ + ":" + port_);
    }

    if (use_tls_) {
        lowest_layer().expires_after(timeout_);
        tls_stream_->async_handshake(
            ssl::stream_base::client,
            [&](const beast::error_code& e) { ec = e; });
        run_io();
        if (ec) {
            fail(ec, "TLS handshake with " + host_);
        }
    }

    buffer_.clear();
    PLANKA_LOG_DEBUG << "Connected to " << host_ << ":" << port_
                     << (use_tls_ ? " (tls)" : "");
}

HttpResponse BeastHttpTransport::send(const HttpRequest& request) {
    if (!is_open()) {
        connect();
    }
    if (use_tls_) {
        return exchange(*tls_stream_, request);
    }
    return exchange(*tcp_stream_, request);
}

template <typename Stream>
HttpResponse BeastHttpTransport::exchange(Stream& stream,
                                          const HttpRequest& request) {
    const bhttp::verb method = bhttp::string_to_verb(request.method);
    if (method == bhttp::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " +
                                    request.method);
    }

    bhttp::request<bhttp::string_body> req{
        method, base_path_ + request.target, 11 /* HTTP/1.1 */};
    req.set(bhttp::field::host, host_header_);
    req.set(bhttp::field::user_agent, user_agent_);
    req.keep_alive(true);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    beast::error_code ec;
    lowest_layer().expires_after(timeout_);
    bhttp::async_write(stream, req,
                       [&](const beast::error_code& e, std::size_t) {
                           ec = e;
                       });
    run_io();
    if (ec) {
        fail(ec, request.method + " " + request.target);
    }

    bhttp::response_parser<bhttp::string_body> parser;
    parser.body_limit(kMaxResponseBodySize);
    lowest_layer().expires_after(timeout_);
    bhttp::async_read(stream, buffer_, parser,
                      [&](const beast::error_code& e, std::size_t) {
                          ec = e;
                      });
    run_io();
    if (ec) {
        fail(ec, request.method + " " + request.target);
    }
    lowest_layer().expires_never();

    auto res = parser.release();
    HttpResponse response;
    response.status_code = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] =
            std::string(field.value());
    }
    response.body = std::move(res.body());

    if (!res.keep_alive()) {
        close();
    }
    return response;
}

void BeastHttpTransport::close() {
    beast::error_code ec;
    if (tls_stream_) {
        auto& socket = beast::get_lowest_layer(*tls_stream_).socket();
        if (socket.is_open()) {
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
        tls_stream_.reset();
    }
    if (tcp_stream_) {
        auto& socket = tcp_stream_->socket();
        if (socket.is_open()) {
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
        tcp_stream_.reset();
    }
    buffer_.clear();
}

void BeastHttpTransport::fail(const beast::error_code& ec,
                              const std::string& what) {
    close();
    if (ec == beast::error::timeout) {
        throw TimeoutError(what + " timed out after " +
                           std::to_string(timeout_.count()) + "s");
    }
    throw NetworkError(what + " failed: " + ec.message());
}

}  // namespace planka::http
