/**
 * devhttps - Local HTTPS Development Server
 * SSL Connection implementation - HTTPS connection handling with TLS termination
 */

#include "server/ssl_connection.hpp"
#include "server/static_file_handler.hpp"
#include "util/logger.hpp"

#include <spdlog/spdlog.h>

#include <tuple>
#include <utility>

namespace devhttps::server {

namespace {

constexpr const char* kServerHeader = "devhttps/0.1.0";

template <class Body>
void apply_headers(http::response<Body>& response, const HttpResponse& resp) {
    response.set(http::field::server, kServerHeader);
    response.set(http::field::content_type, resp.content_type);
    for (const auto& [name, value] : resp.headers) {
        response.set(name, value);
    }
}

} // anonymous namespace

SslConnection::SslConnection(tcp::socket socket, ssl::context& ssl_ctx, RequestHandler handler)
    : stream_(beast::tcp_stream(std::move(socket)), ssl_ctx)
    , handler_(std::move(handler))
{
    // Capture client endpoint before starting handshake
    beast::error_code ec;
    auto endpoint = beast::get_lowest_layer(stream_).socket().remote_endpoint(ec);
    if (!ec) {
        client_ip_ = endpoint.address().to_string();
        client_port_ = endpoint.port();
    }
}

void SslConnection::start() {
    // Start with SSL handshake
    asio::dispatch(
        beast::get_lowest_layer(stream_).get_executor(),
        beast::bind_front_handler(&SslConnection::do_handshake, shared_from_this())
    );
}

void SslConnection::close() {
    // Initiate graceful SSL shutdown
    do_shutdown();
}

void SslConnection::do_handshake() {
    beast::get_lowest_layer(stream_).expires_after(kHandshakeTimeout);

    stream_.async_handshake(
        ssl::stream_base::server,
        beast::bind_front_handler(&SslConnection::on_handshake, shared_from_this())
    );
}

void SslConnection::on_handshake(beast::error_code ec) {
    if (ec) {
        if (ec == asio::error::operation_aborted) {
            spdlog::debug("SSL Connection: Handshake aborted");
            return;
        }

        // Browsers that distrust the self-signed certificate abort here
        if (ec.category() == asio::error::get_ssl_category()) {
            spdlog::warn("SSL Connection: Handshake failed from {}:{} - SSL error: {}",
                         client_ip_.empty() ? "(unknown)" : client_ip_,
                         client_port_,
                         ec.message());
        } else if (ec == beast::error::timeout) {
            spdlog::debug("SSL Connection: Handshake timeout from {}:{}",
                          client_ip_.empty() ? "(unknown)" : client_ip_,
                          client_port_);
        } else {
            spdlog::debug("SSL Connection: Handshake error from {}:{} - {}",
                          client_ip_.empty() ? "(unknown)" : client_ip_,
                          client_port_,
                          ec.message());
        }
        return;
    }

    spdlog::debug("SSL Connection: Handshake complete from {}:{}",
                  client_ip_.empty() ? "(unknown)" : client_ip_,
                  client_port_);

    do_read();
}

void SslConnection::do_read() {
    // Clear the request for the next read
    request_ = {};

    beast::get_lowest_layer(stream_).expires_after(kReadTimeout);

    http::async_read(
        stream_,
        buffer_,
        request_,
        beast::bind_front_handler(&SslConnection::on_read, shared_from_this())
    );
}

void SslConnection::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    // Client closed connection
    if (ec == http::error::end_of_stream) {
        spdlog::debug("SSL Connection: Client closed connection");
        do_shutdown();
        return;
    }

    if (ec == asio::ssl::error::stream_truncated) {
        spdlog::debug("SSL Connection: Stream truncated (client disconnect)");
        return;
    }

    request_start_ = std::chrono::steady_clock::now();

    if (ec) {
        if (ec == beast::error::timeout) {
            spdlog::debug("SSL Connection: Read timeout");
        } else if (ec == http::error::bad_version) {
            // The parser accepts only HTTP/1.0 and HTTP/1.1
            spdlog::debug("SSL Connection: Unsupported HTTP version from {}", client_ip_);
            request_method_ = "-";
            request_target_ = "-";
            keep_alive_ = false;
            response_ = build_error_response(
                http::status::http_version_not_supported,
                "Only HTTP/1.0 and HTTP/1.1 are supported"
            );
            do_write();
            return;
        } else if (ec != asio::error::operation_aborted) {
            if (ec == http::error::bad_method ||
                ec == http::error::bad_target ||
                ec == http::error::bad_field ||
                ec == http::error::bad_value ||
                ec == http::error::bad_line_ending ||
                ec == http::error::bad_content_length ||
                ec == http::error::bad_transfer_encoding ||
                ec == http::error::body_limit ||
                ec == http::error::header_limit ||
                ec == http::error::partial_message) {
                spdlog::debug("SSL Connection: Malformed request from {} - {}",
                              client_ip_, ec.message());
                request_method_ = "-";
                request_target_ = "-";
                keep_alive_ = false;
                response_ = build_error_response(
                    http::status::bad_request,
                    "Malformed HTTP request: " + ec.message()
                );
                do_write();
                return;
            }
            spdlog::debug("SSL Connection: Read error - {}", ec.message());
        }
        do_shutdown();
        return;
    }

    request_method_ = std::string(request_.method_string());
    request_target_ = std::string(request_.target());

    spdlog::trace("SSL Connection: {} {} HTTP/{}.{}",
                  request_method_, request_target_,
                  request_.version() / 10,
                  request_.version() % 10);

    keep_alive_ = request_.keep_alive();

    try {
        prepare_response(handler_(parse_request(request_)));
    } catch (const std::exception& e) {
        spdlog::error("SSL Connection: Handler exception - {}", e.what());
        file_response_.reset();
        response_ = build_error_response(
            http::status::internal_server_error,
            "Internal server error"
        );
    }

    do_write();
}

void SslConnection::do_write() {
    if (file_response_) {
        send(*file_response_);
    } else {
        send(response_);
    }
}

template <class Body>
void SslConnection::send(http::response<Body>& response) {
    response.set(http::field::connection, keep_alive_ ? "keep-alive" : "close");

    // A preset Content-Length (HEAD) must survive; otherwise derive it from the body
    if (!response.has_content_length()) {
        response.prepare_payload();
    }

    log_access(response.result_int());

    beast::get_lowest_layer(stream_).expires_after(kReadTimeout);

    http::async_write(
        stream_,
        response,
        beast::bind_front_handler(&SslConnection::on_write, shared_from_this())
    );
}

void SslConnection::on_write(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    // Closes the streamed file
    file_response_.reset();

    if (ec) {
        if (ec != asio::error::operation_aborted) {
            spdlog::debug("SSL Connection: Write error - {}", ec.message());
        }
        do_shutdown();
        return;
    }

    if (!keep_alive_) {
        do_shutdown();
        return;
    }

    // Clear for next request
    response_ = {};

    // Read another request (keep-alive)
    do_read();
}

void SslConnection::do_shutdown() {
    beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(5));

    stream_.async_shutdown(
        beast::bind_front_handler(&SslConnection::on_shutdown, shared_from_this())
    );
}

void SslConnection::on_shutdown(beast::error_code ec) {
    // stream_truncated, operation_aborted and eof are normal ways for a peer to go away
    if (ec && ec != asio::ssl::error::stream_truncated &&
        ec != asio::error::operation_aborted &&
        ec != asio::error::eof) {
        spdlog::debug("SSL Connection: Shutdown error - {}", ec.message());
    }
}

HttpRequest SslConnection::parse_request(const http::request<http::string_body>& req) {
    HttpRequest parsed;

    parsed.method = req.method();
    parsed.method_string = std::string(req.method_string());
    parsed.target = std::string(req.target());
    parsed.version = req.version();

    parsed.client_ip = client_ip_;
    parsed.client_port = client_port_;

    return parsed;
}

void SslConnection::prepare_response(HttpResponse resp) {
    bool head_only = request_.method() == http::verb::head;

    if (!resp.file.empty() && !head_only) {
        beast::error_code ec;
        http::file_body::value_type file;
        file.open(resp.file.c_str(), beast::file_mode::scan, ec);
        if (ec) {
            DEVHTTPS_LOG_ERROR(util::log_component::Files, "Cannot open {}: {}",
                               resp.file.string(), ec.message());
            response_ = build_error_response(http::status::forbidden, "File is not readable.");
            return;
        }

        // Length comes from the opened file, in case it changed since the handler looked
        auto size = file.size();
        http::response<http::file_body> response{
            std::piecewise_construct,
            std::make_tuple(std::move(file)),
            std::make_tuple(resp.status, request_.version())};
        apply_headers(response, resp);
        response.content_length(size);
        response_size_ = size;
        file_response_.emplace(std::move(response));
        return;
    }

    http::response<http::string_body> response{resp.status, request_.version()};
    apply_headers(response, resp);

    if (resp.content_length) {
        response.content_length(*resp.content_length);
        response_size_ = head_only ? 0 : resp.body.size();
        if (!head_only) {
            response.body() = std::move(resp.body);
        }
    } else if (head_only) {
        response.content_length(resp.body.size());
        response_size_ = 0;
    } else {
        response_size_ = resp.body.size();
        response.body() = std::move(resp.body);
    }

    response_ = std::move(response);
}

http::response<http::string_body> SslConnection::build_error_response(
    http::status status, const std::string& message)
{
    HttpResponse page = make_error_response(status, message);

    // Never echo an unsupported version back in the status line
    unsigned version = request_.version() == 10 ? 10 : 11;
    http::response<http::string_body> response{status, version};
    response.set(http::field::server, kServerHeader);
    response.set(http::field::content_type, page.content_type);
    response.body() = std::move(page.body);
    response_size_ = response.body().size();

    return response;
}

void SslConnection::log_access(unsigned status) {
    util::AccessLogEntry entry;
    entry.client_ip = client_ip_.empty() ? "-" : client_ip_;
    entry.method = request_method_;
    entry.path = request_target_;
    entry.status_code = static_cast<int>(status);
    entry.response_size = response_size_;
    entry.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - request_start_);
    util::Logger::instance().access(entry);
}

void handle_ssl_connection(tcp::socket socket, ssl::context& ssl_ctx, RequestHandler handler) {
    std::make_shared<SslConnection>(std::move(socket), ssl_ctx, std::move(handler))->start();
}

} // namespace devhttps::server
