/**
 * devhttps - Local HTTPS Development Server
 * SSL Connection handler - HTTPS connection handling with TLS termination
 */

#ifndef DEVHTTPS_SERVER_SSL_CONNECTION_HPP
#define DEVHTTPS_SERVER_SSL_CONNECTION_HPP

#include "server/http_types.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace devhttps::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

/**
 * SSL stream type used for connections
 */
using ssl_stream = ssl::stream<beast::tcp_stream>;

/**
 * SSL Connection class - manages a single HTTPS client connection
 *
 * Uses Boost.Beast with SSL for HTTP parsing and supports:
 * - TLS 1.2/1.3 handshake
 * - HTTP/1.0 and HTTP/1.1 requests over the encrypted channel
 * - Keep-alive connections
 * - HEAD responses that announce the length of the omitted body
 * - Files streamed from disk with http::file_body
 * - Graceful SSL shutdown
 */
class SslConnection : public std::enable_shared_from_this<SslConnection> {
public:
    static constexpr std::chrono::seconds kHandshakeTimeout{10};
    static constexpr std::chrono::seconds kReadTimeout{30};

    /**
     * Create a new SSL connection
     * @param socket The accepted TCP socket
     * @param ssl_ctx SSL context for encryption
     * @param handler The request handler callback
     */
    SslConnection(tcp::socket socket, ssl::context& ssl_ctx, RequestHandler handler);

    ~SslConnection() = default;

    // Non-copyable, non-movable
    SslConnection(const SslConnection&) = delete;
    SslConnection& operator=(const SslConnection&) = delete;
    SslConnection(SslConnection&&) = delete;
    SslConnection& operator=(SslConnection&&) = delete;

    /**
     * Start processing the connection asynchronously
     * Initiates SSL handshake followed by HTTP request handling
     */
    void start();

    /**
     * Close the connection gracefully with SSL shutdown
     */
    void close();

private:
    void do_handshake();
    void on_handshake(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes_transferred);
    void do_shutdown();
    void on_shutdown(beast::error_code ec);

    HttpRequest parse_request(const http::request<http::string_body>& req);
    void prepare_response(HttpResponse resp);
    http::response<http::string_body> build_error_response(http::status status, const std::string& message);

    template <class Body>
    void send(http::response<Body>& response);

    void log_access(unsigned status);

    ssl_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    // Set instead of response_ when a file is streamed from disk
    std::optional<http::response<http::file_body>> file_response_;
    RequestHandler handler_;
    bool keep_alive_{false};

    // For the access log of the request in flight
    std::chrono::steady_clock::time_point request_start_{};
    std::string request_method_;
    std::string request_target_;
    std::uint64_t response_size_{0};

    // Client connection info (captured at connection time)
    std::string client_ip_;
    std::uint16_t client_port_{0};
};

/**
 * Create and start an SSL connection
 * Helper function for use with SSL server
 */
void handle_ssl_connection(tcp::socket socket, ssl::context& ssl_ctx, RequestHandler handler);

} // namespace devhttps::server

#endif // DEVHTTPS_SERVER_SSL_CONNECTION_HPP
