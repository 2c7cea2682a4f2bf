/**
 * devhttps - Local HTTPS Development Server
 * SSL Server component - HTTPS acceptor with TLS termination
 */

#ifndef DEVHTTPS_SERVER_SSL_SERVER_HPP
#define DEVHTTPS_SERVER_SSL_SERVER_HPP

#include "server/ssl_context.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>

namespace devhttps::server {

namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

/**
 * SSL Server configuration
 */
struct SslServerConfig {
    std::uint16_t port{8443};               // 0 picks an ephemeral port
    std::string bind_address{"0.0.0.0"};

    // SSL configuration
    SslConfig ssl;
};

/**
 * SSL Connection handler type - called when a new SSL connection is accepted
 */
using SslConnectionHandler = std::function<void(tcp::socket, ssl::context&)>;

/**
 * SSL Server class - HTTPS acceptor on a single-threaded io_context
 *
 * The credential is loaded at construction. start() binds and listens,
 * run() drives the event loop on the calling thread until stop() or the
 * given stop token fires.
 */
class SslServer {
public:
    /**
     * @param config SSL server configuration
     * @throws std::runtime_error if SSL initialization fails
     */
    explicit SslServer(const SslServerConfig& config);

    ~SslServer();

    // Non-copyable, non-movable
    SslServer(const SslServer&) = delete;
    SslServer& operator=(const SslServer&) = delete;
    SslServer(SslServer&&) = delete;
    SslServer& operator=(SslServer&&) = delete;

    /**
     * Bind, listen and start accepting HTTPS connections
     * @param handler Callback invoked for each accepted connection
     * @throws std::runtime_error if the address cannot be bound
     */
    void start(SslConnectionHandler handler);

    /**
     * Run the event loop until the server stops or stop is requested
     */
    void run(std::stop_token stop_token);

    /**
     * Stop accepting connections and stop the event loop
     */
    void stop();

    bool is_running() const noexcept;

    /**
     * Get the port the server is listening on (the bound port once started)
     */
    std::uint16_t get_port() const noexcept;

    asio::io_context& get_io_context() noexcept;

    std::uint64_t connections_accepted() const noexcept;

private:
    void do_accept();

    SslServerConfig config_;
    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::unique_ptr<SslContextManager> ssl_context_manager_;

    SslConnectionHandler connection_handler_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> connections_accepted_{0};
};

} // namespace devhttps::server

#endif // DEVHTTPS_SERVER_SSL_SERVER_HPP
