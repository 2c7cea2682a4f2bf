/**
 * devhttps - Local HTTPS Development Server
 * SSL Server implementation - HTTPS acceptor with TLS termination
 */

#include "server/ssl_server.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace devhttps::server {

SslServer::SslServer(const SslServerConfig& config)
    : config_(config)
    , io_context_(1)
    , acceptor_(io_context_)
{
    spdlog::debug("SSL Server: Initializing on {}:{}",
                  config_.bind_address, config_.port);

    // Initialize SSL context
    try {
        ssl_context_manager_ = std::make_unique<SslContextManager>(config_.ssl);
        spdlog::debug("SSL Server: Certificate loaded - Subject: {}",
                      ssl_context_manager_->get_certificate_subject());
        spdlog::debug("SSL Server: Certificate expires: {}",
                      ssl_context_manager_->get_certificate_expiry());
    } catch (const std::exception& e) {
        spdlog::error("SSL Server: Failed to initialize SSL context: {}", e.what());
        throw;
    }
}

SslServer::~SslServer() {
    stop();
}

void SslServer::start(SslConnectionHandler handler) {
    if (running_.exchange(true)) {
        spdlog::warn("SSL Server: Already running, ignoring start request");
        return;
    }

    connection_handler_ = std::move(handler);

    boost::system::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("Invalid bind address '" + config_.bind_address + "': " + ec.message());
    }
    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        spdlog::error("SSL Server: Failed to open acceptor: {}", ec.message());
        running_ = false;
        throw std::runtime_error("Failed to open SSL acceptor: " + ec.message());
    }

    // Set socket options
    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        spdlog::warn("SSL Server: Failed to set reuse_address: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
        spdlog::error("SSL Server: Failed to bind to {}:{}: {}",
                      config_.bind_address, config_.port, ec.message());
        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        running_ = false;
        throw std::runtime_error("Failed to bind " + config_.bind_address + ":" +
                                 std::to_string(config_.port) + ": " + ec.message());
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("SSL Server: Failed to listen: {}", ec.message());
        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        running_ = false;
        throw std::runtime_error("Failed to listen on SSL server: " + ec.message());
    }

    spdlog::debug("SSL Server: Listening on {}:{} (HTTPS)",
                  config_.bind_address, get_port());

    // Start accepting connections
    do_accept();
}

void SslServer::run(std::stop_token stop_token) {
    // stop() touches the acceptor, so it must run on the io_context thread
    std::stop_callback on_stop(stop_token, [this] {
        asio::post(io_context_, [this] { stop(); });
    });

    while (running_ && !stop_token.stop_requested()) {
        try {
            io_context_.run();
            break;  // Normal exit when stopped or out of work
        } catch (const std::exception& e) {
            spdlog::error("SSL Server: Exception in event loop: {}", e.what());
        }
    }
}

void SslServer::stop() {
    if (!running_.exchange(false)) {
        return;  // Already stopped
    }

    spdlog::info("SSL Server: Stopping...");

    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::warn("SSL Server: Error closing acceptor: {}", ec.message());
    }

    io_context_.stop();

    spdlog::info("SSL Server: Stopped after {} connection(s)", connections_accepted_.load());
}

bool SslServer::is_running() const noexcept {
    return running_.load();
}

std::uint16_t SslServer::get_port() const noexcept {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    if (ec) {
        return config_.port;
    }
    return endpoint.port();
}

asio::io_context& SslServer::get_io_context() noexcept {
    return io_context_;
}

std::uint64_t SslServer::connections_accepted() const noexcept {
    return connections_accepted_.load();
}

void SslServer::do_accept() {
    if (!running_) {
        return;
    }

    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!running_) {
                return;
            }

            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::error("SSL Server: Accept error: {}", ec.message());
                }
                // Continue accepting unless stopped
                if (running_ && ec != asio::error::operation_aborted) {
                    do_accept();
                }
                return;
            }

            ++connections_accepted_;
            boost::system::error_code ep_ec;
            auto remote = socket.remote_endpoint(ep_ec);
            if (!ep_ec) {
                spdlog::debug("SSL Server: Connection #{} accepted from {}:{} (starting TLS handshake)",
                              connections_accepted_.load(),
                              remote.address().to_string(),
                              remote.port());
            } else {
                spdlog::debug("SSL Server: Connection #{} accepted (starting TLS handshake)",
                              connections_accepted_.load());
            }

            // Invoke the connection handler with SSL context
            if (connection_handler_) {
                try {
                    connection_handler_(std::move(socket), ssl_context_manager_->get_context());
                } catch (const std::exception& e) {
                    spdlog::error("SSL Server: Connection handler exception: {}", e.what());
                }
            }

            // Continue accepting
            do_accept();
        }
    );
}

} // namespace devhttps::server
