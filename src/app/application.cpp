/**
 * devhttps - Local HTTPS Development Server
 * Application implementation
 */

#include "app/application.hpp"
#include "config/config.hpp"
#include "credentials/certificate_info.hpp"
#include "credentials/provisioner.hpp"
#include "server/ssl_connection.hpp"
#include "server/ssl_server.hpp"
#include "server/startup_banner.hpp"
#include "server/static_file_handler.hpp"
#include "util/logger.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <memory>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>

namespace devhttps::app {

namespace asio = boost::asio;

int run(int argc, char* argv[], std::ostream& err) {
    try {
        // Load configuration
        config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        const auto& config = config_manager.get_config();
        util::Logger::init(config.logging.to_log_config());

        spdlog::info("devhttps v0.1.0");
        spdlog::debug("Configuration: bind={}, port={}, root={}, bundle={}",
                      config.server.bind_address, config.server.port,
                      config.server.document_root, config.credentials.bundle_file);

        // Make sure a key + certificate bundle exists before building the TLS context
        credentials::CredentialProvisioner provisioner(
            config.credentials.bundle_file,
            credentials::make_default_strategies(config.credentials));

        auto report = provisioner.ensure();
        if (!report.ok()) {
            spdlog::error("Could not create TLS credentials at {}: {} ({})",
                          config.credentials.bundle_file,
                          credentials::to_string(report.outcome.status),
                          report.outcome.detail);
            err << credentials::remediation_guidance(provisioner.bundle_path()) << std::endl;
            util::Logger::instance().flush();
            return 1;
        }

        try {
            auto info = credentials::read_certificate_info(provisioner.bundle_path());
            spdlog::info("Certificate: CN={} valid until {}",
                         info.common_name,
                         credentials::format_utc(info.not_after));
            if (!info.is_valid_at(std::chrono::system_clock::now())) {
                spdlog::warn("Certificate in {} is not currently valid; delete it to generate a new one",
                             provisioner.bundle_path().string());
            }
        } catch (const std::exception& e) {
            // The TLS context below reports unusable bundles
            spdlog::debug("Could not inspect certificate: {}", e.what());
        }

        server::StaticFileConfig files_config;
        files_config.document_root = config.server.document_root;
        auto file_handler = std::make_shared<server::StaticFileHandler>(files_config);

        server::SslServerConfig server_config;
        server_config.bind_address = config.server.bind_address;
        server_config.port = config.server.port;
        server_config.ssl = server::make_bundle_ssl_config(provisioner.bundle_path());

        server::SslServer https_server(server_config);

        server::RequestHandler handler =
            [file_handler](const server::HttpRequest& req) {
                return (*file_handler)(req);
            };

        https_server.start([handler](asio::ip::tcp::socket socket, asio::ssl::context& ssl_ctx) {
            server::handle_ssl_connection(std::move(socket), ssl_ctx, handler);
        });

        spdlog::info("Document root: {}", file_handler->document_root().string());

        std::optional<std::string> lan_address;
        if (server::is_wildcard_address(config.server.bind_address)) {
            lan_address = server::detect_lan_address();
        }
        for (const auto& line : server::startup_lines(
                 config.server.bind_address, https_server.get_port(), lan_address)) {
            spdlog::info("{}", line);
        }

        // SIGINT/SIGTERM request a stop; the server drains nothing and returns
        std::stop_source stop_source;
        asio::signal_set signals(https_server.get_io_context(), SIGINT, SIGTERM);
        signals.async_wait([&stop_source](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {} - shutting down", signal_number);
            stop_source.request_stop();
        });

        https_server.run(stop_source.get_token());

        spdlog::info("devhttps shutdown complete");
        util::Logger::instance().flush();
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

} // namespace devhttps::app
