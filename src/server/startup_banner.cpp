/**
 * devhttps - Local HTTPS Development Server
 * Startup banner implementation
 */

#include "server/startup_banner.hpp"

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

namespace devhttps::server {

namespace asio = boost::asio;

namespace {

std::string url_host(const std::string& address) {
    boost::system::error_code ec;
    auto parsed = asio::ip::make_address(address, ec);
    if (!ec && parsed.is_v6()) {
        return "[" + address + "]";
    }
    return address;
}

} // anonymous namespace

bool is_wildcard_address(const std::string& address) {
    return address == "0.0.0.0" || address == "::" || address == "[::]";
}

std::vector<std::string> startup_lines(const std::string& bind_address,
                                       std::uint16_t port,
                                       const std::optional<std::string>& lan_address) {
    std::vector<std::string> lines;
    const auto host = url_host(bind_address);

    lines.push_back(fmt::format("Serving HTTPS on {}:{} (https://{}:{}/)",
                                bind_address, port, host, port));
    lines.push_back(fmt::format("Local:   https://localhost:{}/", port));

    std::optional<std::string> network_host;
    if (!is_wildcard_address(bind_address)) {
        if (bind_address != "127.0.0.1" && bind_address != "::1" && bind_address != "localhost") {
            network_host = host;
        }
    } else if (lan_address && !lan_address->empty()) {
        network_host = url_host(*lan_address);
    }
    if (network_host) {
        lines.push_back(fmt::format("Network: https://{}:{}/", *network_host, port));
    }

    lines.emplace_back("The certificate is self-signed, so browsers will show a security warning.");
    lines.emplace_back("Choose \"Advanced\" and proceed to the site, or add the certificate to your trust store.");
    lines.emplace_back("Press Ctrl+C to stop");
    return lines;
}

std::optional<std::string> detect_lan_address() {
    asio::io_context io_context;
    asio::ip::udp::socket socket(io_context);
    boost::system::error_code ec;

    socket.open(asio::ip::udp::v4(), ec);
    if (ec) {
        return std::nullopt;
    }

    // No datagram is sent; connect() only selects the outbound route
    socket.connect({asio::ip::make_address_v4("8.8.8.8"), 80}, ec);
    if (ec) {
        spdlog::debug("LAN address detection failed: {}", ec.message());
        return std::nullopt;
    }

    auto local = socket.local_endpoint(ec);
    if (ec || local.address().is_unspecified() || local.address().is_loopback()) {
        return std::nullopt;
    }
    return local.address().to_string();
}

} // namespace devhttps::server
