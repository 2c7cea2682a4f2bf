/**
 * devhttps - Local HTTPS Development Server
 * Startup banner - URLs and notices printed once the listener is up
 */

#ifndef DEVHTTPS_SERVER_STARTUP_BANNER_HPP
#define DEVHTTPS_SERVER_STARTUP_BANNER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devhttps::server {

/**
 * Lines shown at startup, in order
 * @param bind_address Address the listener is bound to
 * @param port Bound port
 * @param lan_address Detected LAN address, used when bound to a wildcard address
 */
std::vector<std::string> startup_lines(const std::string& bind_address,
                                       std::uint16_t port,
                                       const std::optional<std::string>& lan_address);

/**
 * Primary outbound IPv4 address of this host
 *
 * Connects a UDP socket (nothing is sent) and reads back its local endpoint.
 */
std::optional<std::string> detect_lan_address();

bool is_wildcard_address(const std::string& address);

} // namespace devhttps::server

#endif // DEVHTTPS_SERVER_STARTUP_BANNER_HPP
