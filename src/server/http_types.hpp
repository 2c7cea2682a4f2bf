/**
 * devhttps - Local HTTPS Development Server
 * HTTP request/response types shared by connections and handlers
 */

#ifndef DEVHTTPS_SERVER_HTTP_TYPES_HPP
#define DEVHTTPS_SERVER_HTTP_TYPES_HPP

#include <boost/beast/http.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace devhttps::server {

namespace beast = boost::beast;
namespace http = beast::http;

/**
 * Parsed HTTP request information
 */
struct HttpRequest {
    http::verb method{http::verb::unknown};
    std::string method_string;  // As sent, for logging unknown verbs
    std::string target;
    unsigned version{11};  // HTTP/1.1 = 11

    // Client connection info
    std::string client_ip;
    std::uint16_t client_port{0};
};

/**
 * HTTP response structure
 */
struct HttpResponse {
    http::status status{http::status::ok};
    std::string content_type{"text/plain"};
    std::string body;

    // When set, the connection streams this file as the body and ignores `body`
    std::filesystem::path file{};

    // Set when the body is omitted but its length must still be announced (HEAD)
    std::optional<std::uint64_t> content_length{};

    // Additional headers (optional)
    std::vector<std::pair<std::string, std::string>> headers{};
};

/**
 * Request handler callback type
 */
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

} // namespace devhttps::server

#endif // DEVHTTPS_SERVER_HTTP_TYPES_HPP
