/**
 * devhttps - Local HTTPS Development Server
 * Static file handler - serves a document root over GET/HEAD
 *
 * Behaves like a typical development file server:
 * - index.html / index.htm for directories, otherwise a generated listing
 * - 301 redirect for directories requested without a trailing slash
 * - Content-Type from the file extension
 * - Requests that would escape the document root are refused
 */

#ifndef DEVHTTPS_SERVER_STATIC_FILE_HANDLER_HPP
#define DEVHTTPS_SERVER_STATIC_FILE_HANDLER_HPP

#include "server/http_types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devhttps::server {

/**
 * Static file handler configuration
 */
struct StaticFileConfig {
    std::filesystem::path document_root{"."};
    std::vector<std::string> index_files{"index.html", "index.htm"};
    bool directory_listing{true};
};

class StaticFileHandler {
public:
    /**
     * @throws std::runtime_error if the document root is not a directory
     */
    explicit StaticFileHandler(StaticFileConfig config);

    /**
     * Handle one request (usable as a RequestHandler)
     */
    HttpResponse operator()(const HttpRequest& req) const;

    const std::filesystem::path& document_root() const noexcept { return config_.document_root; }

    /**
     * Map a decoded URL path onto the document root
     * @return nullopt if the path would leave the document root
     */
    std::optional<std::filesystem::path> resolve(std::string_view url_path) const;

    /**
     * Content type for a file name, by extension (case-insensitive)
     */
    static std::string_view mime_type(std::string_view path);

    /**
     * Decode %XX escapes; nullopt on malformed escapes or an embedded NUL
     */
    static std::optional<std::string> percent_decode(std::string_view text);

    /**
     * Escape a path for use in an href, leaving '/' and unreserved characters
     */
    static std::string percent_encode_path(std::string_view text);

    static std::string html_escape(std::string_view text);

private:
    HttpResponse serve_file(const std::filesystem::path& file, bool head_only) const;
    HttpResponse serve_directory(const std::filesystem::path& dir,
                                 const std::string& url_path, bool head_only) const;

    StaticFileConfig config_;
};

/**
 * Simple HTML error page response
 */
HttpResponse make_error_response(http::status status, std::string_view message);

} // namespace devhttps::server

#endif // DEVHTTPS_SERVER_STATIC_FILE_HANDLER_HPP
