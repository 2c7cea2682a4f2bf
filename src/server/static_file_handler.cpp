/**
 * devhttps - Local HTTPS Development Server
 * Static file handler implementation
 */

#include "server/static_file_handler.hpp"
#include "util/logger.hpp"

#include <boost/filesystem/operations.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace devhttps::server {

namespace {

std::string_view get_extension(std::string_view path) noexcept {
    auto const slash = path.find_last_of('/');
    auto const pos = path.rfind('.');
    if (pos == std::string_view::npos ||
        (slash != std::string_view::npos && pos < slash)) {
        return {};
    }
    return path.substr(pos);
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * HTTP-date (RFC 7231), e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
 */
std::string http_date(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);

    static constexpr const char* days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                             "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf);
}

} // anonymous namespace

HttpResponse make_error_response(http::status status, std::string_view message) {
    auto code = static_cast<unsigned>(status);
    auto reason = http::obsolete_reason(status);

    std::ostringstream body;
    body << "<!DOCTYPE html>\n"
         << "<html>\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>Error " << code << "</title>\n</head>\n<body>\n"
         << "<h1>" << code << " " << reason << "</h1>\n"
         << "<p>" << StaticFileHandler::html_escape(message) << "</p>\n"
         << "</body>\n</html>\n";

    HttpResponse response;
    response.status = status;
    response.content_type = "text/html; charset=utf-8";
    response.body = body.str();
    return response;
}

StaticFileHandler::StaticFileHandler(StaticFileConfig config)
    : config_(std::move(config))
{
    std::error_code ec;
    auto root = std::filesystem::canonical(config_.document_root, ec);
    if (ec || !std::filesystem::is_directory(root, ec)) {
        throw std::runtime_error("Document root is not a directory: " +
                                 config_.document_root.string());
    }
    config_.document_root = root;
    spdlog::debug("Static files: serving {}", root.string());
}

std::string_view StaticFileHandler::mime_type(std::string_view path) {
    auto ext = get_extension(path);
    if (iequals(ext, ".htm"))   return "text/html; charset=utf-8";
    if (iequals(ext, ".html"))  return "text/html; charset=utf-8";
    if (iequals(ext, ".css"))   return "text/css; charset=utf-8";
    if (iequals(ext, ".txt"))   return "text/plain; charset=utf-8";
    if (iequals(ext, ".md"))    return "text/markdown; charset=utf-8";
    if (iequals(ext, ".csv"))   return "text/csv; charset=utf-8";
    if (iequals(ext, ".js"))    return "text/javascript; charset=utf-8";
    if (iequals(ext, ".mjs"))   return "text/javascript; charset=utf-8";
    if (iequals(ext, ".json"))  return "application/json";
    if (iequals(ext, ".map"))   return "application/json";
    if (iequals(ext, ".webmanifest")) return "application/manifest+json";
    if (iequals(ext, ".xml"))   return "application/xml";
    if (iequals(ext, ".wasm"))  return "application/wasm";
    if (iequals(ext, ".pdf"))   return "application/pdf";
    if (iequals(ext, ".zip"))   return "application/zip";
    if (iequals(ext, ".png"))   return "image/png";
    if (iequals(ext, ".jpe"))   return "image/jpeg";
    if (iequals(ext, ".jpeg"))  return "image/jpeg";
    if (iequals(ext, ".jpg"))   return "image/jpeg";
    if (iequals(ext, ".gif"))   return "image/gif";
    if (iequals(ext, ".bmp"))   return "image/bmp";
    if (iequals(ext, ".webp"))  return "image/webp";
    if (iequals(ext, ".ico"))   return "image/vnd.microsoft.icon";
    if (iequals(ext, ".tiff"))  return "image/tiff";
    if (iequals(ext, ".tif"))   return "image/tiff";
    if (iequals(ext, ".svg"))   return "image/svg+xml";
    if (iequals(ext, ".svgz"))  return "image/svg+xml";
    if (iequals(ext, ".mp3"))   return "audio/mpeg";
    if (iequals(ext, ".wav"))   return "audio/wav";
    if (iequals(ext, ".mp4"))   return "video/mp4";
    if (iequals(ext, ".webm"))  return "video/webm";
    if (iequals(ext, ".woff"))  return "font/woff";
    if (iequals(ext, ".woff2")) return "font/woff2";
    if (iequals(ext, ".ttf"))   return "font/ttf";
    if (iequals(ext, ".otf"))   return "font/otf";
    return "application/octet-stream";
}

std::optional<std::string> StaticFileHandler::percent_decode(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%') {
            if (i + 2 >= text.size()) {
                return std::nullopt;
            }
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            c = static_cast<char>((hi << 4) | lo);
            i += 2;
        }
        if (c == '\0') {
            return std::nullopt;
        }
        result.push_back(c);
    }

    return result;
}

std::string StaticFileHandler::percent_encode_path(std::string_view text) {
    static constexpr char hex_chars[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(text.size());
    for (unsigned char c : text) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
        if (unreserved) {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back('%');
            result.push_back(hex_chars[c >> 4]);
            result.push_back(hex_chars[c & 0xF]);
        }
    }
    return result;
}

std::string StaticFileHandler::html_escape(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  result += "&amp;"; break;
            case '<':  result += "&lt;"; break;
            case '>':  result += "&gt;"; break;
            case '"':  result += "&quot;"; break;
            case '\'': result += "&#x27;"; break;
            default:   result.push_back(c); break;
        }
    }
    return result;
}

std::optional<std::filesystem::path> StaticFileHandler::resolve(std::string_view url_path) const {
    std::vector<std::string> segments;

    std::size_t start = 0;
    while (start <= url_path.size()) {
        auto end = url_path.find('/', start);
        if (end == std::string_view::npos) {
            end = url_path.size();
        }
        std::string_view segment = url_path.substr(start, end - start);
        start = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (segments.empty()) {
                return std::nullopt;  // Above the document root
            }
            segments.pop_back();
            continue;
        }
        if (segment.find('\\') != std::string_view::npos) {
            return std::nullopt;
        }
        segments.emplace_back(segment);
    }

    std::filesystem::path result = config_.document_root;
    for (const auto& segment : segments) {
        result /= segment;
    }
    return result;
}

HttpResponse StaticFileHandler::operator()(const HttpRequest& req) const {
    if (req.method != http::verb::get && req.method != http::verb::head) {
        auto response = make_error_response(http::status::method_not_allowed,
                                             "Only GET and HEAD are supported.");
        response.headers.emplace_back("Allow", "GET, HEAD");
        return response;
    }
    bool head_only = req.method == http::verb::head;

    // Split off query and fragment
    std::string_view target = req.target;
    std::string_view query;
    if (auto pos = target.find('#'); pos != std::string_view::npos) {
        target = target.substr(0, pos);
    }
    if (auto pos = target.find('?'); pos != std::string_view::npos) {
        query = target.substr(pos);
        target = target.substr(0, pos);
    }

    if (target.empty() || target.front() != '/') {
        return make_error_response(http::status::bad_request, "Request target must be an absolute path.");
    }

    auto url_path = percent_decode(target);
    if (!url_path) {
        return make_error_response(http::status::bad_request, "Malformed percent-encoding in path.");
    }

    auto path = resolve(*url_path);
    if (!path) {
        DEVHTTPS_LOG_WARN(util::log_component::Files, "Refused path outside document root: {} (from {})",
                          req.target, req.client_ip);
        return make_error_response(http::status::forbidden, "Path is outside the served directory.");
    }

    std::error_code ec;
    auto status = std::filesystem::status(*path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return make_error_response(http::status::not_found, "File not found.");
    }

    if (std::filesystem::is_directory(status)) {
        if (url_path->back() != '/') {
            HttpResponse response;
            response.status = http::status::moved_permanently;
            response.content_type = "text/html; charset=utf-8";
            response.headers.emplace_back(
                "Location", percent_encode_path(*url_path + "/") + std::string(query));
            return response;
        }
        return serve_directory(*path, *url_path, head_only);
    }

    // "/file.txt/" names a directory that does not exist
    if (url_path->back() == '/') {
        return make_error_response(http::status::not_found, "File not found.");
    }

    if (!std::filesystem::is_regular_file(status)) {
        return make_error_response(http::status::forbidden, "Not a regular file.");
    }

    return serve_file(*path, head_only);
}

HttpResponse StaticFileHandler::serve_file(const std::filesystem::path& file, bool head_only) const {
    std::error_code ec;
    auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        return make_error_response(http::status::forbidden, "File is not readable.");
    }

    HttpResponse response;
    response.status = http::status::ok;
    response.content_type = std::string(mime_type(file.filename().string()));
    response.headers.emplace_back("Cache-Control", "no-cache");

    boost::system::error_code bec;
    std::time_t mtime = boost::filesystem::last_write_time(file.string(), bec);
    if (!bec) {
        response.headers.emplace_back("Last-Modified", http_date(mtime));
    }

    if (head_only) {
        response.content_length = size;
        return response;
    }

    // Streamed by the connection
    response.file = file;
    return response;
}

HttpResponse StaticFileHandler::serve_directory(const std::filesystem::path& dir,
                                                const std::string& url_path,
                                                bool head_only) const {
    std::error_code ec;
    for (const auto& index : config_.index_files) {
        auto candidate = dir / index;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return serve_file(candidate, head_only);
        }
    }

    if (!config_.directory_listing) {
        return make_error_response(http::status::forbidden, "Directory listing is disabled.");
    }

    std::vector<std::string> names;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return make_error_response(http::status::forbidden, "No permission to list directory.");
    }
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            name += "/";
        }
        names.push_back(std::move(name));
    }
    std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](char x, char y) { return std::tolower(static_cast<unsigned char>(x)) <
                                        std::tolower(static_cast<unsigned char>(y)); });
    });

    std::string title = "Directory listing for " + html_escape(url_path);
    std::ostringstream body;
    body << "<!DOCTYPE html>\n"
         << "<html>\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>" << title << "</title>\n</head>\n<body>\n"
         << "<h1>" << title << "</h1>\n<hr>\n<ul>\n";
    for (const auto& name : names) {
        body << "<li><a href=\"" << html_escape(percent_encode_path(name)) << "\">"
             << html_escape(name) << "</a></li>\n";
    }
    body << "</ul>\n<hr>\n</body>\n</html>\n";

    HttpResponse response;
    response.status = http::status::ok;
    response.content_type = "text/html; charset=utf-8";
    response.body = body.str();
    if (head_only) {
        response.content_length = response.body.size();
        response.body.clear();
    }
    return response;
}

} // namespace devhttps::server
