/**
 * devhttps - Local HTTPS Development Server
 * Logger - Structured logging with spdlog
 *
 * Provides:
 * - Leveled logging (TRACE .. CRITICAL) with component tags
 * - Colored console output and optional rotating log file
 * - Access log: client, method, path, status, size, latency
 * - Log level parsing for config/environment/CLI values
 */

#ifndef DEVHTTPS_UTIL_LOGGER_HPP
#define DEVHTTPS_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace devhttps::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for stdout only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};         // Log to stdout
    bool enable_colors{true};          // Colored console output
};

/**
 * Access log entry for one served HTTPS request
 */
struct AccessLogEntry {
    std::string client_ip;
    std::string method;
    std::string path;
    int status_code{0};
    std::size_t response_size{0};
    std::chrono::milliseconds latency{0};
};

/**
 * Logger class - centralized logging with component tagging
 *
 * Thread-safe singleton that owns the application-wide spdlog loggers.
 * init() installs the main logger as the spdlog default logger, so plain
 * spdlog::info() calls elsewhere go through the configured sinks.
 */
class Logger {
public:
    /**
     * Initialize the logger with configuration
     * Only the first call (or the first instance() call) configures the sinks.
     */
    static void init(const LogConfig& config);

    /**
     * Initialize with default configuration (stdout, INFO level)
     */
    static void init_default();

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    /**
     * Set the global log level
     */
    void set_level(LogLevel level);

    /**
     * Get the current log level
     */
    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    /**
     * Convert log level to string
     */
    static std::string_view level_to_string(LogLevel level);

    // Component-tagged logging methods
    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Log an HTTP access entry (dedicated access log format)
     */
    void access(const AccessLogEntry& entry);

    /**
     * Flush all sinks
     */
    void flush();

    /**
     * Shutdown and flush all logs
     */
    void shutdown();

private:
    Logger() = default;

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    template<typename... Args>
    void log(LogLevel level, std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_) return;

        auto msg = fmt::format(fmt, std::forward<Args>(args)...);
        auto full_msg = fmt::format("[{}] {}", component, msg);

        switch (level) {
            case LogLevel::Trace:    logger_->trace(full_msg); break;
            case LogLevel::Debug:    logger_->debug(full_msg); break;
            case LogLevel::Info:     logger_->info(full_msg); break;
            case LogLevel::Warn:     logger_->warn(full_msg); break;
            case LogLevel::Error:    logger_->error(full_msg); break;
            case LogLevel::Critical: logger_->critical(full_msg); break;
            default: break;
        }
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> access_logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

// Convenience macros for logging with automatic component tagging
#define DEVHTTPS_LOG_TRACE(component, ...) \
    ::devhttps::util::Logger::instance().trace(component, __VA_ARGS__)
#define DEVHTTPS_LOG_DEBUG(component, ...) \
    ::devhttps::util::Logger::instance().debug(component, __VA_ARGS__)
#define DEVHTTPS_LOG_INFO(component, ...) \
    ::devhttps::util::Logger::instance().info(component, __VA_ARGS__)
#define DEVHTTPS_LOG_WARN(component, ...) \
    ::devhttps::util::Logger::instance().warn(component, __VA_ARGS__)
#define DEVHTTPS_LOG_ERROR(component, ...) \
    ::devhttps::util::Logger::instance().error(component, __VA_ARGS__)
#define DEVHTTPS_LOG_CRITICAL(component, ...) \
    ::devhttps::util::Logger::instance().critical(component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Credentials = "credentials";
    constexpr std::string_view Files = "files";
}

} // namespace devhttps::util

#endif // DEVHTTPS_UTIL_LOGGER_HPP
