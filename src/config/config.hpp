/**
 * devhttps - Local HTTPS Development Server
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (DEVHTTPS_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef DEVHTTPS_CONFIG_CONFIG_HPP
#define DEVHTTPS_CONFIG_CONFIG_HPP

#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace devhttps::config {

/**
 * Listener configuration
 */
struct ServerSettings {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{8443};
    std::string document_root{"."};
};

/**
 * Credential bundle provisioning configuration
 */
struct CredentialSettings {
    std::string bundle_file{"server.pem"};      // PEM private key followed by PEM certificate
    std::string openssl_executable{"openssl"};  // Looked up on PATH unless it contains '/'
    bool use_openssl_cli{true};                 // false skips the external tool entirely
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};

    /**
     * Convert to the logger's configuration (level must be valid)
     */
    util::LogConfig to_log_config() const;
};

/**
 * Complete application configuration
 */
struct Config {
    ServerSettings server;
    CredentialSettings credentials;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;
};

/**
 * Configuration manager - merges defaults, file, environment and CLI
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration
     */
    const Config& get_config() const noexcept;

    /**
     * Get the configuration file path (empty if none was given)
     */
    std::filesystem::path get_config_path() const;

    /**
     * Print help message to stdout
     */
    static void print_help(const char* program_name);

private:
    void load_from_file(const std::filesystem::path& path);
    void apply_environment_overrides();
    void apply_cli_overrides(int argc, char* argv[]);

    static std::optional<std::string> get_env(const std::string& name);

    Config config_;
    std::filesystem::path config_path_;
};

/**
 * Parse a TCP port number (1-65535)
 * @throws std::runtime_error naming `what` if the value is not a valid port
 */
std::uint16_t parse_port(const std::string& value, const std::string& what);

/**
 * Parse a boolean flag value (true/false, 1/0, yes/no, on/off)
 * @throws std::runtime_error naming `what` on anything else
 */
bool parse_bool(const std::string& value, const std::string& what);

// JSON serialization support
void to_json(nlohmann::json& j, const ServerSettings& s);
void from_json(const nlohmann::json& j, ServerSettings& s);
void to_json(nlohmann::json& j, const CredentialSettings& c);
void from_json(const nlohmann::json& j, CredentialSettings& c);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace devhttps::config

#endif // DEVHTTPS_CONFIG_CONFIG_HPP
