/**
 * devhttps - Local HTTPS Development Server
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace devhttps::config {

namespace {

/**
 * Match `arg` against option names, accepting both "--opt value" and "--opt=value".
 * Advances i when the value is taken from the next argument.
 */
std::optional<std::string> match_option(const std::string& arg,
                                        std::initializer_list<std::string_view> names,
                                        int& i, int argc, char* argv[]) {
    for (auto name : names) {
        if (arg == name) {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + std::string(name));
            }
            return std::string(argv[++i]);
        }
        std::string prefix = std::string(name) + "=";
        if (arg.starts_with(prefix)) {
            return arg.substr(prefix.size());
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const ServerSettings& s) {
    j = nlohmann::json{
        {"bind_address", s.bind_address},
        {"port", s.port},
        {"document_root", s.document_root}
    };
}

void from_json(const nlohmann::json& j, ServerSettings& s) {
    if (j.contains("bind_address")) j.at("bind_address").get_to(s.bind_address);
    if (j.contains("port")) {
        // Read wide so out-of-range values are rejected instead of wrapping
        const auto& value = j.at("port");
        if (!value.is_number_integer()) {
            throw std::runtime_error("Configuration error: server.port must be an integer");
        }
        auto port = value.get<std::int64_t>();
        if (port < 1 || port > 65535) {
            throw std::runtime_error("Configuration error: server.port must be between 1 and 65535 (got " +
                                     std::to_string(port) + ")");
        }
        s.port = static_cast<std::uint16_t>(port);
    }
    if (j.contains("document_root")) j.at("document_root").get_to(s.document_root);
}

void to_json(nlohmann::json& j, const CredentialSettings& c) {
    j = nlohmann::json{
        {"bundle_file", c.bundle_file},
        {"openssl_executable", c.openssl_executable},
        {"use_openssl_cli", c.use_openssl_cli}
    };
}

void from_json(const nlohmann::json& j, CredentialSettings& c) {
    if (j.contains("bundle_file")) j.at("bundle_file").get_to(c.bundle_file);
    if (j.contains("openssl_executable")) j.at("openssl_executable").get_to(c.openssl_executable);
    if (j.contains("use_openssl_cli")) j.at("use_openssl_cli").get_to(c.use_openssl_cli);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"server", c.server},
        {"credentials", c.credentials},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("server")) j.at("server").get_to(c.server);
    if (j.contains("credentials")) j.at("credentials").get_to(c.credentials);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

util::LogConfig LogSettings::to_log_config() const {
    util::LogConfig config;
    config.level = util::Logger::parse_level(level).value_or(util::LogLevel::Info);
    config.file_path = file;
    config.max_file_size_mb = max_file_size_mb;
    config.max_files = max_files;
    config.enable_console = enable_console;
    config.enable_colors = enable_colors;
    return config;
}

// Config validation
void Config::validate() const {
    if (server.port == 0) {
        throw std::runtime_error("Configuration error: server.port must be non-zero");
    }
    if (server.bind_address.empty()) {
        throw std::runtime_error("Configuration error: server.bind_address cannot be empty");
    }
    if (server.document_root.empty()) {
        throw std::runtime_error("Configuration error: server.document_root cannot be empty");
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(server.document_root, ec)) {
        throw std::runtime_error("Configuration error: server.document_root is not a directory: " +
                                 server.document_root);
    }

    if (credentials.bundle_file.empty()) {
        throw std::runtime_error("Configuration error: credentials.bundle_file cannot be empty");
    }
    if (credentials.use_openssl_cli && credentials.openssl_executable.empty()) {
        throw std::runtime_error(
            "Configuration error: credentials.openssl_executable cannot be empty when use_openssl_cli is set");
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: unknown logging.level: " + logging.level);
    }
    if (!logging.file.empty() && logging.max_file_size_mb == 0) {
        throw std::runtime_error("Configuration error: logging.max_file_size_mb must be non-zero");
    }

    spdlog::debug("Configuration validated successfully");
}

std::uint16_t parse_port(const std::string& value, const std::string& what) {
    std::size_t consumed = 0;
    unsigned long port = 0;
    try {
        port = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + what + " value: " + value);
    }
    if (consumed != value.size() || port == 0 || port > 65535) {
        throw std::runtime_error("Invalid " + what + " value: " + value);
    }
    return static_cast<std::uint16_t>(port);
}

bool parse_bool(const std::string& value, const std::string& what) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::runtime_error("Invalid " + what + " value: " + value);
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    // Start with defaults
    config_ = Config{};
    config_path_.clear();

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if (auto value = match_option(arg, {"--config", "-c"}, i, argc, argv)) {
            config_path_ = *value;
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();

    // CLI overrides have the highest precedence
    apply_cli_overrides(argc, argv);

    config_.validate();

    spdlog::debug("Configuration loaded successfully");
    return true;
}

const Config& ConfigManager::get_config() const noexcept {
    return config_;
}

std::filesystem::path ConfigManager::get_config_path() const {
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "devhttps - Local HTTPS Development Server\n"
              << "\n"
              << "Serves the files of a directory over HTTPS using a self-signed certificate\n"
              << "that is generated on first run.\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message and exit\n"
              << "  -c, --config FILE       Path to JSON configuration file\n"
              << "  -p, --port PORT         HTTPS port (default: 8443)\n"
              << "  -b, --bind ADDRESS      Bind address (default: 0.0.0.0)\n"
              << "  -d, --directory DIR     Document root (default: current directory)\n"
              << "  --cert FILE             Credential bundle, PEM key + certificate (default: server.pem)\n"
              << "  --openssl PATH          openssl executable used to generate the bundle (default: openssl)\n"
              << "  --no-openssl            Do not run the openssl tool, generate in-process\n"
              << "  -l, --log-level LEVEL   Log level (trace/debug/info/warn/error/critical/off)\n"
              << "  --log-file FILE         Also write logs to FILE (rotated)\n"
              << "\n"
              << "Environment Variables:\n"
              << "  DEVHTTPS_CONFIG         Path to configuration file\n"
              << "  DEVHTTPS_PORT           HTTPS port\n"
              << "  DEVHTTPS_BIND           Bind address\n"
              << "  DEVHTTPS_ROOT           Document root\n"
              << "  DEVHTTPS_CERT           Credential bundle path\n"
              << "  DEVHTTPS_OPENSSL        openssl executable\n"
              << "  DEVHTTPS_USE_OPENSSL    Use the openssl tool (true/false)\n"
              << "  DEVHTTPS_LOG_LEVEL      Log level\n"
              << "  DEVHTTPS_LOG_FILE       Log file path (stdout if not set)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"server\": {\n"
              << "      \"bind_address\": \"0.0.0.0\",\n"
              << "      \"port\": 8443,\n"
              << "      \"document_root\": \".\"\n"
              << "    },\n"
              << "    \"credentials\": {\n"
              << "      \"bundle_file\": \"server.pem\",\n"
              << "      \"openssl_executable\": \"openssl\",\n"
              << "      \"use_openssl_cli\": true\n"
              << "    },\n"
              << "    \"logging\": {\n"
              << "      \"level\": \"info\",\n"
              << "      \"file\": \"\",\n"
              << "      \"max_file_size_mb\": 100,\n"
              << "      \"max_files\": 5,\n"
              << "      \"enable_console\": true,\n"
              << "      \"enable_colors\": true\n"
              << "    }\n"
              << "  }\n"
              << "\n"
              << "Delete the credential bundle to have a new certificate generated on next start.\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        spdlog::debug("Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    // Check for config file path from environment
    if (config_path_.empty()) {
        if (auto env = get_env("DEVHTTPS_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    // Server settings
    if (auto env = get_env("DEVHTTPS_PORT")) {
        config_.server.port = parse_port(*env, "DEVHTTPS_PORT");
        spdlog::debug("Applied DEVHTTPS_PORT={}", config_.server.port);
    }

    if (auto env = get_env("DEVHTTPS_BIND")) {
        config_.server.bind_address = *env;
        spdlog::debug("Applied DEVHTTPS_BIND={}", config_.server.bind_address);
    }

    if (auto env = get_env("DEVHTTPS_ROOT")) {
        config_.server.document_root = *env;
        spdlog::debug("Applied DEVHTTPS_ROOT={}", config_.server.document_root);
    }

    // Credential settings
    if (auto env = get_env("DEVHTTPS_CERT")) {
        config_.credentials.bundle_file = *env;
        spdlog::debug("Applied DEVHTTPS_CERT={}", config_.credentials.bundle_file);
    }

    if (auto env = get_env("DEVHTTPS_OPENSSL")) {
        config_.credentials.openssl_executable = *env;
        spdlog::debug("Applied DEVHTTPS_OPENSSL={}", config_.credentials.openssl_executable);
    }

    if (auto env = get_env("DEVHTTPS_USE_OPENSSL")) {
        config_.credentials.use_openssl_cli = parse_bool(*env, "DEVHTTPS_USE_OPENSSL");
        spdlog::debug("Applied DEVHTTPS_USE_OPENSSL={}", config_.credentials.use_openssl_cli);
    }

    // Logging settings
    if (auto env = get_env("DEVHTTPS_LOG_LEVEL")) {
        config_.logging.level = *env;
        spdlog::debug("Applied DEVHTTPS_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("DEVHTTPS_LOG_FILE")) {
        config_.logging.file = *env;
        spdlog::debug("Applied DEVHTTPS_LOG_FILE={}", config_.logging.file);
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Already handled in the first pass
        if (match_option(arg, {"--config", "-c"}, i, argc, argv)) continue;

        if (auto value = match_option(arg, {"--port", "-p"}, i, argc, argv)) {
            config_.server.port = parse_port(*value, "--port");
        } else if (auto value = match_option(arg, {"--bind", "-b"}, i, argc, argv)) {
            config_.server.bind_address = *value;
        } else if (auto value = match_option(arg, {"--directory", "-d"}, i, argc, argv)) {
            config_.server.document_root = *value;
        } else if (auto value = match_option(arg, {"--cert"}, i, argc, argv)) {
            config_.credentials.bundle_file = *value;
        } else if (auto value = match_option(arg, {"--openssl"}, i, argc, argv)) {
            config_.credentials.openssl_executable = *value;
            config_.credentials.use_openssl_cli = true;
        } else if (arg == "--no-openssl") {
            config_.credentials.use_openssl_cli = false;
        } else if (auto value = match_option(arg, {"--log-level", "-l"}, i, argc, argv)) {
            config_.logging.level = *value;
        } else if (auto value = match_option(arg, {"--log-file"}, i, argc, argv)) {
            config_.logging.file = *value;
        } else {
            spdlog::warn("Ignoring unknown argument: {}", arg);
        }
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace devhttps::config
