#include "utils.hpp"

#include "config/config.hpp"

namespace devhttps::test
{
    using config::ConfigManager;

    namespace
    {
        // Clears every DEVHTTPS_* variable the loader reads
        struct CleanEnv
        {
            ScopedEnv config{"DEVHTTPS_CONFIG", std::nullopt};
            ScopedEnv port{"DEVHTTPS_PORT", std::nullopt};
            ScopedEnv bind{"DEVHTTPS_BIND", std::nullopt};
            ScopedEnv root{"DEVHTTPS_ROOT", std::nullopt};
            ScopedEnv cert{"DEVHTTPS_CERT", std::nullopt};
            ScopedEnv openssl{"DEVHTTPS_OPENSSL", std::nullopt};
            ScopedEnv use_openssl{"DEVHTTPS_USE_OPENSSL", std::nullopt};
            ScopedEnv log_level{"DEVHTTPS_LOG_LEVEL", std::nullopt};
            ScopedEnv log_file{"DEVHTTPS_LOG_FILE", std::nullopt};
        };
    }  // namespace

    TEST_CASE("Config: defaults", "[config]")
    {
        CleanEnv env;
        ConfigManager manager;
        Args args{};

        REQUIRE(manager.load(args.argc(), args.argv()));

        const auto& cfg = manager.get_config();
        CHECK(cfg.server.bind_address == "0.0.0.0");
        CHECK(cfg.server.port == 8443);
        CHECK(cfg.server.document_root == ".");
        CHECK(cfg.credentials.bundle_file == "server.pem");
        CHECK(cfg.credentials.openssl_executable == "openssl");
        CHECK(cfg.credentials.use_openssl_cli);
        CHECK(cfg.logging.level == "info");
        CHECK(cfg.logging.file.empty());
        CHECK(manager.get_config_path().empty());
    }

    TEST_CASE("Config: --help stops loading", "[config]")
    {
        CleanEnv env;
        ConfigManager manager;
        Args args{"--port", "9000", "--help"};

        CHECK_FALSE(manager.load(args.argc(), args.argv()));
    }

    TEST_CASE("Config: command-line options", "[config]")
    {
        CleanEnv env;
        TempDir dir;

        SECTION("separate values")
        {
            ConfigManager manager;
            Args args{"-p", "9443", "-b", "127.0.0.1", "-d", dir.path().string(),
                      "--cert", "dev.pem", "--no-openssl", "-l", "debug", "--log-file", "dev.log"};
            REQUIRE(manager.load(args.argc(), args.argv()));

            const auto& cfg = manager.get_config();
            CHECK(cfg.server.port == 9443);
            CHECK(cfg.server.bind_address == "127.0.0.1");
            CHECK(cfg.server.document_root == dir.path().string());
            CHECK(cfg.credentials.bundle_file == "dev.pem");
            CHECK_FALSE(cfg.credentials.use_openssl_cli);
            CHECK(cfg.logging.level == "debug");
            CHECK(cfg.logging.file == "dev.log");
        }

        SECTION("--opt=value form")
        {
            ConfigManager manager;
            Args args{"--port=10443", "--bind=::1", "--directory=" + dir.path().string(),
                      "--openssl=/opt/ssl/bin/openssl"};
            REQUIRE(manager.load(args.argc(), args.argv()));

            const auto& cfg = manager.get_config();
            CHECK(cfg.server.port == 10443);
            CHECK(cfg.server.bind_address == "::1");
            CHECK(cfg.credentials.openssl_executable == "/opt/ssl/bin/openssl");
            CHECK(cfg.credentials.use_openssl_cli);
        }

        SECTION("unknown arguments are ignored")
        {
            ConfigManager manager;
            Args args{"--frobnicate", "-p", "8000"};
            REQUIRE(manager.load(args.argc(), args.argv()));
            CHECK(manager.get_config().server.port == 8000);
        }
    }

    TEST_CASE("Config: JSON file", "[config]")
    {
        CleanEnv env;
        TempDir dir;
        auto file = dir / "devhttps.json";
        write_file(file, R"({
            "server": {"bind_address": "127.0.0.1", "port": 9001, "document_root": ")" +
                             dir.path().string() + R"("},
            "credentials": {"bundle_file": "local.pem", "use_openssl_cli": false},
            "logging": {"level": "warn", "max_files": 2}
        })");

        ConfigManager manager;
        Args args{"--config", file.string()};
        REQUIRE(manager.load(args.argc(), args.argv()));

        const auto& cfg = manager.get_config();
        CHECK(manager.get_config_path().string() == file.string());
        CHECK(cfg.server.bind_address == "127.0.0.1");
        CHECK(cfg.server.port == 9001);
        CHECK(cfg.credentials.bundle_file == "local.pem");
        CHECK_FALSE(cfg.credentials.use_openssl_cli);
        // Keys absent from the file keep their defaults
        CHECK(cfg.credentials.openssl_executable == "openssl");
        CHECK(cfg.logging.level == "warn");
        CHECK(cfg.logging.max_files == 2);
        CHECK(cfg.logging.max_file_size_mb == 100);
    }

    TEST_CASE("Config: precedence is CLI > environment > file", "[config]")
    {
        CleanEnv clean;
        TempDir dir;
        auto file = dir / "devhttps.json";
        write_file(file, R"({"server": {"port": 9000}, "credentials": {"bundle_file": "file.pem"}})");

        ScopedEnv config_env{"DEVHTTPS_CONFIG", file.string()};
        ScopedEnv port_env{"DEVHTTPS_PORT", "9100"};
        ScopedEnv use_openssl_env{"DEVHTTPS_USE_OPENSSL", "false"};

        SECTION("environment overrides the file")
        {
            ConfigManager manager;
            Args args{};
            REQUIRE(manager.load(args.argc(), args.argv()));

            const auto& cfg = manager.get_config();
            CHECK(manager.get_config_path().string() == file.string());
            CHECK(cfg.server.port == 9100);
            CHECK(cfg.credentials.bundle_file == "file.pem");
            CHECK_FALSE(cfg.credentials.use_openssl_cli);
        }

        SECTION("command line overrides the environment")
        {
            ConfigManager manager;
            Args args{"--port", "9200", "--openssl", "openssl"};
            REQUIRE(manager.load(args.argc(), args.argv()));

            const auto& cfg = manager.get_config();
            CHECK(cfg.server.port == 9200);
            CHECK(cfg.credentials.use_openssl_cli);
        }
    }

    TEST_CASE("Config: invalid input is rejected", "[config]")
    {
        CleanEnv env;
        ConfigManager manager;

        SECTION("port zero")
        {
            Args args{"--port", "0"};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
        SECTION("port out of range")
        {
            Args args{"--port", "70000"};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
        SECTION("port not a number")
        {
            Args args{"--port", "84x3"};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
        SECTION("missing option value")
        {
            Args args{"--cert"};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
        SECTION("document root that does not exist")
        {
            TempDir dir;
            Args args{"--directory", (dir / "missing").string()};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
        SECTION("unknown log level")
        {
            Args args{"--log-level", "chatty"};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
        SECTION("empty bundle path")
        {
            Args args{"--cert="};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
        SECTION("missing configuration file")
        {
            TempDir dir;
            Args args{"--config", (dir / "nope.json").string()};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
        SECTION("malformed JSON")
        {
            TempDir dir;
            write_file(dir / "bad.json", "{\"server\": ");
            Args args{"--config", (dir / "bad.json").string()};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
        SECTION("JSON port outside 1-65535")
        {
            TempDir dir;
            auto file = dir / "ports.json";
            for (const char* port : {"70000", "-1", "0", "\"8443\""})
            {
                INFO(port);
                write_file(file, std::string(R"({"server": {"port": )") + port + "}}");
                Args args{"--config", file.string()};
                ConfigManager fresh;
                CHECK_THROWS_WITH(fresh.load(args.argc(), args.argv()), Catch::Contains("server.port"));
            }
        }
        SECTION("bad boolean in the environment")
        {
            ScopedEnv use_openssl{"DEVHTTPS_USE_OPENSSL", "maybe"};
            Args args{};
            CHECK_THROWS_AS(manager.load(args.argc(), args.argv()), std::runtime_error);
        }
    }

    TEST_CASE("Config: validate()", "[config]")
    {
        config::Config cfg;
        CHECK_NOTHROW(cfg.validate());

        cfg.server.bind_address.clear();
        CHECK_THROWS_WITH(cfg.validate(), Catch::Contains("bind_address"));

        cfg = {};
        cfg.credentials.use_openssl_cli = true;
        cfg.credentials.openssl_executable.clear();
        CHECK_THROWS_AS(cfg.validate(), std::runtime_error);

        cfg.credentials.use_openssl_cli = false;
        CHECK_NOTHROW(cfg.validate());
    }

    TEST_CASE("Config: value parsers", "[config]")
    {
        CHECK(config::parse_port("1", "port") == 1);
        CHECK(config::parse_port("65535", "port") == 65535);
        CHECK_THROWS(config::parse_port("", "port"));
        CHECK_THROWS(config::parse_port("-1", "port"));

        CHECK(config::parse_bool("yes", "flag"));
        CHECK(config::parse_bool("1", "flag"));
        CHECK_FALSE(config::parse_bool("off", "flag"));
        CHECK_THROWS(config::parse_bool("TRUE!", "flag"));
    }

    TEST_CASE("Config: log settings convert to logger config", "[config]")
    {
        config::LogSettings settings;
        settings.level = "debug";
        settings.file = "out.log";
        settings.max_files = 3;

        auto log_config = settings.to_log_config();
        CHECK(log_config.level == util::LogLevel::Debug);
        CHECK(log_config.file_path == "out.log");
        CHECK(log_config.max_files == 3);
    }

}  // namespace devhttps::test
