#include "utils.hpp"

#include "credentials/certificate_info.hpp"
#include "credentials/openssl_cli_strategy.hpp"

#include <algorithm>

namespace devhttps::test
{
    using namespace credentials;

    TEST_CASE("openssl CLI: argument list", "[openssl_cli]")
    {
        auto args = OpenSslCliStrategy::build_arguments("/tmp/out.pem");

        REQUIRE_FALSE(args.empty());
        CHECK(args.front() == "req");
        CHECK(std::count(args.begin(), args.end(), "/tmp/out.pem") == 2);  // -keyout and -out
        CHECK(std::find(args.begin(), args.end(), "-nodes") != args.end());
        CHECK(std::find(args.begin(), args.end(), "/CN=localhost") != args.end());
        CHECK(std::find(args.begin(), args.end(), "rsa:2048") != args.end());
        CHECK(std::find(args.begin(), args.end(), "365") != args.end());
    }

    TEST_CASE("openssl CLI: missing executable", "[openssl_cli]")
    {
        TempDir dir;
        auto bundle = dir / "server.pem";

        SECTION("name not on PATH")
        {
            OpenSslCliStrategy strategy("devhttps-no-such-openssl-binary");
            CHECK_FALSE(strategy.resolve_executable());

            auto result = strategy.provision(bundle);
            CHECK(result.status == ProvisionStatus::ToolMissing);
            CHECK(result.strategy == "openssl-cli");
        }

        SECTION("explicit path that does not exist")
        {
            OpenSslCliStrategy strategy((dir / "bin" / "openssl").string());
            auto result = strategy.provision(bundle);
            CHECK(result.status == ProvisionStatus::ToolMissing);
        }

        CHECK_FALSE(std::filesystem::exists(bundle));
        CHECK(count_temp_files(dir.path()) == 0);
    }

    TEST_CASE("openssl CLI: tool exiting with an error", "[openssl_cli]")
    {
        OpenSslCliStrategy strategy("false");
        if (!strategy.resolve_executable())
        {
            WARN("'false' is not on PATH; skipping");
            return;
        }

        TempDir dir;
        auto bundle = dir / "server.pem";
        auto result = strategy.provision(bundle);

        CHECK(result.status == ProvisionStatus::ToolFailed);
        CHECK_THAT(result.detail, Catch::Contains("exited with status"));
        CHECK_FALSE(std::filesystem::exists(bundle));
        CHECK(count_temp_files(dir.path()) == 0);
    }

    TEST_CASE("openssl CLI: tool succeeding without output", "[openssl_cli]")
    {
        OpenSslCliStrategy strategy("true");
        if (!strategy.resolve_executable())
        {
            WARN("'true' is not on PATH; skipping");
            return;
        }

        TempDir dir;
        auto bundle = dir / "server.pem";
        auto result = strategy.provision(bundle);

        CHECK(result.status == ProvisionStatus::ToolFailed);
        CHECK_FALSE(std::filesystem::exists(bundle));
        CHECK(count_temp_files(dir.path()) == 0);
    }

    TEST_CASE("openssl CLI: real openssl generates a bundle", "[openssl_cli][external]")
    {
        OpenSslCliStrategy strategy;
        if (!strategy.resolve_executable())
        {
            WARN("openssl is not on PATH; skipping");
            return;
        }

        TempDir dir;
        auto bundle = dir / "server.pem";
        auto result = strategy.provision(bundle);

        // Very old openssl builds lack -addext; that is a tool failure, not a crash
        if (result.status == ProvisionStatus::ToolFailed)
        {
            WARN("openssl could not generate the bundle: " << result.detail);
            CHECK_FALSE(std::filesystem::exists(bundle));
            return;
        }

        REQUIRE(result.status == ProvisionStatus::Generated);
        CHECK(count_temp_files(dir.path()) == 0);

        auto info = read_certificate_info(bundle);
        CHECK(info.common_name == "localhost");
        CHECK(info.has_private_key);
        CHECK(info.key_matches);
        CHECK(info.key_bits == 2048);
    }

}  // namespace devhttps::test
