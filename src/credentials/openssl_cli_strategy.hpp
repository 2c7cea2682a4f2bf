/**
 * devhttps - Local HTTPS Development Server
 * openssl command-line strategy - generates the bundle with `openssl req`
 */

#ifndef DEVHTTPS_CREDENTIALS_OPENSSL_CLI_STRATEGY_HPP
#define DEVHTTPS_CREDENTIALS_OPENSSL_CLI_STRATEGY_HPP

#include "credentials/provisioning_strategy.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace devhttps::credentials {

/**
 * Runs the external openssl tool once, without a timeout
 *
 * Key and certificate are written into a temporary sibling of the bundle
 * path and renamed into place only after the tool exits with status 0.
 */
class OpenSslCliStrategy : public ProvisioningStrategy {
public:
    /**
     * @param executable Program name looked up on PATH, or a path containing '/'
     */
    explicit OpenSslCliStrategy(std::string executable = "openssl");

    std::string_view name() const noexcept override { return "openssl-cli"; }

    ProvisionResult provision(const std::filesystem::path& bundle_path) override;

    /**
     * Locate the executable (nullopt if it cannot be found)
     */
    std::optional<std::filesystem::path> resolve_executable() const;

    /**
     * Arguments passed to the tool, writing key and certificate to output
     */
    static std::vector<std::string> build_arguments(const std::filesystem::path& output);

private:
    std::string executable_;
};

} // namespace devhttps::credentials

#endif // DEVHTTPS_CREDENTIALS_OPENSSL_CLI_STRATEGY_HPP
