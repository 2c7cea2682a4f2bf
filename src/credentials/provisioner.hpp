/**
 * devhttps - Local HTTPS Development Server
 * Credential Provisioner - makes sure a TLS key + certificate bundle exists
 *
 * The bundle is a single PEM file: private key followed by a self-signed
 * certificate. An existing file is reused untouched. A missing file is
 * generated by the first strategy that succeeds, in order.
 */

#ifndef DEVHTTPS_CREDENTIALS_PROVISIONER_HPP
#define DEVHTTPS_CREDENTIALS_PROVISIONER_HPP

#include "config/config.hpp"
#include "credentials/provisioning_strategy.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace devhttps::credentials {

using StrategyList = std::vector<std::unique_ptr<ProvisioningStrategy>>;

/**
 * Result of CredentialProvisioner::ensure()
 */
struct ProvisionReport {
    ProvisionResult outcome;               // Final result
    std::vector<ProvisionResult> attempts; // Every strategy attempt, in order

    bool ok() const noexcept { return outcome.ok(); }
};

/**
 * Credential Provisioner
 *
 * Runs once at startup before the TLS listener is built.
 */
class CredentialProvisioner {
public:
    /**
     * @param bundle_path Where the bundle lives
     * @param strategies Generation strategies, tried in order
     */
    CredentialProvisioner(std::filesystem::path bundle_path, StrategyList strategies);

    // Non-copyable
    CredentialProvisioner(const CredentialProvisioner&) = delete;
    CredentialProvisioner& operator=(const CredentialProvisioner&) = delete;

    /**
     * Check for the bundle and generate it if absent
     *
     * Never throws for generation failures; the report says whether a usable
     * bundle exists afterwards.
     */
    ProvisionReport ensure();

    const std::filesystem::path& bundle_path() const noexcept { return bundle_path_; }

private:
    std::filesystem::path bundle_path_;
    StrategyList strategies_;
};

/**
 * Default strategy order: the openssl tool (unless disabled), then in-process generation
 */
StrategyList make_default_strategies(const config::CredentialSettings& settings);

/**
 * Multi-line remediation text shown when no strategy could create the bundle
 */
std::string remediation_guidance(const std::filesystem::path& bundle_path);

} // namespace devhttps::credentials

#endif // DEVHTTPS_CREDENTIALS_PROVISIONER_HPP
