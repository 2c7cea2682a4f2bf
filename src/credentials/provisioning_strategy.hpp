/**
 * devhttps - Local HTTPS Development Server
 * Provisioning strategy - one way of producing a credential bundle
 */

#ifndef DEVHTTPS_CREDENTIALS_PROVISIONING_STRATEGY_HPP
#define DEVHTTPS_CREDENTIALS_PROVISIONING_STRATEGY_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace devhttps::credentials {

/**
 * Outcome of a provisioning step
 */
enum class ProvisionStatus {
    AlreadyPresent,  // Bundle file existed, nothing was done
    Generated,       // A strategy wrote a new bundle
    ToolMissing,     // External tool not installed or could not be launched
    ToolFailed,      // External tool ran but did not produce a bundle
    Failed           // In-process generation failed
};

std::string_view to_string(ProvisionStatus status);

/**
 * Tagged result reported by every strategy attempt
 */
struct ProvisionResult {
    ProvisionStatus status{ProvisionStatus::Failed};
    std::string strategy;  // Name of the strategy that produced this result
    std::string detail;    // Human-readable reason or summary

    bool ok() const noexcept {
        return status == ProvisionStatus::AlreadyPresent ||
               status == ProvisionStatus::Generated;
    }
};

/**
 * Strategy interface for writing a credential bundle to a path
 *
 * Implementations report failure through the returned result instead of
 * throwing, and leave no file at bundle_path unless they succeed.
 */
class ProvisioningStrategy {
public:
    virtual ~ProvisioningStrategy() = default;

    /**
     * Short name used in logs and results
     */
    virtual std::string_view name() const noexcept = 0;

    /**
     * Produce a bundle at bundle_path
     */
    virtual ProvisionResult provision(const std::filesystem::path& bundle_path) = 0;
};

} // namespace devhttps::credentials

#endif // DEVHTTPS_CREDENTIALS_PROVISIONING_STRATEGY_HPP
