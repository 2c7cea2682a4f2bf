/**
 * devhttps - Local HTTPS Development Server
 * Credential Provisioner implementation
 */

#include "credentials/provisioner.hpp"
#include "credentials/openssl_cli_strategy.hpp"
#include "credentials/self_signed.hpp"
#include "util/logger.hpp"


#include <system_error>

namespace devhttps::credentials {

namespace {

constexpr auto kLog = util::log_component::Credentials;

} // anonymous namespace

std::string_view to_string(ProvisionStatus status) {
    switch (status) {
        case ProvisionStatus::AlreadyPresent: return "already-present";
        case ProvisionStatus::Generated:      return "generated";
        case ProvisionStatus::ToolMissing:    return "tool-missing";
        case ProvisionStatus::ToolFailed:     return "tool-failed";
        case ProvisionStatus::Failed:         return "failed";
        default:                              return "unknown";
    }
}

CredentialProvisioner::CredentialProvisioner(std::filesystem::path bundle_path,
                                             StrategyList strategies)
    : bundle_path_(std::move(bundle_path))
    , strategies_(std::move(strategies))
{
}

ProvisionReport CredentialProvisioner::ensure() {
    ProvisionReport report;

    std::error_code ec;
    if (std::filesystem::exists(bundle_path_, ec)) {
        DEVHTTPS_LOG_INFO(kLog, "Using existing credential bundle: {}", bundle_path_.string());
        report.outcome = ProvisionResult{
            ProvisionStatus::AlreadyPresent, "existing-file", bundle_path_.string()};
        return report;
    }
    if (ec) {
        DEVHTTPS_LOG_WARN(kLog, "Could not check {}: {}",
                          bundle_path_.string(), ec.message());
    }

    DEVHTTPS_LOG_INFO(kLog, "Credential bundle {} not found, generating a self-signed certificate...",
                      bundle_path_.string());

    if (strategies_.empty()) {
        report.outcome = ProvisionResult{
            ProvisionStatus::Failed, "none", "no provisioning strategy configured"};
        return report;
    }

    for (auto& strategy : strategies_) {
        DEVHTTPS_LOG_DEBUG(kLog, "Trying provisioning strategy '{}'", strategy->name());

        ProvisionResult result = strategy->provision(bundle_path_);
        report.attempts.push_back(result);

        switch (result.status) {
            case ProvisionStatus::Generated:
            case ProvisionStatus::AlreadyPresent:
                DEVHTTPS_LOG_INFO(kLog, "Certificate generated via {}: {}",
                                  result.strategy, bundle_path_.string());
                report.outcome = std::move(result);
                return report;
            case ProvisionStatus::ToolMissing:
                DEVHTTPS_LOG_INFO(kLog, "{} unavailable ({}), falling back",
                                  result.strategy, result.detail);
                break;
            case ProvisionStatus::ToolFailed:
                DEVHTTPS_LOG_WARN(kLog, "{} failed ({}), falling back",
                                  result.strategy, result.detail);
                break;
            case ProvisionStatus::Failed:
                DEVHTTPS_LOG_ERROR(kLog, "{} failed: {}", result.strategy, result.detail);
                break;
        }
    }

    report.outcome = report.attempts.back();
    return report;
}

StrategyList make_default_strategies(const config::CredentialSettings& settings) {
    StrategyList strategies;
    if (settings.use_openssl_cli) {
        strategies.push_back(std::make_unique<OpenSslCliStrategy>(settings.openssl_executable));
    }
    strategies.push_back(std::make_unique<SelfSignedStrategy>());
    return strategies;
}

std::string remediation_guidance(const std::filesystem::path& bundle_path) {
    return "Could not generate a TLS certificate. To fix this, do one of the following:\n"
           "  1. Install the OpenSSL library with RSA support (e.g. libssl3) and restart\n"
           "  2. Install the openssl command-line tool and make sure it is on PATH\n"
           "  3. Create the bundle manually, for example:\n"
           "       openssl req -new -x509 -keyout " + bundle_path.string() +
           " -out " + bundle_path.string() + " -days 365 -nodes -subj /CN=localhost\n"
           "     (the file must contain a PEM private key followed by a PEM certificate)";
}

} // namespace devhttps::credentials
