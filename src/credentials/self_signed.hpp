/**
 * devhttps - Local HTTPS Development Server
 * Self-signed certificate generation with the OpenSSL library
 */

#ifndef DEVHTTPS_CREDENTIALS_SELF_SIGNED_HPP
#define DEVHTTPS_CREDENTIALS_SELF_SIGNED_HPP

#include "credentials/provisioning_strategy.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace devhttps::credentials {

// Fixed certificate parameters for local development
constexpr std::string_view kCommonName = "localhost";
constexpr std::string_view kSubjectAltNames = "DNS:localhost,IP:127.0.0.1";
constexpr int kValidityDays = 365;
constexpr int kRsaKeyBits = 2048;
constexpr unsigned long kRsaPublicExponent = 65537;

/**
 * PEM-encoded private key and certificate
 */
struct CredentialBundle {
    std::string private_key_pem;
    std::string certificate_pem;

    /**
     * On-disk form: key first, then certificate
     */
    std::string to_pem() const { return private_key_pem + certificate_pem; }
};

/**
 * Generate an RSA key and a self-signed certificate for localhost
 *
 * Subject and issuer: C=JP, ST=Tokyo, L=Local, O=devhttps Development, CN=localhost.
 * Valid from now for kValidityDays, subjectAltName DNS:localhost, IP:127.0.0.1,
 * signed with SHA-256.
 *
 * @throws std::runtime_error carrying the OpenSSL error text on failure
 */
CredentialBundle generate_self_signed_bundle();

/**
 * In-process generation strategy (OpenSSL library)
 */
class SelfSignedStrategy : public ProvisioningStrategy {
public:
    std::string_view name() const noexcept override { return "openssl-library"; }

    ProvisionResult provision(const std::filesystem::path& bundle_path) override;
};

} // namespace devhttps::credentials

#endif // DEVHTTPS_CREDENTIALS_SELF_SIGNED_HPP
