/**
 * devhttps - Local HTTPS Development Server
 * Certificate inspection - reads identity and validity from a PEM bundle
 */

#ifndef DEVHTTPS_CREDENTIALS_CERTIFICATE_INFO_HPP
#define DEVHTTPS_CREDENTIALS_CERTIFICATE_INFO_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace devhttps::credentials {

/**
 * Facts about the certificate (and key) stored in a credential bundle
 */
struct CertificateInfo {
    std::string subject;                    // One-line subject, e.g. "/C=JP/.../CN=localhost"
    std::string common_name;
    std::string issuer;
    std::string serial_hex;                 // Upper-case hex, no leading zeros
    int serial_bits{0};
    bool serial_negative{false};
    std::chrono::system_clock::time_point not_before;
    std::chrono::system_clock::time_point not_after;
    std::vector<std::string> dns_names;     // subjectAltName DNS entries
    std::vector<std::string> ip_addresses;  // subjectAltName IP entries, textual form
    std::string key_type;                   // "RSA", "EC", ...
    int key_bits{0};
    bool has_private_key{false};            // Bundle contains a private key
    bool key_matches{false};                // ...and it matches the certificate

    bool is_self_signed() const { return subject == issuer; }

    bool is_valid_at(std::chrono::system_clock::time_point t) const {
        return not_before <= t && t <= not_after;
    }
};

/**
 * Parse the PEM text of a bundle (first certificate, first private key)
 * @throws std::runtime_error if no certificate can be parsed
 */
CertificateInfo parse_certificate_info(const std::string& pem);

/**
 * Read and parse a bundle file
 * @throws std::runtime_error if the file is unreadable or malformed
 */
CertificateInfo read_certificate_info(const std::filesystem::path& path);

/**
 * Format a time point as "YYYY-MM-DD HH:MM:SS UTC"
 */
std::string format_utc(std::chrono::system_clock::time_point t);

} // namespace devhttps::credentials

#endif // DEVHTTPS_CREDENTIALS_CERTIFICATE_INFO_HPP
