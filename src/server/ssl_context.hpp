/**
 * devhttps - Local HTTPS Development Server
 * SSL Context - Server TLS configuration and credential loading
 */

#ifndef DEVHTTPS_SERVER_SSL_CONTEXT_HPP
#define DEVHTTPS_SERVER_SSL_CONTEXT_HPP

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace devhttps::server {

namespace asio = boost::asio;
namespace ssl = asio::ssl;

/**
 * SSL/TLS configuration
 *
 * cert_file and key_file may name the same file: a credential bundle holding
 * the private key followed by the certificate.
 */
struct SslConfig {
    std::filesystem::path cert_file;        // Server certificate (chain), PEM
    std::filesystem::path key_file;         // Private key, PEM, unencrypted

    std::size_t session_cache_size{1024};
};

/**
 * Build an SslConfig that loads key and certificate from one bundle file
 */
SslConfig make_bundle_ssl_config(const std::filesystem::path& bundle_file);

/**
 * SSL Context Manager - owns the server-role ssl::context
 *
 * The credential is loaded once at construction and is read-only afterwards.
 */
class SslContextManager {
public:
    /**
     * @param config SSL configuration
     * @throws std::runtime_error if the certificate or key cannot be loaded
     */
    explicit SslContextManager(const SslConfig& config);

    ~SslContextManager() = default;

    // Non-copyable but movable
    SslContextManager(const SslContextManager&) = delete;
    SslContextManager& operator=(const SslContextManager&) = delete;
    SslContextManager(SslContextManager&&) = default;
    SslContextManager& operator=(SslContextManager&&) = default;

    /**
     * Get the SSL context for accepting connections
     */
    ssl::context& get_context() noexcept;

    const ssl::context& get_context() const noexcept;

    /**
     * Get the loaded certificate's subject name
     */
    std::string get_certificate_subject();

    /**
     * Get certificate expiry information
     */
    std::string get_certificate_expiry();

private:
    void configure_context(const SslConfig& config);
    void load_certificate(const SslConfig& config);
    void configure_tls_versions();
    void configure_ciphers();

    ssl::context context_;
};

} // namespace devhttps::server

#endif // DEVHTTPS_SERVER_SSL_CONTEXT_HPP
