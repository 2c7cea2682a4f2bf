/**
 * devhttps - Local HTTPS Development Server
 * SSL Context implementation - Server TLS configuration and credential loading
 */

#include "server/ssl_context.hpp"
#include "credentials/openssl_util.hpp"

#include <spdlog/spdlog.h>

#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <fstream>
#include <stdexcept>

namespace devhttps::server {

using credentials::openssl_error_string;

namespace {

constexpr const char* kCipherList =
    "ECDHE+AESGCM:DHE+AESGCM:ECDHE+CHACHA20:DHE+CHACHA20:"
    "ECDHE+AES256:DHE+AES256:ECDHE+AES128:DHE+AES128:"
    "!aNULL:!eNULL:!EXPORT:!DES:!RC4:!3DES:!MD5:!PSK";

constexpr const char* kCipherSuites =
    "TLS_AES_256_GCM_SHA384:TLS_CHACHA20_POLY1305_SHA256:TLS_AES_128_GCM_SHA256";

/**
 * Check if file exists and is readable
 */
bool file_readable(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    std::ifstream file(path);
    return file.good();
}

} // anonymous namespace

SslConfig make_bundle_ssl_config(const std::filesystem::path& bundle_file) {
    SslConfig config;
    config.cert_file = bundle_file;
    config.key_file = bundle_file;
    return config;
}

SslContextManager::SslContextManager(const SslConfig& config)
    : context_(ssl::context::tls_server)
{
    try {
        configure_context(config);
        spdlog::debug("SSL context initialized successfully");
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize SSL context: {}", e.what());
        throw;
    }
}

ssl::context& SslContextManager::get_context() noexcept {
    return context_;
}

const ssl::context& SslContextManager::get_context() const noexcept {
    return context_;
}

std::string SslContextManager::get_certificate_subject() {
    SSL_CTX* ctx = context_.native_handle();
    X509* cert = SSL_CTX_get0_certificate(ctx);
    if (!cert) {
        return "(no certificate loaded)";
    }

    char buf[256];
    X509_NAME* subject = X509_get_subject_name(cert);
    X509_NAME_oneline(subject, buf, sizeof(buf));
    return std::string(buf);
}

std::string SslContextManager::get_certificate_expiry() {
    SSL_CTX* ctx = context_.native_handle();
    X509* cert = SSL_CTX_get0_certificate(ctx);
    if (!cert) {
        return "(no certificate loaded)";
    }

    const ASN1_TIME* not_after = X509_get0_notAfter(cert);
    if (!not_after) {
        return "(unknown)";
    }

    credentials::BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        return "(error)";
    }

    ASN1_TIME_print(bio.get(), not_after);
    return credentials::bio_to_string(bio.get());
}

void SslContextManager::configure_context(const SslConfig& config) {
    configure_tls_versions();
    load_certificate(config);
    configure_ciphers();

    // Clients are not asked for certificates
    context_.set_verify_mode(ssl::verify_none);

    SSL_CTX* ssl_ctx = context_.native_handle();
    SSL_CTX_set_session_cache_mode(ssl_ctx, SSL_SESS_CACHE_SERVER);
    SSL_CTX_sess_set_cache_size(ssl_ctx, static_cast<long>(config.session_cache_size));
    spdlog::debug("SSL session cache enabled (size={})", config.session_cache_size);
}

void SslContextManager::load_certificate(const SslConfig& config) {
    if (config.cert_file.empty()) {
        throw std::runtime_error("SSL certificate file path is empty");
    }
    if (config.key_file.empty()) {
        throw std::runtime_error("SSL private key file path is empty");
    }

    if (!file_readable(config.cert_file)) {
        throw std::runtime_error("Cannot read SSL certificate file: " + config.cert_file.string());
    }
    if (!file_readable(config.key_file)) {
        throw std::runtime_error("Cannot read SSL private key file: " + config.key_file.string());
    }

    // PEM readers skip blocks of other types, so a key-then-certificate bundle loads as both
    boost::system::error_code ec;
    context_.use_certificate_chain_file(config.cert_file.string(), ec);
    if (ec) {
        throw std::runtime_error("Failed to load certificate: " + config.cert_file.string() +
                                " - " + ec.message() + " (" + openssl_error_string() + ")");
    }
    spdlog::debug("Loaded SSL certificate from: {}", config.cert_file.string());

    context_.use_private_key_file(config.key_file.string(), ssl::context::pem, ec);
    if (ec) {
        throw std::runtime_error("Failed to load private key: " + config.key_file.string() +
                                " - " + ec.message() + " (" + openssl_error_string() + ")");
    }
    spdlog::debug("Loaded SSL private key from: {}", config.key_file.string());

    if (SSL_CTX_check_private_key(context_.native_handle()) != 1) {
        throw std::runtime_error("Private key does not match certificate in " +
                                 config.cert_file.string() + " (" + openssl_error_string() + ")");
    }
}

void SslContextManager::configure_tls_versions() {
    // TLS 1.2 and 1.3 only
    SSL_CTX_set_min_proto_version(context_.native_handle(), TLS1_2_VERSION);

    context_.set_options(ssl::context::default_workarounds |
                         ssl::context::no_sslv2 |
                         ssl::context::no_sslv3 |
                         ssl::context::no_tlsv1 |
                         ssl::context::no_tlsv1_1 |
                         ssl::context::single_dh_use);
}

void SslContextManager::configure_ciphers() {
    SSL_CTX* ssl_ctx = context_.native_handle();

    if (SSL_CTX_set_cipher_list(ssl_ctx, kCipherList) != 1) {
        spdlog::warn("Failed to set TLS 1.2 cipher list, using defaults");
    }
    if (SSL_CTX_set_ciphersuites(ssl_ctx, kCipherSuites) != 1) {
        spdlog::warn("Failed to set TLS 1.3 ciphersuites, using defaults");
    }
}

} // namespace devhttps::server
