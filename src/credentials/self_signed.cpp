/**
 * devhttps - Local HTTPS Development Server
 * Self-signed certificate generation implementation
 */

#include "credentials/self_signed.hpp"
#include "credentials/openssl_util.hpp"
#include "util/atomic_file.hpp"

#include <spdlog/spdlog.h>

#include <openssl/opensslv.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <ctime>
#include <stdexcept>
#include <string>

namespace devhttps::credentials {

namespace {

[[noreturn]] void throw_openssl(const std::string& what) {
    throw std::runtime_error(what + ": " + openssl_error_string());
}

EvpPkeyPtr generate_rsa_key() {
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw_openssl("Failed to initialize RSA key generation");
    }

    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), kRsaKeyBits) <= 0) {
        throw_openssl("Failed to set RSA key size");
    }

    BignumPtr exponent(BN_new());
    if (!exponent || BN_set_word(exponent.get(), kRsaPublicExponent) != 1) {
        throw_openssl("Failed to set RSA public exponent");
    }
#if OPENSSL_VERSION_NUMBER >= 0x30000000L
    if (EVP_PKEY_CTX_set1_rsa_keygen_pubexp(ctx.get(), exponent.get()) <= 0) {
        throw_openssl("Failed to set RSA public exponent");
    }
#else
    // Takes ownership of the BIGNUM on success
    if (EVP_PKEY_CTX_set_rsa_keygen_pubexp(ctx.get(), exponent.get()) <= 0) {
        throw_openssl("Failed to set RSA public exponent");
    }
    exponent.release();
#endif

    EVP_PKEY* raw_key = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw_key) <= 0) {
        throw_openssl("Failed to generate RSA key pair");
    }
    return EvpPkeyPtr(raw_key);
}

void add_name_entry(X509_NAME* name, const char* field, std::string_view value) {
    if (X509_NAME_add_entry_by_txt(name, field, MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(value.data()),
                                   static_cast<int>(value.size()), -1, 0) != 1) {
        throw_openssl(std::string("Failed to set certificate ") + field);
    }
}

// Random positive serial with exactly 64 significant bits
void set_random_serial(X509* cert) {
    BignumPtr serial(BN_new());
    if (!serial || BN_rand(serial.get(), 64, BN_RAND_TOP_ONE, BN_RAND_BOTTOM_ANY) != 1) {
        throw_openssl("Failed to generate certificate serial number");
    }
    if (!BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert))) {
        throw_openssl("Failed to set certificate serial number");
    }
}

void add_subject_alt_names(X509* cert) {
    X509V3_CTX ext_ctx;
    X509V3_set_ctx_nodb(&ext_ctx);
    X509V3_set_ctx(&ext_ctx, cert, cert, nullptr, nullptr, 0);

    std::string value(kSubjectAltNames);
    X509ExtensionPtr ext(X509V3_EXT_conf_nid(nullptr, &ext_ctx, NID_subject_alt_name, value.c_str()));
    if (!ext) {
        throw_openssl("Failed to build subjectAltName extension");
    }
    if (X509_add_ext(cert, ext.get(), -1) != 1) {
        throw_openssl("Failed to add subjectAltName extension");
    }
}

X509Ptr build_certificate(EVP_PKEY* key) {
    X509Ptr cert(X509_new());
    if (!cert) {
        throw_openssl("Failed to allocate certificate");
    }

    // X.509 v3
    if (X509_set_version(cert.get(), 2) != 1) {
        throw_openssl("Failed to set certificate version");
    }

    set_random_serial(cert.get());

    // Both bounds from one clock reading, so the lifetime is exactly kValidityDays
    std::time_t now = std::time(nullptr);
    if (!X509_time_adj_ex(X509_getm_notBefore(cert.get()), 0, 0, &now) ||
        !X509_time_adj_ex(X509_getm_notAfter(cert.get()), kValidityDays, 0, &now)) {
        throw_openssl("Failed to set certificate validity");
    }

    if (X509_set_pubkey(cert.get(), key) != 1) {
        throw_openssl("Failed to set certificate public key");
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    add_name_entry(name, "C", "JP");
    add_name_entry(name, "ST", "Tokyo");
    add_name_entry(name, "L", "Local");
    add_name_entry(name, "O", "devhttps Development");
    add_name_entry(name, "CN", kCommonName);

    // Self-signed: issuer is the subject
    if (X509_set_issuer_name(cert.get(), name) != 1) {
        throw_openssl("Failed to set certificate issuer");
    }

    add_subject_alt_names(cert.get());

    if (X509_sign(cert.get(), key, EVP_sha256()) <= 0) {
        throw_openssl("Failed to sign certificate");
    }

    return cert;
}

} // anonymous namespace

CredentialBundle generate_self_signed_bundle() {
    spdlog::debug("Generating {}-bit RSA key pair...", kRsaKeyBits);
    EvpPkeyPtr key = generate_rsa_key();
    X509Ptr cert = build_certificate(key.get());

    BioPtr key_bio(BIO_new(BIO_s_mem()));
    BioPtr cert_bio(BIO_new(BIO_s_mem()));
    if (!key_bio || !cert_bio) {
        throw_openssl("Failed to allocate memory BIO");
    }

    if (PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw_openssl("Failed to encode private key");
    }
    if (PEM_write_bio_X509(cert_bio.get(), cert.get()) != 1) {
        throw_openssl("Failed to encode certificate");
    }

    CredentialBundle bundle;
    bundle.private_key_pem = bio_to_string(key_bio.get());
    bundle.certificate_pem = bio_to_string(cert_bio.get());
    return bundle;
}

ProvisionResult SelfSignedStrategy::provision(const std::filesystem::path& bundle_path) {
    ProvisionResult result;
    result.strategy = std::string(name());

    try {
        CredentialBundle bundle = generate_self_signed_bundle();
        util::write_file_atomically(bundle_path, bundle.to_pem());
    } catch (const std::exception& e) {
        result.status = ProvisionStatus::Failed;
        result.detail = e.what();
        return result;
    }

    result.status = ProvisionStatus::Generated;
    result.detail = "RSA " + std::to_string(kRsaKeyBits) + " / CN=" + std::string(kCommonName) +
                    " / " + std::to_string(kValidityDays) + " days";
    return result;
}

} // namespace devhttps::credentials
