/**
 * devhttps - Local HTTPS Development Server
 * OpenSSL helpers - owning handles and error reporting
 */

#ifndef DEVHTTPS_CREDENTIALS_OPENSSL_UTIL_HPP
#define DEVHTTPS_CREDENTIALS_OPENSSL_UTIL_HPP

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <memory>
#include <string>

namespace devhttps::credentials {

struct BioDeleter { void operator()(BIO* p) const noexcept { BIO_free_all(p); } };
struct EvpPkeyDeleter { void operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); } };
struct EvpPkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const noexcept { EVP_PKEY_CTX_free(p); } };
struct X509Deleter { void operator()(X509* p) const noexcept { X509_free(p); } };
struct X509ExtensionDeleter { void operator()(X509_EXTENSION* p) const noexcept { X509_EXTENSION_free(p); } };
struct GeneralNamesDeleter { void operator()(GENERAL_NAMES* p) const noexcept { GENERAL_NAMES_free(p); } };
struct BignumDeleter { void operator()(BIGNUM* p) const noexcept { BN_free(p); } };

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using X509ExtensionPtr = std::unique_ptr<X509_EXTENSION, X509ExtensionDeleter>;
using GeneralNamesPtr = std::unique_ptr<GENERAL_NAMES, GeneralNamesDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

/**
 * Drain the OpenSSL error queue into one string ("(no OpenSSL error)" if empty)
 */
std::string openssl_error_string();

/**
 * Copy the contents of a memory BIO into a string
 */
std::string bio_to_string(BIO* bio);

} // namespace devhttps::credentials

#endif // DEVHTTPS_CREDENTIALS_OPENSSL_UTIL_HPP
