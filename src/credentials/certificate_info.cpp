/**
 * devhttps - Local HTTPS Development Server
 * Certificate inspection implementation
 */

#include "credentials/certificate_info.hpp"
#include "credentials/openssl_util.hpp"

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

#include <arpa/inet.h>

#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace devhttps::credentials {

namespace {

std::string name_oneline(const X509_NAME* name) {
    char buf[512];
    X509_NAME_oneline(name, buf, sizeof(buf));
    return std::string(buf);
}

std::string common_name_of(const X509_NAME* name) {
    int index = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
    if (index < 0) {
        return {};
    }
    const ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, index));
    return std::string(reinterpret_cast<const char*>(ASN1_STRING_get0_data(data)),
                       static_cast<std::size_t>(ASN1_STRING_length(data)));
}

std::chrono::system_clock::time_point to_time_point(const ASN1_TIME* time) {
    std::tm tm{};
    if (!time || ASN1_TIME_to_tm(time, &tm) != 1) {
        throw std::runtime_error("Invalid certificate time: " + openssl_error_string());
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

void read_serial(const X509* cert, CertificateInfo& info) {
    BignumPtr serial(ASN1_INTEGER_to_BN(X509_get0_serialNumber(cert), nullptr));
    if (!serial) {
        throw std::runtime_error("Invalid certificate serial number: " + openssl_error_string());
    }
    info.serial_bits = BN_num_bits(serial.get());
    info.serial_negative = BN_is_negative(serial.get()) != 0;

    char* hex = BN_bn2hex(serial.get());
    if (hex) {
        info.serial_hex = hex;
        OPENSSL_free(hex);
    }
}

std::string ip_to_string(const ASN1_OCTET_STRING* ip) {
    const unsigned char* data = ASN1_STRING_get0_data(ip);
    int len = ASN1_STRING_length(ip);

    char buf[INET6_ADDRSTRLEN] = {};
    if (len == 4) {
        inet_ntop(AF_INET, data, buf, sizeof(buf));
    } else if (len == 16) {
        inet_ntop(AF_INET6, data, buf, sizeof(buf));
    } else {
        return "(invalid)";
    }
    return std::string(buf);
}

void read_subject_alt_names(X509* cert, CertificateInfo& info) {
    GeneralNamesPtr names(static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr)));
    if (!names) {
        return;  // No SANs
    }

    int count = sk_GENERAL_NAME_num(names.get());
    for (int i = 0; i < count; ++i) {
        const GENERAL_NAME* gen = sk_GENERAL_NAME_value(names.get(), i);
        if (!gen) continue;

        if (gen->type == GEN_DNS && gen->d.dNSName) {
            info.dns_names.emplace_back(
                reinterpret_cast<const char*>(ASN1_STRING_get0_data(gen->d.dNSName)),
                static_cast<std::size_t>(ASN1_STRING_length(gen->d.dNSName)));
        } else if (gen->type == GEN_IPADD && gen->d.iPAddress) {
            info.ip_addresses.push_back(ip_to_string(gen->d.iPAddress));
        }
    }
}

std::string key_type_name(const EVP_PKEY* key) {
    switch (EVP_PKEY_base_id(key)) {
        case EVP_PKEY_RSA: return "RSA";
        case EVP_PKEY_EC:  return "EC";
        default: {
            const char* short_name = OBJ_nid2sn(EVP_PKEY_base_id(key));
            return short_name ? short_name : "unknown";
        }
    }
}

} // anonymous namespace

CertificateInfo parse_certificate_info(const std::string& pem) {
    BioPtr cert_bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!cert_bio) {
        throw std::runtime_error("Failed to allocate memory BIO");
    }

    // Skips PEM blocks that are not certificates (the key comes first)
    X509Ptr cert(PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr));
    if (!cert) {
        throw std::runtime_error("No PEM certificate found: " + openssl_error_string());
    }

    CertificateInfo info;
    info.subject = name_oneline(X509_get_subject_name(cert.get()));
    info.issuer = name_oneline(X509_get_issuer_name(cert.get()));
    info.common_name = common_name_of(X509_get_subject_name(cert.get()));
    info.not_before = to_time_point(X509_get0_notBefore(cert.get()));
    info.not_after = to_time_point(X509_get0_notAfter(cert.get()));
    read_subject_alt_names(cert.get(), info);
    read_serial(cert.get(), info);

    BioPtr key_bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    EvpPkeyPtr key(key_bio
        ? PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr)
        : nullptr);
    if (key) {
        info.has_private_key = true;
        info.key_type = key_type_name(key.get());
        info.key_bits = EVP_PKEY_bits(key.get());
        info.key_matches = X509_check_private_key(cert.get(), key.get()) == 1;
    } else {
        EVP_PKEY* public_key = X509_get0_pubkey(cert.get());
        if (public_key) {
            info.key_type = key_type_name(public_key);
            info.key_bits = EVP_PKEY_bits(public_key);
        }
    }
    ERR_clear_error();

    return info;
}

CertificateInfo read_certificate_info(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot read credential bundle: " + path.string());
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_certificate_info(contents.str());
}

std::string format_utc(std::chrono::system_clock::time_point t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
    return std::string(buf);
}

} // namespace devhttps::credentials
