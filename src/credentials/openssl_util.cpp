/**
 * devhttps - Local HTTPS Development Server
 * OpenSSL helpers implementation
 */

#include "credentials/openssl_util.hpp"

#include <openssl/err.h>

namespace devhttps::credentials {

std::string openssl_error_string() {
    std::string result;
    char buf[256];

    while (unsigned long code = ERR_get_error()) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!result.empty()) {
            result += "; ";
        }
        result += buf;
    }

    return result.empty() ? std::string("(no OpenSSL error)") : result;
}

std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) {
        return {};
    }
    return std::string(data, static_cast<std::size_t>(len));
}

} // namespace devhttps::credentials
