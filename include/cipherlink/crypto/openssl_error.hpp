#pragma once

#include "cipherlink/core/constants.hpp"

#include <openssl/err.h>
#include <string>

namespace cipherlink::crypto {

/// Pop the oldest queued OpenSSL error and render it; clears the rest of the queue
inline std::string LastOpenSSLError() {
    const unsigned long err = ERR_get_error();
    ERR_clear_error();
    if (err == OpenSSLConstants::NO_ERROR) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

} // namespace cipherlink::crypto
