#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace cipherlink::crypto {

/**
 * @brief AES-256-GCM through the OpenSSL EVP interface
 *
 * The output of Encrypt is ciphertext followed by the 16-byte tag. Nonce
 * uniqueness is the caller's responsibility. A tag mismatch in Decrypt is
 * FailureType::Authentication and no plaintext is returned.
 */
class AesGcm {
public:
    AesGcm() = delete;

    [[nodiscard]] static Result<std::vector<uint8_t>, CipherlinkFailure> Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, CipherlinkFailure> Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
};

} // namespace cipherlink::crypto
