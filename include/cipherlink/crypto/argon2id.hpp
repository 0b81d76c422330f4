#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/configuration/kdf_config.hpp"
#include "cipherlink/crypto/secure_memory_handle.hpp"

#include <span>
#include <string_view>

namespace cipherlink::crypto {

/**
 * @brief Argon2id (version 0x13) password hashing through libargon2
 *
 * Salts of 8 bytes or more are hashed as given, so the result is plain
 * Argon2id(passphrase, salt). Shorter salts, which the reference
 * implementation rejects, are first condensed to 16 bytes with BLAKE2b.
 *
 * Blocking and memory-hard: call from the KDF worker, not the dispatch context.
 */
class Argon2id {
public:
    /**
     * @return config.OutputSize() bytes in guarded memory, or a Kdf failure
     *         for an empty passphrase, an empty salt or rejected cost parameters
     */
    [[nodiscard]] static Result<SecureMemoryHandle, CipherlinkFailure> Hash(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        const configuration::KdfConfig& config);

    [[nodiscard]] static Result<SecureMemoryHandle, CipherlinkFailure> Hash(
        std::string_view passphrase,
        std::string_view salt,
        const configuration::KdfConfig& config);

private:
    Argon2id() = delete;
};

} // namespace cipherlink::crypto
