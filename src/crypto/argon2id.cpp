#include "cipherlink/crypto/argon2id.hpp"
#include "cipherlink/crypto/digest.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/constants.hpp"
#include "cipherlink/core/format.hpp"
#include "cipherlink/debug/event_logger.hpp"

#include <argon2.h>
#include <vector>

namespace cipherlink::crypto {

namespace {
    using HashResult = Result<SecureMemoryHandle, CipherlinkFailure>;

    std::vector<uint8_t> EffectiveSalt(std::span<const uint8_t> salt) {
        if (salt.size() >= Constants::ARGON2_MIN_SALT_SIZE) {
            return {salt.begin(), salt.end()};
        }
        return Digest::GenericHash(salt, Constants::ARGON2_SALT_SIZE);
    }
}

Result<SecureMemoryHandle, CipherlinkFailure> Argon2id::Hash(
    const std::string_view passphrase,
    std::span<const uint8_t> salt,
    const configuration::KdfConfig& config) {
    if (passphrase.empty()) {
        return HashResult::Err(CipherlinkFailure::Kdf("Passphrase must not be empty"));
    }
    if (salt.empty()) {
        return HashResult::Err(CipherlinkFailure::Kdf("Salt must not be empty"));
    }

    auto output = SecureMemoryHandle::Allocate(config.OutputSize());
    if (output.IsErr()) {
        return HashResult::Err(CipherlinkFailure::FromSodiumFailure(output.UnwrapErr()));
    }
    auto handle = std::move(output).Unwrap();

    const std::vector<uint8_t> effective_salt = EffectiveSalt(salt);
    std::vector<uint8_t> hash(config.OutputSize());

    CIPHERLINK_LOG_VALUE(debug::Component::Kdf, "argon2id start", "mem_kib", config.MemoryKib());
    const int rc = argon2id_hash_raw(
        config.TimeCost(), config.MemoryKib(), config.Parallelism(),
        passphrase.data(), passphrase.size(),
        effective_salt.data(), effective_salt.size(),
        hash.data(), hash.size());
    if (rc != ARGON2_OK) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(hash));
        return HashResult::Err(CipherlinkFailure::Kdf(
            compat::format("Argon2id hashing failed: {}", argon2_error_message(rc))));
    }

    auto written = handle.Write(hash);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(hash));
    if (written.IsErr()) {
        return HashResult::Err(CipherlinkFailure::FromSodiumFailure(written.UnwrapErr()));
    }
    CIPHERLINK_LOG_VALUE(debug::Component::Kdf, "argon2id done", "bytes", config.OutputSize());
    return HashResult::Ok(std::move(handle));
}

Result<SecureMemoryHandle, CipherlinkFailure> Argon2id::Hash(
    const std::string_view passphrase,
    const std::string_view salt,
    const configuration::KdfConfig& config) {
    return Hash(
        passphrase,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(salt.data()), salt.size()),
        config);
}

} // namespace cipherlink::crypto
