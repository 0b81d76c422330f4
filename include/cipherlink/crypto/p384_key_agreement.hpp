#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "identity/identity_state.pb.h"

#include <openssl/evp.h>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace cipherlink::crypto {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};

/**
 * @brief Owned P-384 key (public-only or full key pair)
 */
class P384Key {
public:
    /// Takes ownership of key
    P384Key(EVP_PKEY* key, const bool has_private) noexcept
        : key_(key), has_private_(has_private) {}

    P384Key(P384Key&&) noexcept = default;
    P384Key& operator=(P384Key&&) noexcept = default;
    P384Key(const P384Key&) = delete;
    P384Key& operator=(const P384Key&) = delete;

    [[nodiscard]] bool HasPrivate() const noexcept { return has_private_; }
    [[nodiscard]] EVP_PKEY* Native() const noexcept { return key_.get(); }

private:
    std::unique_ptr<EVP_PKEY, EvpPkeyDeleter> key_;
    bool has_private_;
};

/**
 * @brief ECDH on NIST P-384 through OpenSSL 3
 *
 * Two encodings are supported:
 * - raw: 97-byte uncompressed point (0x04 || X || Y), the only form on the wire
 * - JWK-like EcKeyRecord, the persisted form, optionally carrying the private scalar
 *
 * Every import validates that the point lies on P-384; a malformed or
 * foreign-curve key yields FailureType::KeyAgreement.
 */
class P384KeyAgreement {
public:
    [[nodiscard]] static Result<P384Key, CipherlinkFailure> GenerateKeyPair();

    [[nodiscard]] static Result<std::vector<uint8_t>, CipherlinkFailure> ExportPublicRaw(const P384Key& key);

    [[nodiscard]] static Result<P384Key, CipherlinkFailure> ImportPublicRaw(std::span<const uint8_t> raw);

    /**
     * @param include_private also emit `d`; fails if the key has no private part
     */
    [[nodiscard]] static Result<proto::identity::EcKeyRecord, CipherlinkFailure> ExportJwk(
        const P384Key& key,
        bool include_private);

    /// A record with an empty `d` imports as a public-only key
    [[nodiscard]] static Result<P384Key, CipherlinkFailure> ImportJwk(
        const proto::identity::EcKeyRecord& record);

    /**
     * @brief ECDH (384 bits) -> SHA-256 -> base64
     *
     * Pure and commutative: Derive(a, B) == Derive(b, A).
     */
    [[nodiscard]] static Result<std::string, CipherlinkFailure> DeriveSharedSecret(
        const P384Key& my_private,
        const P384Key& peer_public);

private:
    P384KeyAgreement() = delete;
};

} // namespace cipherlink::crypto
