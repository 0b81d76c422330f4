#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/configuration/kdf_config.hpp"
#include "cipherlink/crypto/secure_memory_handle.hpp"
#include "cipherlink/crypto/p384_key_agreement.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace cipherlink::identity {

/// Output of the passphrase KDF: uuid (hex of hash[0..32)) and master secret (hash[32..64))
struct DerivedIdentity {
    std::string uuid;
    crypto::SecureMemoryHandle master_secret;
};

/**
 * @brief Deterministic identity derivation
 *
 * Identical passphrase and salt always yield the same uuid and master secret.
 * Blocking; run through IdentityDerivationWorker.
 */
class IdentityDerivation {
public:
    [[nodiscard]] static Result<DerivedIdentity, CipherlinkFailure> Derive(
        std::string_view passphrase,
        std::string_view salt,
        const configuration::KdfConfig& config = configuration::KdfConfig::Default());

private:
    IdentityDerivation() = delete;
};

/**
 * @brief The local account: uuid, master secret and the P-384 agreement key
 *
 * The master secret stays in guarded memory for the lifetime of the login
 * and is released by Wipe() on logout.
 */
class AccountIdentity {
public:
    AccountIdentity(DerivedIdentity derived, std::string display_name);

    AccountIdentity(AccountIdentity&&) noexcept = default;
    AccountIdentity& operator=(AccountIdentity&&) noexcept = default;
    AccountIdentity(const AccountIdentity&) = delete;
    AccountIdentity& operator=(const AccountIdentity&) = delete;

    ~AccountIdentity();

    [[nodiscard]] const std::string& Uuid() const noexcept { return uuid_; }
    [[nodiscard]] const std::string& DisplayName() const noexcept { return display_name_; }

    /// AES key used for the master-secret fallback candidates
    [[nodiscard]] Result<std::vector<uint8_t>, CipherlinkFailure> MasterSecretBytes() const;

    [[nodiscard]] bool HasKeyPair() const noexcept { return key_pair_.has_value(); }
    [[nodiscard]] const crypto::P384Key& KeyPair() const { return *key_pair_; }
    void SetKeyPair(crypto::P384Key key_pair) { key_pair_ = std::move(key_pair); }

    void Wipe() noexcept;
    [[nodiscard]] bool IsWiped() const noexcept { return master_secret_.IsInvalid(); }

private:
    std::string uuid_;
    std::string display_name_;
    crypto::SecureMemoryHandle master_secret_;
    std::optional<crypto::P384Key> key_pair_;
};

} // namespace cipherlink::identity
