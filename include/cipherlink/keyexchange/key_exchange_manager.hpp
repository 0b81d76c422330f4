#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/crypto/p384_key_agreement.hpp"
#include "cipherlink/identity/account_identity.hpp"
#include "cipherlink/identity/identity_derivation_worker.hpp"
#include "cipherlink/interfaces/i_key_value_store.hpp"

#include <array>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cipherlink::keyexchange {

using AesKey = std::vector<uint8_t>;

/**
 * @brief Owns the local account and every key the node agrees with peers
 *
 * Key agreement needs no handshake: each outbound packet carries our raw
 * public key, and any side that sees a peer key derives the conversation
 * secret on the spot. Derivation is idempotent, so loss, reordering and
 * duplicate delivery are harmless.
 *
 * Peer keys and conversation secrets are cached in memory and mirrored to
 * the key-value store. Touched only from the dispatch context.
 */
class KeyExchangeManager {
public:
    KeyExchangeManager(
        interfaces::IKeyValueStore& store,
        identity::IdentityDerivationWorker& worker);

    KeyExchangeManager(const KeyExchangeManager&) = delete;
    KeyExchangeManager& operator=(const KeyExchangeManager&) = delete;

    // ------------------------------------------------------------------
    // Identity lifecycle
    // ------------------------------------------------------------------

    /// Argon2id on the KDF worker; resolves to (uuid, master secret)
    [[nodiscard]] std::future<identity::IdentityDerivationWorker::DeriveResult> DeriveIdentity(
        std::string passphrase,
        std::string salt);

    [[nodiscard]] std::future<identity::IdentityDerivationWorker::DeriveResult> DeriveIdentity(
        std::string passphrase,
        std::string salt,
        const configuration::KdfConfig& config);

    /**
     * @brief Log in with a derived identity
     *
     * Loads the persisted key pair for the uuid, or generates and persists
     * one when none exists. A persisted pair is never replaced.
     */
    [[nodiscard]] Result<Unit, CipherlinkFailure> Activate(
        identity::DerivedIdentity derived,
        std::string display_name);

    /// Wipe the master secret and drop every cached secret
    void Deactivate() noexcept;

    [[nodiscard]] bool IsActive() const noexcept { return account_ != nullptr; }
    [[nodiscard]] const identity::AccountIdentity& Account() const { return *account_; }

    [[nodiscard]] Result<std::vector<uint8_t>, CipherlinkFailure> LocalPublicRaw() const;

    // ------------------------------------------------------------------
    // Primitive operations
    // ------------------------------------------------------------------

    [[nodiscard]] static Result<crypto::P384Key, CipherlinkFailure> GenerateKeyPair();

    [[nodiscard]] static Result<std::string, CipherlinkFailure> DeriveSharedSecret(
        const crypto::P384Key& my_private,
        const crypto::P384Key& peer_public);

    [[nodiscard]] static Result<std::vector<uint8_t>, CipherlinkFailure> ExportPublicRaw(
        const crypto::P384Key& key);

    [[nodiscard]] static Result<crypto::P384Key, CipherlinkFailure> ImportPublicRaw(
        std::span<const uint8_t> raw);

    /// SHA-256 over the UTF-8 bytes of the base64 secret
    [[nodiscard]] static AesKey ConversationKey(std::string_view shared_secret);

    // ------------------------------------------------------------------
    // Peer keys and conversation secrets
    // ------------------------------------------------------------------

    /// Derive a secret from our private key and a raw peer key
    [[nodiscard]] Result<std::string, CipherlinkFailure> DeriveConversationSecret(
        std::span<const uint8_t> peer_public_raw) const;

    /**
     * @brief Record a key seen in a presence event or message prefix
     *
     * @return Ok(true) when the key was new or different; the conversation
     *         secret is then re-derived and cached
     */
    [[nodiscard]] Result<bool, CipherlinkFailure> ObservePeerKey(
        const std::string& peer_uuid,
        std::span<const uint8_t> peer_public_raw);

    [[nodiscard]] std::optional<std::vector<uint8_t>> CachedPeerKey(const std::string& peer_uuid);
    [[nodiscard]] std::optional<std::string> CachedConversationSecret(const std::string& conversation_id);

    [[nodiscard]] Result<Unit, CipherlinkFailure> StorePeerKey(
        const std::string& peer_uuid,
        std::span<const uint8_t> peer_public_raw);

    [[nodiscard]] Result<Unit, CipherlinkFailure> StoreConversationSecret(
        const std::string& conversation_id,
        const std::string& shared_secret);

    /**
     * @brief AES key for a message to peer_uuid
     *
     * Cached conversation secret, else a secret derived from the cached peer
     * key (and cached), else the master secret.
     */
    [[nodiscard]] Result<AesKey, CipherlinkFailure> ResolveOutboundKey(const std::string& peer_uuid);

private:
    [[nodiscard]] Result<Unit, CipherlinkFailure> EnsureKeyPair(identity::AccountIdentity& account);

    interfaces::IKeyValueStore& store_;
    identity::IdentityDerivationWorker& worker_;
    std::unique_ptr<identity::AccountIdentity> account_;
    std::unordered_map<std::string, std::vector<uint8_t>> peer_keys_;
    std::unordered_map<std::string, std::string> conversation_secrets_;
};

} // namespace cipherlink::keyexchange
