#include "cipherlink/keyexchange/key_exchange_manager.hpp"
#include "cipherlink/crypto/digest.hpp"
#include "cipherlink/core/constants.hpp"
#include "cipherlink/core/format.hpp"
#include "cipherlink/debug/event_logger.hpp"
#include "identity/identity_state.pb.h"

#include <algorithm>
#include <chrono>

namespace cipherlink::keyexchange {

namespace {
    int64_t NowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    CipherlinkFailure NotActive() {
        return CipherlinkFailure::InvalidState("No active account");
    }
}

KeyExchangeManager::KeyExchangeManager(
    interfaces::IKeyValueStore& store,
    identity::IdentityDerivationWorker& worker)
    : store_(store)
    , worker_(worker) {}

std::future<identity::IdentityDerivationWorker::DeriveResult> KeyExchangeManager::DeriveIdentity(
    std::string passphrase,
    std::string salt) {
    return worker_.Submit(std::move(passphrase), std::move(salt));
}

std::future<identity::IdentityDerivationWorker::DeriveResult> KeyExchangeManager::DeriveIdentity(
    std::string passphrase,
    std::string salt,
    const configuration::KdfConfig& config) {
    return worker_.Submit(std::move(passphrase), std::move(salt), config);
}

Result<Unit, CipherlinkFailure> KeyExchangeManager::Activate(
    identity::DerivedIdentity derived,
    std::string display_name) {
    Deactivate();
    auto account = std::make_unique<identity::AccountIdentity>(std::move(derived), std::move(display_name));
    if (auto ensured = EnsureKeyPair(*account); ensured.IsErr()) {
        return ensured;
    }
    account_ = std::move(account);
    CIPHERLINK_LOG_PEER(debug::Component::KeyExchange, "account active", account_->Uuid(), "");
    return Result<Unit, CipherlinkFailure>::Ok(unit);
}

void KeyExchangeManager::Deactivate() noexcept {
    if (account_) {
        account_->Wipe();
        account_.reset();
    }
    peer_keys_.clear();
    conversation_secrets_.clear();
}

Result<Unit, CipherlinkFailure> KeyExchangeManager::EnsureKeyPair(identity::AccountIdentity& account) {
    auto stored = store_.Get(StoreNamespaces::IDENTITY, account.Uuid());
    if (stored.IsErr()) {
        return Result<Unit, CipherlinkFailure>::Err(std::move(stored).UnwrapErr());
    }

    proto::identity::IdentityRecord record;
    const auto& bytes = stored.Unwrap();
    if (bytes.has_value()) {
        if (!record.ParseFromString(*bytes)) {
            return Result<Unit, CipherlinkFailure>::Err(
                CipherlinkFailure::Decode("Corrupt identity record"));
        }
        if (record.has_dh_key() && !record.dh_key().d().empty()) {
            auto imported = crypto::P384KeyAgreement::ImportJwk(record.dh_key());
            if (imported.IsErr()) {
                return Result<Unit, CipherlinkFailure>::Err(std::move(imported).UnwrapErr());
            }
            account.SetKeyPair(std::move(imported).Unwrap());
            return Result<Unit, CipherlinkFailure>::Ok(unit);
        }
    }

    auto generated = GenerateKeyPair();
    if (generated.IsErr()) {
        return Result<Unit, CipherlinkFailure>::Err(std::move(generated).UnwrapErr());
    }
    auto jwk = crypto::P384KeyAgreement::ExportJwk(generated.Unwrap(), true);
    if (jwk.IsErr()) {
        return Result<Unit, CipherlinkFailure>::Err(std::move(jwk).UnwrapErr());
    }

    record.set_uuid(account.Uuid());
    record.set_display_name(account.DisplayName());
    *record.mutable_dh_key() = std::move(jwk).Unwrap();
    if (record.created_at_ms() == 0) {
        record.set_created_at_ms(NowMs());
    }
    if (auto put = store_.Put(StoreNamespaces::IDENTITY, account.Uuid(), record.SerializeAsString()); put.IsErr()) {
        return put;
    }
    account.SetKeyPair(std::move(generated).Unwrap());
    CIPHERLINK_LOG_PEER(debug::Component::KeyExchange, "key pair generated", account.Uuid(), "P-384");
    return Result<Unit, CipherlinkFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CipherlinkFailure> KeyExchangeManager::LocalPublicRaw() const {
    if (!account_ || !account_->HasKeyPair()) {
        return Result<std::vector<uint8_t>, CipherlinkFailure>::Err(NotActive());
    }
    return crypto::P384KeyAgreement::ExportPublicRaw(account_->KeyPair());
}

Result<crypto::P384Key, CipherlinkFailure> KeyExchangeManager::GenerateKeyPair() {
    return crypto::P384KeyAgreement::GenerateKeyPair();
}

Result<std::string, CipherlinkFailure> KeyExchangeManager::DeriveSharedSecret(
    const crypto::P384Key& my_private,
    const crypto::P384Key& peer_public) {
    return crypto::P384KeyAgreement::DeriveSharedSecret(my_private, peer_public);
}

Result<std::vector<uint8_t>, CipherlinkFailure> KeyExchangeManager::ExportPublicRaw(const crypto::P384Key& key) {
    return crypto::P384KeyAgreement::ExportPublicRaw(key);
}

Result<crypto::P384Key, CipherlinkFailure> KeyExchangeManager::ImportPublicRaw(std::span<const uint8_t> raw) {
    return crypto::P384KeyAgreement::ImportPublicRaw(raw);
}

AesKey KeyExchangeManager::ConversationKey(const std::string_view shared_secret) {
    const auto digest = crypto::Digest::Sha256(shared_secret);
    return AesKey(digest.begin(), digest.end());
}

Result<std::string, CipherlinkFailure> KeyExchangeManager::DeriveConversationSecret(
    std::span<const uint8_t> peer_public_raw) const {
    if (!account_ || !account_->HasKeyPair()) {
        return Result<std::string, CipherlinkFailure>::Err(NotActive());
    }
    auto peer = crypto::P384KeyAgreement::ImportPublicRaw(peer_public_raw);
    if (peer.IsErr()) {
        return Result<std::string, CipherlinkFailure>::Err(std::move(peer).UnwrapErr());
    }
    return crypto::P384KeyAgreement::DeriveSharedSecret(account_->KeyPair(), peer.Unwrap());
}

Result<bool, CipherlinkFailure> KeyExchangeManager::ObservePeerKey(
    const std::string& peer_uuid,
    std::span<const uint8_t> peer_public_raw) {
    // Validates the point before anything is cached
    if (auto imported = crypto::P384KeyAgreement::ImportPublicRaw(peer_public_raw); imported.IsErr()) {
        return Result<bool, CipherlinkFailure>::Err(std::move(imported).UnwrapErr());
    }

    const auto cached = CachedPeerKey(peer_uuid);
    const bool changed = !cached.has_value() ||
        !std::equal(cached->begin(), cached->end(), peer_public_raw.begin(), peer_public_raw.end());
    if (!changed) {
        return Result<bool, CipherlinkFailure>::Ok(false);
    }

    if (auto stored = StorePeerKey(peer_uuid, peer_public_raw); stored.IsErr()) {
        return Result<bool, CipherlinkFailure>::Err(std::move(stored).UnwrapErr());
    }
    if (account_ && account_->HasKeyPair()) {
        auto secret = DeriveConversationSecret(peer_public_raw);
        if (secret.IsErr()) {
            return Result<bool, CipherlinkFailure>::Err(std::move(secret).UnwrapErr());
        }
        if (auto stored = StoreConversationSecret(peer_uuid, secret.Unwrap()); stored.IsErr()) {
            return Result<bool, CipherlinkFailure>::Err(std::move(stored).UnwrapErr());
        }
    }
    CIPHERLINK_LOG_PEER(debug::Component::KeyExchange, "peer key updated", peer_uuid, "");
    return Result<bool, CipherlinkFailure>::Ok(true);
}

std::optional<std::vector<uint8_t>> KeyExchangeManager::CachedPeerKey(const std::string& peer_uuid) {
    if (const auto it = peer_keys_.find(peer_uuid); it != peer_keys_.end()) {
        return it->second;
    }
    auto stored = store_.Get(StoreNamespaces::PEER_KEYS, peer_uuid);
    if (stored.IsErr() || !stored.Unwrap().has_value()) {
        return std::nullopt;
    }
    proto::identity::PeerKeyRecord record;
    if (!record.ParseFromString(*stored.Unwrap()) ||
        record.public_key_raw().size() != Constants::P_384_RAW_PUBLIC_KEY_SIZE) {
        return std::nullopt;
    }
    std::vector<uint8_t> raw(record.public_key_raw().begin(), record.public_key_raw().end());
    peer_keys_[peer_uuid] = raw;
    return raw;
}

std::optional<std::string> KeyExchangeManager::CachedConversationSecret(const std::string& conversation_id) {
    if (const auto it = conversation_secrets_.find(conversation_id); it != conversation_secrets_.end()) {
        return it->second;
    }
    auto stored = store_.Get(StoreNamespaces::CONVERSATION_SECRETS, conversation_id);
    if (stored.IsErr() || !stored.Unwrap().has_value()) {
        return std::nullopt;
    }
    proto::identity::ConversationSecretRecord record;
    if (!record.ParseFromString(*stored.Unwrap()) || record.shared_secret().empty()) {
        return std::nullopt;
    }
    conversation_secrets_[conversation_id] = record.shared_secret();
    return record.shared_secret();
}

Result<Unit, CipherlinkFailure> KeyExchangeManager::StorePeerKey(
    const std::string& peer_uuid,
    std::span<const uint8_t> peer_public_raw) {
    proto::identity::PeerKeyRecord record;
    record.set_peer_uuid(peer_uuid);
    record.set_public_key_raw(peer_public_raw.data(), peer_public_raw.size());
    record.set_updated_at_ms(NowMs());
    if (auto put = store_.Put(StoreNamespaces::PEER_KEYS, peer_uuid, record.SerializeAsString()); put.IsErr()) {
        return put;
    }
    peer_keys_[peer_uuid] = std::vector<uint8_t>(peer_public_raw.begin(), peer_public_raw.end());
    return Result<Unit, CipherlinkFailure>::Ok(unit);
}

Result<Unit, CipherlinkFailure> KeyExchangeManager::StoreConversationSecret(
    const std::string& conversation_id,
    const std::string& shared_secret) {
    proto::identity::ConversationSecretRecord record;
    record.set_conversation_id(conversation_id);
    record.set_shared_secret(shared_secret);
    if (auto put = store_.Put(StoreNamespaces::CONVERSATION_SECRETS, conversation_id,
                              record.SerializeAsString()); put.IsErr()) {
        return put;
    }
    conversation_secrets_[conversation_id] = shared_secret;
    return Result<Unit, CipherlinkFailure>::Ok(unit);
}

Result<AesKey, CipherlinkFailure> KeyExchangeManager::ResolveOutboundKey(const std::string& peer_uuid) {
    if (!account_) {
        return Result<AesKey, CipherlinkFailure>::Err(NotActive());
    }
    if (auto secret = CachedConversationSecret(peer_uuid)) {
        return Result<AesKey, CipherlinkFailure>::Ok(ConversationKey(*secret));
    }
    if (auto peer_key = CachedPeerKey(peer_uuid); peer_key && account_->HasKeyPair()) {
        auto secret = DeriveConversationSecret(*peer_key);
        if (secret.IsOk()) {
            if (auto stored = StoreConversationSecret(peer_uuid, secret.Unwrap()); stored.IsErr()) {
                return Result<AesKey, CipherlinkFailure>::Err(std::move(stored).UnwrapErr());
            }
            return Result<AesKey, CipherlinkFailure>::Ok(ConversationKey(secret.Unwrap()));
        }
        CIPHERLINK_LOG_PEER(debug::Component::KeyExchange, "cached peer key unusable", peer_uuid,
            secret.UnwrapErr().message);
    }
    return account_->MasterSecretBytes();
}

} // namespace cipherlink::keyexchange
