#include "cipherlink/messaging/inbound_decryptor.hpp"
#include "cipherlink/messaging/envelope_codec.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/constants.hpp"
#include "cipherlink/debug/event_logger.hpp"

namespace cipherlink::messaging {

InboundDecryptor::InboundDecryptor(keyexchange::KeyExchangeManager& keys)
    : keys_(keys) {}

DecryptedInbound InboundDecryptor::Decrypt(std::span<const uint8_t> wire, const InboundContext& context) {
    DecryptedInbound result;
    result.is_echo = context.from == context.self_uuid;
    result.conversation_id = result.is_echo ? context.to : context.from;

    auto unpacked = EnvelopeCodec::Unpack(wire);
    result.sender_public_key = unpacked.sender_public_key;

    const auto try_key = [&](std::span<const uint8_t> envelope, std::span<const uint8_t> key,
                             const DecryptionSource source) {
        auto opened = EnvelopeCodec::Decode(envelope, key);
        if (opened.IsErr()) {
            result.failures.push_back(std::move(opened).UnwrapErr());
            return false;
        }
        result.plaintext = std::move(opened).Unwrap();
        result.source = source;
        return true;
    };

    const auto cached_secret = keys_.CachedConversationSecret(result.conversation_id);

    std::optional<std::string> derived_secret;
    const bool has_private = keys_.IsActive() && keys_.Account().HasKeyPair();
    if (unpacked.sender_public_key.has_value() && !result.is_echo && has_private) {
        auto derived = keys_.DeriveConversationSecret(*unpacked.sender_public_key);
        if (derived.IsOk()) {
            derived_secret = std::move(derived).Unwrap();
        } else {
            result.failures.push_back(std::move(derived).UnwrapErr());
        }
    }

    bool opened = false;
    if (derived_secret.has_value()) {
        const auto key = keyexchange::KeyExchangeManager::ConversationKey(*derived_secret);
        opened = try_key(unpacked.envelope, key, DecryptionSource::SenderKey);
    }
    if (!opened && cached_secret.has_value() && cached_secret != derived_secret) {
        const auto key = keyexchange::KeyExchangeManager::ConversationKey(*cached_secret);
        opened = try_key(unpacked.envelope, key, DecryptionSource::CachedSecret);
    }
    if (!opened && keys_.IsActive()) {
        auto master = keys_.Account().MasterSecretBytes();
        if (master.IsErr()) {
            result.failures.push_back(std::move(master).UnwrapErr());
        } else {
            auto& master_key = master.Unwrap();
            opened = try_key(unpacked.envelope, master_key, DecryptionSource::MasterSecret);
            if (!opened && unpacked.sender_public_key.has_value()) {
                opened = try_key(wire, master_key, DecryptionSource::MasterSecretUnstripped);
            }
            (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(master_key));
        }
    }

    if (derived_secret.has_value() &&
        (result.source == DecryptionSource::SenderKey || !cached_secret.has_value())) {
        WriteBack(result.conversation_id, *unpacked.sender_public_key, *derived_secret);
    }

    if (!opened) {
        result.plaintext = std::string(DisplayText::UNDECRYPTABLE_MESSAGE);
        result.undecryptable = true;
        result.request_rehandshake = unpacked.sender_public_key.has_value() && !result.is_echo;
        CIPHERLINK_LOG_VALUE(debug::Component::Codec, "cascade exhausted", "attempts", result.failures.size());
    }
    return result;
}

void InboundDecryptor::WriteBack(
    const std::string& conversation_id,
    const std::vector<uint8_t>& sender_public_key,
    const std::string& derived_secret) {
    if (auto stored = keys_.StoreConversationSecret(conversation_id, derived_secret); stored.IsErr()) {
        CIPHERLINK_LOG_PEER(debug::Component::Codec, "secret write-back failed", conversation_id,
            stored.UnwrapErr().message);
    }
    if (auto stored = keys_.StorePeerKey(conversation_id, sender_public_key); stored.IsErr()) {
        CIPHERLINK_LOG_PEER(debug::Component::Codec, "peer key write-back failed", conversation_id,
            stored.UnwrapErr().message);
    }
}

} // namespace cipherlink::messaging
