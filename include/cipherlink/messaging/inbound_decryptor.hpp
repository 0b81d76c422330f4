#pragma once

#include "cipherlink/core/failures.hpp"
#include "cipherlink/keyexchange/key_exchange_manager.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cipherlink::messaging {

struct InboundContext {
    std::string from;
    std::string to;
    std::string self_uuid;
};

/// Which key opened the envelope
enum class DecryptionSource {
    None,
    SenderKey,
    CachedSecret,
    MasterSecret,
    MasterSecretUnstripped
};

struct DecryptedInbound {
    std::string plaintext;
    DecryptionSource source = DecryptionSource::None;
    bool undecryptable = false;
    bool request_rehandshake = false;
    bool is_echo = false;
    std::string conversation_id;
    std::optional<std::vector<uint8_t>> sender_public_key;
    /// One entry per attempted candidate that failed, in cascade order
    std::vector<CipherlinkFailure> failures;
};

/**
 * @brief Ordered decryption cascade for inbound wire packets
 *
 * Candidates, first success wins:
 *   1. secret derived from the embedded sender key (not for echoes, needs a local private key)
 *   2. cached conversation secret
 *   3. master secret on the stripped envelope
 *   4. master secret on the raw wire bytes
 *
 * Never fails: exhaustion yields the sentinel text with undecryptable set.
 */
class InboundDecryptor {
public:
    explicit InboundDecryptor(keyexchange::KeyExchangeManager& keys);

    [[nodiscard]] DecryptedInbound Decrypt(std::span<const uint8_t> wire, const InboundContext& context);

private:
    void WriteBack(
        const std::string& conversation_id,
        const std::vector<uint8_t>& sender_public_key,
        const std::string& derived_secret);

    keyexchange::KeyExchangeManager& keys_;
};

} // namespace cipherlink::messaging
