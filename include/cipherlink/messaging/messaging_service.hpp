#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/configuration/relay_config.hpp"
#include "cipherlink/interfaces/i_message_sink.hpp"
#include "cipherlink/interfaces/i_signal_handler.hpp"
#include "cipherlink/keyexchange/key_exchange_manager.hpp"
#include "cipherlink/messaging/chat_payload.hpp"
#include "cipherlink/messaging/inbound_decryptor.hpp"
#include "cipherlink/signaling/relay_client.hpp"
#include "cipherlink/signaling/relay_events.hpp"

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace cipherlink::messaging {

/**
 * @brief Outbound encryption and the inbound message pipeline
 *
 * Outbound: payload -> ResolveOutboundKey -> Encode -> Pack(own public key) -> relay.
 * Inbound:  Unpack -> decryption cascade -> cache write-back -> duplicate
 *           suppression -> typed dispatch to the sink or the signal handler.
 *
 * Runs entirely on the dispatch context.
 */
class MessagingService {
public:
    MessagingService(
        keyexchange::KeyExchangeManager& keys,
        signaling::RelayClient& relay,
        configuration::RelayConfig config = configuration::RelayConfig::Default());

    MessagingService(const MessagingService&) = delete;
    MessagingService& operator=(const MessagingService&) = delete;

    void SetMessageSink(std::shared_ptr<interfaces::IMessageSink> sink);
    void SetSignalHandler(std::shared_ptr<interfaces::ISignalHandler> handler);

    /// @return the message id
    [[nodiscard]] Result<std::string, CipherlinkFailure> SendText(
        const std::string& to,
        const std::string& text,
        std::optional<ReplyReference> reply_to = std::nullopt);

    /**
     * @brief One logical message, one id, an individual encryption per member
     *
     * The local uuid is skipped. Every member is attempted; the first failure
     * is returned after the fan-out completes.
     */
    [[nodiscard]] Result<std::string, CipherlinkFailure> SendToGroup(
        const std::string& group_id,
        const std::string& group_name,
        const std::vector<std::string>& participants,
        const std::string& text);

    [[nodiscard]] Result<Unit, CipherlinkFailure> SendSystem(const std::string& to, SystemKind kind);

    /// Read receipt to the original sender
    [[nodiscard]] Result<Unit, CipherlinkFailure> Acknowledge(const std::string& from, const std::string& msg_id);

    void OnRelayPush(const signaling::RelayPush& push);
    void OnQueueFlush(const signaling::QueueFlush& flush);
    void OnAckPush(const signaling::MsgAckPush& ack);
    void OnDispatchStatus(const signaling::DispatchStatus& status);

private:
    [[nodiscard]] Result<Unit, CipherlinkFailure> SendPayload(
        const std::string& to,
        const std::string& plaintext,
        const std::string& msg_id);

    /// Records msg_id; true if it was already inside the window
    bool IsDuplicate(const std::string& msg_id);

    void DispatchSystem(const std::string& from, const SystemMessage& message);

    keyexchange::KeyExchangeManager& keys_;
    signaling::RelayClient& relay_;
    configuration::RelayConfig config_;
    InboundDecryptor decryptor_;
    std::shared_ptr<interfaces::IMessageSink> sink_;
    std::shared_ptr<interfaces::ISignalHandler> signal_handler_;
    std::deque<std::string> seen_order_;
    std::unordered_set<std::string> seen_;
};

} // namespace cipherlink::messaging
