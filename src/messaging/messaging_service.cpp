#include "cipherlink/messaging/messaging_service.hpp"
#include "cipherlink/messaging/envelope_codec.hpp"
#include "cipherlink/crypto/sodium_interop.hpp"
#include "cipherlink/core/format.hpp"
#include "cipherlink/debug/event_logger.hpp"

#include <chrono>

namespace cipherlink::messaging {

namespace {
    int64_t NowMs() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string FallbackMessageId(const signaling::RelayPush& push) {
        return compat::format("msg_{}_{}", push.timestamp, push.from);
    }
}

MessagingService::MessagingService(
    keyexchange::KeyExchangeManager& keys,
    signaling::RelayClient& relay,
    const configuration::RelayConfig config)
    : keys_(keys)
    , relay_(relay)
    , config_(config)
    , decryptor_(keys) {}

void MessagingService::SetMessageSink(std::shared_ptr<interfaces::IMessageSink> sink) {
    sink_ = std::move(sink);
}

void MessagingService::SetSignalHandler(std::shared_ptr<interfaces::ISignalHandler> handler) {
    signal_handler_ = std::move(handler);
}

Result<Unit, CipherlinkFailure> MessagingService::SendPayload(
    const std::string& to,
    const std::string& plaintext,
    const std::string& msg_id) {
    auto key = keys_.ResolveOutboundKey(to);
    if (key.IsErr()) {
        return Result<Unit, CipherlinkFailure>::Err(std::move(key).UnwrapErr());
    }
    auto& key_bytes = key.Unwrap();
    auto envelope = EnvelopeCodec::Encode(plaintext, key_bytes);
    (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(key_bytes));
    if (envelope.IsErr()) {
        return Result<Unit, CipherlinkFailure>::Err(std::move(envelope).UnwrapErr());
    }

    std::vector<uint8_t> own_key;
    if (auto raw = keys_.LocalPublicRaw(); raw.IsOk()) {
        own_key = std::move(raw).Unwrap();
    }
    auto wire = EnvelopeCodec::Pack(envelope.Unwrap(), own_key);
    CIPHERLINK_LOG_VALUE(debug::Component::Messaging, "relay", "bytes", wire.size());
    return relay_.Send(signaling::RelayMessage{to, std::move(wire), msg_id});
}

Result<std::string, CipherlinkFailure> MessagingService::SendText(
    const std::string& to,
    const std::string& text,
    std::optional<ReplyReference> reply_to) {
    PlainMessage message;
    message.text = text;
    message.timestamp = NowMs();
    message.reply_to = std::move(reply_to);

    const auto msg_id = crypto::SodiumInterop::GenerateUuidV4();
    if (auto sent = SendPayload(to, ChatPayloadCodec::Serialize(message), msg_id); sent.IsErr()) {
        return Result<std::string, CipherlinkFailure>::Err(std::move(sent).UnwrapErr());
    }
    return Result<std::string, CipherlinkFailure>::Ok(msg_id);
}

Result<std::string, CipherlinkFailure> MessagingService::SendToGroup(
    const std::string& group_id,
    const std::string& group_name,
    const std::vector<std::string>& participants,
    const std::string& text) {
    if (!keys_.IsActive()) {
        return Result<std::string, CipherlinkFailure>::Err(
            CipherlinkFailure::InvalidState("No active account"));
    }
    PlainMessage message;
    message.text = text;
    message.timestamp = NowMs();
    message.group_id = group_id;
    message.group_name = group_name;
    message.participants = participants;
    const auto plaintext = ChatPayloadCodec::Serialize(message);
    const auto msg_id = crypto::SodiumInterop::GenerateUuidV4();
    const auto& self = keys_.Account().Uuid();

    std::optional<CipherlinkFailure> first_failure;
    for (const auto& participant : participants) {
        if (participant == self) {
            continue;
        }
        if (auto sent = SendPayload(participant, plaintext, msg_id); sent.IsErr()) {
            CIPHERLINK_LOG_PEER(debug::Component::Messaging, "group fan-out failed", participant,
                sent.UnwrapErr().message);
            if (!first_failure) {
                first_failure = std::move(sent).UnwrapErr();
            }
        }
    }
    if (first_failure) {
        return Result<std::string, CipherlinkFailure>::Err(std::move(*first_failure));
    }
    return Result<std::string, CipherlinkFailure>::Ok(msg_id);
}

Result<Unit, CipherlinkFailure> MessagingService::SendSystem(const std::string& to, const SystemKind kind) {
    if (!keys_.IsActive()) {
        return Result<Unit, CipherlinkFailure>::Err(CipherlinkFailure::InvalidState("No active account"));
    }
    SystemMessage message;
    message.kind = kind;
    message.username = keys_.Account().DisplayName();
    CIPHERLINK_LOG_PEER(debug::Component::Messaging, ToString(kind).data(), to, "");
    return SendPayload(to, ChatPayloadCodec::Serialize(message), crypto::SodiumInterop::GenerateUuidV4());
}

Result<Unit, CipherlinkFailure> MessagingService::Acknowledge(const std::string& from, const std::string& msg_id) {
    return relay_.Send(signaling::MsgAck{from, msg_id});
}

bool MessagingService::IsDuplicate(const std::string& msg_id) {
    if (seen_.contains(msg_id)) {
        return true;
    }
    seen_.insert(msg_id);
    seen_order_.push_back(msg_id);
    while (seen_order_.size() > config_.DuplicateWindow()) {
        seen_.erase(seen_order_.front());
        seen_order_.pop_front();
    }
    return false;
}

void MessagingService::OnRelayPush(const signaling::RelayPush& push) {
    if (!keys_.IsActive()) {
        CIPHERLINK_LOG_PEER(debug::Component::Messaging, "push without account", push.from, "");
        return;
    }
    // Redeliveries have no effect at all, a repeated rehandshake ping included
    const auto msg_id = push.msg_id.empty() ? FallbackMessageId(push) : push.msg_id;
    if (IsDuplicate(msg_id)) {
        CIPHERLINK_LOG_PEER(debug::Component::Messaging, "duplicate dropped", push.from, msg_id);
        return;
    }

    const InboundContext context{push.from, push.to, keys_.Account().Uuid()};
    auto decrypted = decryptor_.Decrypt(push.payload, context);

    if (decrypted.request_rehandshake) {
        CIPHERLINK_LOG_PEER(debug::Component::Messaging, "requesting rehandshake", push.from, "");
        if (auto pinged = SendSystem(push.from, SystemKind::E2eePing); pinged.IsErr()) {
            CIPHERLINK_LOG_PEER(debug::Component::Messaging, "ping failed", push.from, pinged.UnwrapErr().message);
        }
    }

    ChatPayload payload = decrypted.undecryptable
        ? ChatPayload(Unrecognized{decrypted.plaintext})
        : ChatPayloadCodec::Parse(decrypted.plaintext);

    if (const auto* system = std::get_if<SystemMessage>(&payload)) {
        // Our own system traffic echoed back needs no reaction
        if (!decrypted.is_echo) {
            DispatchSystem(push.from, *system);
        }
        return;
    }

    if (sink_) {
        interfaces::InboundMessage message{
            msg_id,
            push.from,
            decrypted.conversation_id,
            push.timestamp,
            decrypted.is_echo,
            decrypted.undecryptable,
            std::move(payload)};
        sink_->OnMessage(message);
    }
}

void MessagingService::DispatchSystem(const std::string& from, const SystemMessage& message) {
    switch (message.kind) {
        case SystemKind::E2eePing:
            if (auto ponged = SendSystem(from, SystemKind::E2eePong); ponged.IsErr()) {
                CIPHERLINK_LOG_PEER(debug::Component::Messaging, "pong failed", from, ponged.UnwrapErr().message);
            }
            break;
        case SystemKind::E2eePong:
            break;
        case SystemKind::WebRtcSignal:
            if (signal_handler_ && message.signal.has_value()) {
                signal_handler_->OnSignal(from, *message.signal);
            }
            break;
        case SystemKind::FriendRequest:
        case SystemKind::FriendAccept:
        case SystemKind::FriendReject:
            if (sink_) {
                sink_->OnSystemMessage(from, message);
            }
            break;
    }
}

void MessagingService::OnQueueFlush(const signaling::QueueFlush& flush) {
    CIPHERLINK_LOG_VALUE(debug::Component::Messaging, "queue flush", "count", flush.payloads.size());
    for (const auto& push : flush.payloads) {
        OnRelayPush(push);
    }
}

void MessagingService::OnAckPush(const signaling::MsgAckPush& ack) {
    if (sink_) {
        sink_->OnReadReceipt(ack.from, ack.msg_id);
    }
}

void MessagingService::OnDispatchStatus(const signaling::DispatchStatus& status) {
    if (sink_) {
        sink_->OnDeliveryStatus(status);
    }
}

} // namespace cipherlink::messaging
