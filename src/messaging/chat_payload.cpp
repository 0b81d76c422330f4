#include "cipherlink/messaging/chat_payload.hpp"
#include "messaging/chat_payload.pb.h"

namespace cipherlink::messaging {

namespace {
    using ProtoKind = proto::messaging::SystemKind;

    std::optional<SystemKind> FromProto(const ProtoKind kind) {
        switch (kind) {
            case proto::messaging::SYSTEM_KIND_FRIEND_REQUEST: return SystemKind::FriendRequest;
            case proto::messaging::SYSTEM_KIND_FRIEND_ACCEPT: return SystemKind::FriendAccept;
            case proto::messaging::SYSTEM_KIND_FRIEND_REJECT: return SystemKind::FriendReject;
            case proto::messaging::SYSTEM_KIND_E2EE_PING: return SystemKind::E2eePing;
            case proto::messaging::SYSTEM_KIND_E2EE_PONG: return SystemKind::E2eePong;
            case proto::messaging::SYSTEM_KIND_WEBRTC_SIGNAL: return SystemKind::WebRtcSignal;
            default: return std::nullopt;
        }
    }

    ProtoKind ToProto(const SystemKind kind) {
        switch (kind) {
            case SystemKind::FriendRequest: return proto::messaging::SYSTEM_KIND_FRIEND_REQUEST;
            case SystemKind::FriendAccept: return proto::messaging::SYSTEM_KIND_FRIEND_ACCEPT;
            case SystemKind::FriendReject: return proto::messaging::SYSTEM_KIND_FRIEND_REJECT;
            case SystemKind::E2eePing: return proto::messaging::SYSTEM_KIND_E2EE_PING;
            case SystemKind::E2eePong: return proto::messaging::SYSTEM_KIND_E2EE_PONG;
            case SystemKind::WebRtcSignal: return proto::messaging::SYSTEM_KIND_WEBRTC_SIGNAL;
        }
        return proto::messaging::SYSTEM_KIND_UNSPECIFIED;
    }

    std::optional<std::string> NonEmpty(const std::string& value) {
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
}

ChatPayload ChatPayloadCodec::Parse(const std::string_view plaintext) {
    proto::messaging::ChatPayload parsed;
    if (!parsed.ParseFromArray(plaintext.data(), static_cast<int>(plaintext.size()))) {
        return Unrecognized{std::string(plaintext)};
    }

    switch (parsed.body_case()) {
        case proto::messaging::ChatPayload::kSystem: {
            const auto& system = parsed.system();
            const auto kind = FromProto(system.kind());
            if (!kind.has_value()) {
                return Unrecognized{std::string(plaintext)};
            }
            SystemMessage message;
            message.kind = *kind;
            message.username = system.username();
            if (*kind == SystemKind::WebRtcSignal) {
                if (!system.has_signal()) {
                    return Unrecognized{std::string(plaintext)};
                }
                message.signal = system.signal();
            }
            return message;
        }
        case proto::messaging::ChatPayload::kPlain: {
            const auto& plain = parsed.plain();
            PlainMessage message;
            message.text = plain.text();
            message.timestamp = plain.timestamp();
            if (plain.has_reply_to()) {
                message.reply_to = ReplyReference{
                    plain.reply_to().message_id(),
                    plain.reply_to().text(),
                    plain.reply_to().sender()};
            }
            message.group_id = NonEmpty(plain.group_id());
            message.group_name = NonEmpty(plain.group_name());
            message.participants.assign(plain.participants().begin(), plain.participants().end());
            return message;
        }
        case proto::messaging::ChatPayload::BODY_NOT_SET:
            break;
    }
    return Unrecognized{std::string(plaintext)};
}

std::string ChatPayloadCodec::Serialize(const SystemMessage& message) {
    proto::messaging::ChatPayload payload;
    auto* system = payload.mutable_system();
    system->set_kind(ToProto(message.kind));
    system->set_username(message.username);
    if (message.signal.has_value()) {
        *system->mutable_signal() = *message.signal;
    }
    return payload.SerializeAsString();
}

std::string ChatPayloadCodec::Serialize(const PlainMessage& message) {
    proto::messaging::ChatPayload payload;
    auto* plain = payload.mutable_plain();
    plain->set_text(message.text);
    plain->set_timestamp(message.timestamp);
    if (message.reply_to.has_value()) {
        auto* reply = plain->mutable_reply_to();
        reply->set_message_id(message.reply_to->message_id);
        reply->set_text(message.reply_to->text);
        reply->set_sender(message.reply_to->sender);
    }
    if (message.group_id.has_value()) {
        plain->set_group_id(*message.group_id);
    }
    if (message.group_name.has_value()) {
        plain->set_group_name(*message.group_name);
    }
    for (const auto& participant : message.participants) {
        plain->add_participants(participant);
    }
    return payload.SerializeAsString();
}

std::string_view ToString(const SystemKind kind) noexcept {
    switch (kind) {
        case SystemKind::FriendRequest: return "FRIEND_REQUEST";
        case SystemKind::FriendAccept: return "FRIEND_ACCEPT";
        case SystemKind::FriendReject: return "FRIEND_REJECT";
        case SystemKind::E2eePing: return "E2EE_PING";
        case SystemKind::E2eePong: return "E2EE_PONG";
        case SystemKind::WebRtcSignal: return "WEBRTC_SIGNAL";
    }
    return "UNKNOWN";
}

} // namespace cipherlink::messaging
