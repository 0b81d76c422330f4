#pragma once

#include "call/call_signal.pb.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cipherlink::messaging {

enum class SystemKind {
    FriendRequest,
    FriendAccept,
    FriendReject,
    E2eePing,
    E2eePong,
    WebRtcSignal
};

struct ReplyReference {
    std::string message_id;
    std::string text;
    std::string sender;
};

struct SystemMessage {
    SystemKind kind = SystemKind::E2eePing;
    std::string username;
    /// Set only for WebRtcSignal
    std::optional<proto::call::CallSignal> signal;
};

struct PlainMessage {
    std::string text;
    int64_t timestamp = 0;
    std::optional<ReplyReference> reply_to;
    std::optional<std::string> group_id;
    std::optional<std::string> group_name;
    std::vector<std::string> participants;
};

/// Plaintext that is not a ChatPayload, including the undecryptable sentinel
struct Unrecognized {
    std::string text;
};

using ChatPayload = std::variant<SystemMessage, PlainMessage, Unrecognized>;

class ChatPayloadCodec {
public:
    /// Never fails: anything that does not parse becomes Unrecognized
    [[nodiscard]] static ChatPayload Parse(std::string_view plaintext);

    [[nodiscard]] static std::string Serialize(const SystemMessage& message);
    [[nodiscard]] static std::string Serialize(const PlainMessage& message);

    [[nodiscard]] static bool IsSystem(const ChatPayload& payload) noexcept {
        return std::holds_alternative<SystemMessage>(payload);
    }

private:
    ChatPayloadCodec() = delete;
};

[[nodiscard]] std::string_view ToString(SystemKind kind) noexcept;

} // namespace cipherlink::messaging
