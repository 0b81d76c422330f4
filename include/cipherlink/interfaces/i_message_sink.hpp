#pragma once
#include "cipherlink/messaging/chat_payload.hpp"
#include "cipherlink/signaling/relay_events.hpp"
#include <cstdint>
#include <string>
namespace cipherlink::interfaces {
struct InboundMessage {
    std::string msg_id;
    std::string from;
    std::string conversation_id;
    int64_t timestamp = 0;
    bool is_echo = false;
    bool undecryptable = false;
    /// PlainMessage or Unrecognized (sentinel text when undecryptable)
    messaging::ChatPayload payload;
};
/// Application side of the messaging service
class IMessageSink {
public:
    virtual ~IMessageSink() = default;
    virtual void OnMessage(const InboundMessage& message) = 0;
    virtual void OnSystemMessage(const std::string& from, const messaging::SystemMessage& message) = 0;
    virtual void OnReadReceipt(const std::string& from, const std::string& msg_id) = 0;
    virtual void OnDeliveryStatus(const signaling::DispatchStatus& status) = 0;
};
}
