#include "cipherlink/signaling/event_dispatcher.hpp"
#include "cipherlink/debug/event_logger.hpp"

#include <variant>

namespace cipherlink::signaling {

EventDispatcher::EventDispatcher(
    RelayClient& relay,
    messaging::MessagingService& messaging,
    keyexchange::KeyExchangeManager& keys)
    : relay_(relay)
    , messaging_(messaging)
    , keys_(keys) {}

size_t EventDispatcher::DrainPending() {
    auto events = relay_.Inbound().DrainAll();
    for (const auto& event : events) {
        Dispatch(event);
    }
    return events.size();
}

void EventDispatcher::Dispatch(const InboundEvent& event) {
    std::visit([this](const auto& concrete) { Handle(concrete); }, event);
}

void EventDispatcher::Handle(const SaltFound& event) {
    relay_.ResolveLookup(event);
}

void EventDispatcher::Handle(const SaltNotFound&) {
    relay_.ResolveLookup(std::nullopt);
}

void EventDispatcher::Handle(const RelayPush& event) {
    messaging_.OnRelayPush(event);
}

void EventDispatcher::Handle(const QueueFlush& event) {
    messaging_.OnQueueFlush(event);
}

void EventDispatcher::Handle(const MsgAckPush& event) {
    messaging_.OnAckPush(event);
}

void EventDispatcher::Handle(const DispatchStatus& event) {
    messaging_.OnDispatchStatus(event);
}

void EventDispatcher::Handle(const SignalPush& event) {
    if (negotiator_) {
        negotiator_->OnSignal(event.from, event.body);
    }
}

void EventDispatcher::Handle(const CallParticipantsList& event) {
    if (negotiator_) {
        negotiator_->OnParticipantsList(event);
    }
}

void EventDispatcher::Handle(const CallUserJoined& event) {
    if (negotiator_) {
        negotiator_->OnUserJoined(event);
    }
}

void EventDispatcher::Handle(const CallUserLeft& event) {
    if (negotiator_) {
        negotiator_->OnUserLeft(event);
    }
}

void EventDispatcher::Handle(const PresenceUpdate& event) {
    if (!event.public_key.has_value() || !keys_.IsActive() || event.uuid == keys_.Account().Uuid()) {
        return;
    }
    if (auto observed = keys_.ObservePeerKey(event.uuid, *event.public_key); observed.IsErr()) {
        CIPHERLINK_LOG_PEER(debug::Component::Relay, "presence key rejected", event.uuid,
            observed.UnwrapErr().message);
    }
}

void EventDispatcher::Handle(const PresenceAll& event) {
    for (const auto& entry : event.entries) {
        Handle(entry);
    }
}

} // namespace cipherlink::signaling
