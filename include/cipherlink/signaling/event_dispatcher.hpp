#pragma once

#include "cipherlink/call/call_negotiator.hpp"
#include "cipherlink/keyexchange/key_exchange_manager.hpp"
#include "cipherlink/messaging/messaging_service.hpp"
#include "cipherlink/signaling/relay_client.hpp"
#include "cipherlink/signaling/relay_events.hpp"

#include <cstddef>

namespace cipherlink::signaling {

/**
 * @brief Routes inbound relay events on the dispatch context
 *
 * messages and receipts -> MessagingService
 * call signalling and roster -> CallNegotiator
 * presence keys -> KeyExchangeManager
 * salt replies -> the oldest pending RelayClient lookup
 *
 * The negotiator is optional: it exists only while an account is active.
 */
class EventDispatcher {
public:
    EventDispatcher(
        RelayClient& relay,
        messaging::MessagingService& messaging,
        keyexchange::KeyExchangeManager& keys);

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void SetNegotiator(call::CallNegotiator* negotiator) noexcept { negotiator_ = negotiator; }

    /// @return number of events handled
    size_t DrainPending();

    void Dispatch(const InboundEvent& event);

private:
    void Handle(const SaltFound& event);
    void Handle(const SaltNotFound& event);
    void Handle(const RelayPush& event);
    void Handle(const QueueFlush& event);
    void Handle(const MsgAckPush& event);
    void Handle(const DispatchStatus& event);
    void Handle(const SignalPush& event);
    void Handle(const CallParticipantsList& event);
    void Handle(const CallUserJoined& event);
    void Handle(const CallUserLeft& event);
    void Handle(const PresenceUpdate& event);
    void Handle(const PresenceAll& event);

    RelayClient& relay_;
    messaging::MessagingService& messaging_;
    keyexchange::KeyExchangeManager& keys_;
    call::CallNegotiator* negotiator_ = nullptr;
};

} // namespace cipherlink::signaling
