#pragma once
#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/signaling/relay_events.hpp"
namespace cipherlink::interfaces {
/// Called from the transport's own thread. A QueueFull error is backpressure.
class IInboundEventSink {
public:
    virtual ~IInboundEventSink() = default;
    [[nodiscard]] virtual Result<Unit, CipherlinkFailure> Deliver(signaling::InboundEvent event) = 0;
};
/**
 * Ordered, at-least-once connection to the relay. Reconnection and
 * re-registration after reconnect belong to the implementation.
 */
class IRelayTransport {
public:
    virtual ~IRelayTransport() = default;
    [[nodiscard]] virtual Result<Unit, CipherlinkFailure> Open(IInboundEventSink& sink) = 0;
    virtual void Close() noexcept = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;
    [[nodiscard]] virtual Result<Unit, CipherlinkFailure> Send(const signaling::OutboundEvent& event) = 0;
};
}
