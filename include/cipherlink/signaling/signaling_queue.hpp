#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/signaling/relay_events.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace cipherlink::signaling {

/**
 * @brief Bounded multi-producer, single-consumer queue of inbound relay events
 *
 * Producers (transport threads) call TryPush; a full queue refuses the event
 * with FailureType::QueueFull and the producer decides whether to retry.
 * The single consumer is the dispatch context.
 */
class SignalingQueue {
public:
    using Notifier = std::function<void()>;

    explicit SignalingQueue(size_t capacity);

    SignalingQueue(const SignalingQueue&) = delete;
    SignalingQueue& operator=(const SignalingQueue&) = delete;

    [[nodiscard]] Result<Unit, CipherlinkFailure> TryPush(InboundEvent event);

    [[nodiscard]] std::optional<InboundEvent> TryPop();

    /// Takes every queued event in arrival order
    [[nodiscard]] std::vector<InboundEvent> DrainAll();

    /// Invoked outside the lock after each accepted push, on the producer's thread
    void SetNotifier(Notifier notifier);

    [[nodiscard]] size_t Size() const;
    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<InboundEvent> events_;
    Notifier notifier_;
};

} // namespace cipherlink::signaling
