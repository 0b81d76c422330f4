#include "cipherlink/signaling/signaling_queue.hpp"
#include "cipherlink/core/format.hpp"
#include "cipherlink/debug/event_logger.hpp"

namespace cipherlink::signaling {

SignalingQueue::SignalingQueue(const size_t capacity)
    : capacity_(capacity) {}

Result<Unit, CipherlinkFailure> SignalingQueue::TryPush(InboundEvent event) {
    Notifier notifier;
    {
        std::lock_guard lock(mutex_);
        if (events_.size() >= capacity_) {
            CIPHERLINK_LOG_VALUE(debug::Component::Relay, "inbound queue full", "capacity", capacity_);
            return Result<Unit, CipherlinkFailure>::Err(CipherlinkFailure::QueueFull(
                compat::format("Inbound queue at capacity ({})", capacity_)));
        }
        events_.push_back(std::move(event));
        notifier = notifier_;
    }
    if (notifier) {
        notifier();
    }
    return Result<Unit, CipherlinkFailure>::Ok(unit);
}

std::optional<InboundEvent> SignalingQueue::TryPop() {
    std::lock_guard lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    InboundEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<InboundEvent> SignalingQueue::DrainAll() {
    std::lock_guard lock(mutex_);
    std::vector<InboundEvent> drained;
    drained.reserve(events_.size());
    for (auto& event : events_) {
        drained.push_back(std::move(event));
    }
    events_.clear();
    return drained;
}

void SignalingQueue::SetNotifier(Notifier notifier) {
    std::lock_guard lock(mutex_);
    notifier_ = std::move(notifier);
}

size_t SignalingQueue::Size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

} // namespace cipherlink::signaling
