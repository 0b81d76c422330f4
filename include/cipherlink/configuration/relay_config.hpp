#pragma once

#include <chrono>
#include <cstddef>

namespace cipherlink::configuration {

/// Limits for the relay client: inbound queue depth, lookup timeout and the
/// size of the duplicate-suppression window for at-least-once delivery.
class RelayConfig {
public:
    [[nodiscard]] static constexpr RelayConfig Default() noexcept {
        return RelayConfig(1024, std::chrono::milliseconds(3000), 2000);
    }

    [[nodiscard]] static constexpr RelayConfig WithQueueCapacity(const size_t capacity) noexcept {
        return RelayConfig(capacity, Default().LookupTimeout(), Default().DuplicateWindow());
    }

    [[nodiscard]] constexpr size_t InboundQueueCapacity() const noexcept { return queue_capacity_; }
    [[nodiscard]] constexpr std::chrono::milliseconds LookupTimeout() const noexcept { return lookup_timeout_; }
    [[nodiscard]] constexpr size_t DuplicateWindow() const noexcept { return duplicate_window_; }

private:
    constexpr RelayConfig(
        const size_t queue_capacity,
        const std::chrono::milliseconds lookup_timeout,
        const size_t duplicate_window) noexcept
        : queue_capacity_(queue_capacity)
        , lookup_timeout_(lookup_timeout)
        , duplicate_window_(duplicate_window) {}

    size_t queue_capacity_;
    std::chrono::milliseconds lookup_timeout_;
    size_t duplicate_window_;
};

} // namespace cipherlink::configuration
