#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
namespace cipherlink::interfaces {
using TimerId = uint64_t;
inline constexpr TimerId INVALID_TIMER = 0;
/// One-shot timers on the dispatch context. Cancel of a fired or unknown id is a no-op.
class IScheduler {
public:
    virtual ~IScheduler() = default;
    virtual TimerId ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> task) = 0;
    virtual void Cancel(TimerId id) = 0;
    [[nodiscard]] virtual std::chrono::steady_clock::time_point Now() const = 0;
};
}
