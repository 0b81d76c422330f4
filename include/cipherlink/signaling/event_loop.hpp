#pragma once

#include "cipherlink/interfaces/i_scheduler.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace cipherlink::signaling {

/**
 * @brief The single dispatch context
 *
 * Runs posted tasks and expired timers on the thread that calls Run().
 * Post() and Stop() may be called from any thread; ScheduleAfter() and
 * Cancel() too, but tasks always execute on the loop thread.
 */
class EventLoop final : public interfaces::IScheduler {
public:
    EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Post(std::function<void()> task);

    interfaces::TimerId ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> task) override;
    void Cancel(interfaces::TimerId id) override;
    [[nodiscard]] std::chrono::steady_clock::time_point Now() const override;

    /// Blocks until Stop()
    void Run();

    /// Runs what is ready now without blocking; returns the number of tasks run
    size_t RunPending();

    void Stop();

private:
    using Deadline = std::pair<std::chrono::steady_clock::time_point, interfaces::TimerId>;

    /// Moves due timers into the ready list. Caller holds the lock.
    void CollectDueTimers(std::chrono::steady_clock::time_point now);

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> ready_;
    std::map<Deadline, std::function<void()>> timers_;
    std::map<interfaces::TimerId, std::chrono::steady_clock::time_point> deadlines_;
    interfaces::TimerId next_timer_ = 1;
    bool stopping_ = false;
};

} // namespace cipherlink::signaling
