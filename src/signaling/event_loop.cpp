#include "cipherlink/signaling/event_loop.hpp"

namespace cipherlink::signaling {

void EventLoop::Post(std::function<void()> task) {
    {
        std::lock_guard lock(mutex_);
        ready_.push_back(std::move(task));
    }
    cv_.notify_one();
}

interfaces::TimerId EventLoop::ScheduleAfter(
    const std::chrono::milliseconds delay,
    std::function<void()> task) {
    interfaces::TimerId id;
    {
        std::lock_guard lock(mutex_);
        id = next_timer_++;
        const auto deadline = Now() + delay;
        timers_.emplace(Deadline{deadline, id}, std::move(task));
        deadlines_.emplace(id, deadline);
    }
    cv_.notify_one();
    return id;
}

void EventLoop::Cancel(const interfaces::TimerId id) {
    std::lock_guard lock(mutex_);
    const auto it = deadlines_.find(id);
    if (it == deadlines_.end()) {
        return;
    }
    timers_.erase(Deadline{it->second, id});
    deadlines_.erase(it);
}

std::chrono::steady_clock::time_point EventLoop::Now() const {
    return std::chrono::steady_clock::now();
}

void EventLoop::CollectDueTimers(const std::chrono::steady_clock::time_point now) {
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto node = timers_.extract(timers_.begin());
        deadlines_.erase(node.key().second);
        ready_.push_back(std::move(node.mapped()));
    }
}

void EventLoop::Run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            for (;;) {
                if (stopping_) {
                    stopping_ = false;
                    return;
                }
                CollectDueTimers(Now());
                if (!ready_.empty()) {
                    break;
                }
                if (timers_.empty()) {
                    cv_.wait(lock);
                } else {
                    cv_.wait_until(lock, timers_.begin()->first.first);
                }
            }
            task = std::move(ready_.front());
            ready_.pop_front();
        }
        task();
    }
}

size_t EventLoop::RunPending() {
    std::deque<std::function<void()>> batch;
    {
        std::lock_guard lock(mutex_);
        CollectDueTimers(Now());
        batch.swap(ready_);
    }
    for (auto& task : batch) {
        task();
    }
    return batch.size();
}

void EventLoop::Stop() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
}

} // namespace cipherlink::signaling
