#include "cipherlink/call/voice_activity_monitor.hpp"

#include <numeric>

namespace cipherlink::call {

VoiceActivityMonitor::VoiceActivityMonitor(
    interfaces::IScheduler& scheduler,
    const configuration::CallConfig config)
    : scheduler_(scheduler)
    , config_(config) {}

VoiceActivityMonitor::~VoiceActivityMonitor() {
    Stop();
}

void VoiceActivityMonitor::Start(std::function<void()> sample) {
    Stop();
    sample_ = std::move(sample);
    Arm();
}

void VoiceActivityMonitor::Stop() noexcept {
    if (timer_ != interfaces::INVALID_TIMER) {
        scheduler_.Cancel(timer_);
        timer_ = interfaces::INVALID_TIMER;
    }
    sample_ = nullptr;
}

void VoiceActivityMonitor::Arm() {
    timer_ = scheduler_.ScheduleAfter(config_.VoiceActivityInterval(), [this] {
        timer_ = interfaces::INVALID_TIMER;
        if (!sample_) {
            return;
        }
        Arm();
        // Copied: the sampler may Stop() the monitor and reset sample_
        const auto sample = sample_;
        sample();
    });
}

double VoiceActivityMonitor::MeanEnergy(std::span<const uint8_t> bins) noexcept {
    if (bins.empty()) {
        return 0.0;
    }
    const uint64_t total = std::accumulate(bins.begin(), bins.end(), uint64_t{0});
    return static_cast<double>(total) / static_cast<double>(bins.size());
}

bool VoiceActivityMonitor::IsSpeaking(std::span<const uint8_t> bins, const uint8_t threshold) noexcept {
    return MeanEnergy(bins) > static_cast<double>(threshold);
}

} // namespace cipherlink::call
