#pragma once

#include "cipherlink/configuration/call_config.hpp"
#include "cipherlink/interfaces/i_scheduler.hpp"

#include <cstdint>
#include <functional>
#include <span>

namespace cipherlink::call {

/**
 * @brief Periodic voice-activity sampling
 *
 * Presentation only: the speaking flags it produces never feed back into
 * negotiation or acknowledgement.
 */
class VoiceActivityMonitor {
public:
    VoiceActivityMonitor(interfaces::IScheduler& scheduler, configuration::CallConfig config);
    ~VoiceActivityMonitor();

    VoiceActivityMonitor(const VoiceActivityMonitor&) = delete;
    VoiceActivityMonitor& operator=(const VoiceActivityMonitor&) = delete;

    /// Calls sample every interval until Stop(); restarting replaces the sampler
    void Start(std::function<void()> sample);
    void Stop() noexcept;
    [[nodiscard]] bool IsRunning() const noexcept { return timer_ != interfaces::INVALID_TIMER; }

    [[nodiscard]] static double MeanEnergy(std::span<const uint8_t> bins) noexcept;
    [[nodiscard]] static bool IsSpeaking(std::span<const uint8_t> bins, uint8_t threshold) noexcept;

private:
    void Arm();

    interfaces::IScheduler& scheduler_;
    configuration::CallConfig config_;
    std::function<void()> sample_;
    interfaces::TimerId timer_ = interfaces::INVALID_TIMER;
};

} // namespace cipherlink::call
