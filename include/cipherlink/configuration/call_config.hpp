#pragma once

#include <array>
#include <cstddef>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace cipherlink::configuration {

/// Timing, media and ICE settings for the call layer.
///
/// The debounce and polling values are the ones the negotiator and the
/// voice-activity monitor schedule against; tests shorten nothing and drive
/// a virtual clock instead.
class CallConfig {
public:
    static constexpr std::array<std::string_view, 5> DEFAULT_ICE_SERVERS = {
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302",
        "stun:stun2.l.google.com:19302",
        "stun:stun3.l.google.com:19302",
        "stun:stun4.l.google.com:19302",
    };

    [[nodiscard]] static constexpr CallConfig Default() noexcept {
        return CallConfig(
            std::chrono::milliseconds(1500),
            std::chrono::milliseconds(100),
            std::chrono::milliseconds(100),
            15,
            1280,
            720);
    }

    /// Grace period before a terminal connection state ends a 1:1 call
    /// (or removes the peer from a group call)
    [[nodiscard]] constexpr std::chrono::milliseconds HangupDebounce() const noexcept {
        return hangup_debounce_;
    }

    /// Delay before leaving once the 1:1 peer (or the last peer) has left
    [[nodiscard]] constexpr std::chrono::milliseconds PeerLeftHangupDelay() const noexcept {
        return peer_left_delay_;
    }

    [[nodiscard]] constexpr std::chrono::milliseconds VoiceActivityInterval() const noexcept {
        return vad_interval_;
    }

    /// Mean byte-frequency energy (0-255) above which a participant is speaking
    [[nodiscard]] constexpr uint8_t VoiceActivityThreshold() const noexcept {
        return vad_threshold_;
    }

    [[nodiscard]] constexpr uint32_t IdealVideoWidth() const noexcept { return ideal_width_; }
    [[nodiscard]] constexpr uint32_t IdealVideoHeight() const noexcept { return ideal_height_; }

    /// Peers whose candidates may wait for a session; the oldest is evicted beyond this
    [[nodiscard]] constexpr size_t MaxPreSessionPeers() const noexcept { return MAX_PRE_SESSION_PEERS; }

    /// Candidates kept per peer before its session exists; later ones are dropped
    [[nodiscard]] constexpr size_t MaxPreSessionCandidates() const noexcept { return MAX_PRE_SESSION_CANDIDATES; }

    [[nodiscard]] static constexpr const std::array<std::string_view, 5>& IceServers() noexcept {
        return DEFAULT_ICE_SERVERS;
    }

    static constexpr size_t MAX_PRE_SESSION_PEERS = 8;
    static constexpr size_t MAX_PRE_SESSION_CANDIDATES = 32;

private:
    constexpr CallConfig(
        const std::chrono::milliseconds hangup_debounce,
        const std::chrono::milliseconds peer_left_delay,
        const std::chrono::milliseconds vad_interval,
        const uint8_t vad_threshold,
        const uint32_t ideal_width,
        const uint32_t ideal_height) noexcept
        : hangup_debounce_(hangup_debounce)
        , peer_left_delay_(peer_left_delay)
        , vad_interval_(vad_interval)
        , vad_threshold_(vad_threshold)
        , ideal_width_(ideal_width)
        , ideal_height_(ideal_height) {}

    std::chrono::milliseconds hangup_debounce_;
    std::chrono::milliseconds peer_left_delay_;
    std::chrono::milliseconds vad_interval_;
    uint8_t vad_threshold_;
    uint32_t ideal_width_;
    uint32_t ideal_height_;
};

} // namespace cipherlink::configuration
