#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cipherlink::call {

enum class SignalingState {
    Stable,
    HaveLocalOffer,
    HaveRemoteOffer,
    Closed
};

enum class PeerConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

enum class IceConnectionState {
    New,
    Checking,
    Connected,
    Completed,
    Disconnected,
    Failed,
    Closed
};

enum class SdpType {
    Offer,
    Answer
};

enum class MediaKind {
    Audio,
    Video
};

enum class CallType {
    Voice,
    Video
};

enum class CallRole {
    OneToOne,
    Group
};

struct SessionDescription {
    SdpType type = SdpType::Offer;
    std::string sdp;
};

struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    int32_t sdp_mline_index = 0;

    bool operator==(const IceCandidate&) const = default;
};

struct RtcConfiguration {
    std::vector<std::string> ice_servers;
};

[[nodiscard]] constexpr bool IsTerminal(const PeerConnectionState state) noexcept {
    return state == PeerConnectionState::Disconnected ||
           state == PeerConnectionState::Failed ||
           state == PeerConnectionState::Closed;
}

[[nodiscard]] constexpr bool IsTerminal(const IceConnectionState state) noexcept {
    return state == IceConnectionState::Disconnected ||
           state == IceConnectionState::Failed ||
           state == IceConnectionState::Closed;
}

[[nodiscard]] constexpr std::string_view ToString(const SignalingState state) noexcept {
    switch (state) {
        case SignalingState::Stable: return "stable";
        case SignalingState::HaveLocalOffer: return "have-local-offer";
        case SignalingState::HaveRemoteOffer: return "have-remote-offer";
        case SignalingState::Closed: return "closed";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view ToString(const PeerConnectionState state) noexcept {
    switch (state) {
        case PeerConnectionState::New: return "new";
        case PeerConnectionState::Connecting: return "connecting";
        case PeerConnectionState::Connected: return "connected";
        case PeerConnectionState::Disconnected: return "disconnected";
        case PeerConnectionState::Failed: return "failed";
        case PeerConnectionState::Closed: return "closed";
    }
    return "unknown";
}

} // namespace cipherlink::call
