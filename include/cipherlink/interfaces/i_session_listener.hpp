#pragma once
#include "cipherlink/call/rtc_types.hpp"
#include "cipherlink/interfaces/i_media_devices.hpp"
#include <memory>
#include <string>
namespace cipherlink::interfaces {
/// Per-peer connection events, already filtered to the live session
class ISessionListener {
public:
    virtual ~ISessionListener() = default;
    virtual void OnLocalCandidate(const std::string& peer_uuid, const call::IceCandidate& candidate) = 0;
    virtual void OnRemoteStream(const std::string& peer_uuid, std::shared_ptr<IMediaStream> stream) = 0;
    virtual void OnSessionStateChanged(const std::string& peer_uuid,
                                       call::PeerConnectionState connection_state,
                                       call::IceConnectionState ice_state) = 0;
};
}
