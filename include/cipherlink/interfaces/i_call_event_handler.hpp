#pragma once
#include "cipherlink/core/failures.hpp"
#include "cipherlink/call/rtc_types.hpp"
#include "cipherlink/interfaces/i_media_devices.hpp"
#include <chrono>
#include <memory>
#include <string>
namespace cipherlink::interfaces {
struct IncomingCall {
    std::string from;
    std::string group_id;
    call::CallType call_type = call::CallType::Voice;
};
class ICallEventHandler {
public:
    virtual ~ICallEventHandler() = default;
    virtual void OnIncomingCall(const IncomingCall& call) = 0;
    virtual void OnCallStarted(const std::string& group_id, call::CallRole role, call::CallType type) = 0;
    virtual void OnCallEnded(std::chrono::milliseconds duration) = 0;
    virtual void OnCallFailed(const CipherlinkFailure& failure) = 0;
    virtual void OnPeerUpdated(const std::string& peer_uuid,
                               call::PeerConnectionState connection_state,
                               call::IceConnectionState ice_state) = 0;
    virtual void OnSpeakingChanged(const std::string& peer_uuid, bool speaking) = 0;
    virtual void OnRemoteStream(const std::string& peer_uuid, std::shared_ptr<IMediaStream> stream) = 0;
    virtual void OnPeerRemoved(const std::string& peer_uuid) = 0;
};
}
