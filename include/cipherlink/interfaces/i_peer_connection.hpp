#pragma once
#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/call/rtc_types.hpp"
#include "cipherlink/interfaces/i_media_devices.hpp"
#include <functional>
#include <memory>
namespace cipherlink::interfaces {
class IPeerConnectionObserver {
public:
    virtual ~IPeerConnectionObserver() = default;
    virtual void OnIceCandidate(const call::IceCandidate& candidate) = 0;
    virtual void OnTrack(std::shared_ptr<IMediaTrack> track, std::shared_ptr<IMediaStream> stream) = 0;
    virtual void OnConnectionStateChange(call::PeerConnectionState state) = 0;
    virtual void OnIceConnectionStateChange(call::IceConnectionState state) = 0;
};
/**
 * Native peer connection (RTCPeerConnection semantics).
 *
 * All callbacks, observer notifications included, are delivered on the
 * dispatch context. After Close() returns no further callbacks fire.
 * SetRemoteDescription with an offer while in have-local-offer performs an
 * implicit rollback of the local offer.
 */
class IPeerConnection {
public:
    using DescriptionCallback = std::function<void(Result<call::SessionDescription, CipherlinkFailure>)>;
    using CompletionCallback = std::function<void(Result<Unit, CipherlinkFailure>)>;
    virtual ~IPeerConnection() = default;
    virtual void CreateOffer(DescriptionCallback callback) = 0;
    virtual void CreateAnswer(DescriptionCallback callback) = 0;
    virtual void SetLocalDescription(const call::SessionDescription& description, CompletionCallback callback) = 0;
    virtual void SetRemoteDescription(const call::SessionDescription& description, CompletionCallback callback) = 0;
    [[nodiscard]] virtual Result<Unit, CipherlinkFailure> AddIceCandidate(const call::IceCandidate& candidate) = 0;
    virtual void AddTrack(std::shared_ptr<IMediaTrack> track, std::shared_ptr<IMediaStream> stream) = 0;
    [[nodiscard]] virtual call::SignalingState GetSignalingState() const = 0;
    [[nodiscard]] virtual bool HasRemoteDescription() const = 0;
    [[nodiscard]] virtual call::PeerConnectionState GetConnectionState() const = 0;
    virtual void Close() noexcept = 0;
};
class IPeerConnectionFactory {
public:
    virtual ~IPeerConnectionFactory() = default;
    /// observer outlives the returned connection
    [[nodiscard]] virtual std::unique_ptr<IPeerConnection> Create(
        const call::RtcConfiguration& configuration,
        IPeerConnectionObserver& observer) = 0;
};
}
