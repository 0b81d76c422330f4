#pragma once

#include "cipherlink/call/rtc_types.hpp"
#include "cipherlink/interfaces/i_media_devices.hpp"
#include "cipherlink/interfaces/i_peer_connection.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cipherlink::call {

class CallSessionRegistry;

/// Routes native connection events back to the registry, tagged with the session id
class SessionObserver final : public interfaces::IPeerConnectionObserver {
public:
    SessionObserver(CallSessionRegistry& registry, std::string peer_uuid, uint64_t session_id);

    void OnIceCandidate(const IceCandidate& candidate) override;
    void OnTrack(std::shared_ptr<interfaces::IMediaTrack> track,
                 std::shared_ptr<interfaces::IMediaStream> stream) override;
    void OnConnectionStateChange(PeerConnectionState state) override;
    void OnIceConnectionStateChange(IceConnectionState state) override;

private:
    CallSessionRegistry& registry_;
    std::string peer_uuid_;
    uint64_t session_id_;
};

/**
 * @brief One native connection to one remote participant
 *
 * `id` is unique for the registry's lifetime; callbacks carrying an id that
 * no longer matches the live session for the peer are dropped.
 * The observer is declared before the connection so it outlives it.
 */
struct PeerSession {
    uint64_t id = 0;
    std::string peer_uuid;
    std::unique_ptr<SessionObserver> observer;
    std::unique_ptr<interfaces::IPeerConnection> connection;
    std::shared_ptr<interfaces::IMediaStream> remote_stream;
    PeerConnectionState connection_state = PeerConnectionState::New;
    IceConnectionState ice_state = IceConnectionState::New;
    std::vector<IceCandidate> candidate_queue;
    // Set from CreateOffer until its SetLocalDescription completes
    bool making_offer = false;
    std::unique_ptr<interfaces::IAudioAnalyser> analyser;
    bool speaking = false;

    PeerSession() = default;
    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;
    ~PeerSession();
};

} // namespace cipherlink::call
