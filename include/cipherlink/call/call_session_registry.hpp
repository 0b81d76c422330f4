#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/call/peer_session.hpp"
#include "cipherlink/call/rtc_types.hpp"
#include "cipherlink/configuration/call_config.hpp"
#include "cipherlink/interfaces/i_media_devices.hpp"
#include "cipherlink/interfaces/i_peer_connection.hpp"
#include "cipherlink/interfaces/i_session_listener.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cipherlink::call {

/**
 * @brief Owner of every PeerSession of the current call
 *
 * ICE candidates are buffered until the session has a remote description.
 * Candidates that arrive before the session exists are kept per peer and
 * moved into the session when it is created; that buffer is bounded by
 * CallConfig::MaxPreSessionPeers and MaxPreSessionCandidates. After a successful
 * SetRemoteDescription the queue is detached and applied in arrival order,
 * so a candidate is applied at most once.
 *
 * Dispatch context only.
 */
class CallSessionRegistry {
public:
    explicit CallSessionRegistry(
        interfaces::IPeerConnectionFactory& factory,
        configuration::CallConfig config = configuration::CallConfig::Default());
    ~CallSessionRegistry();

    CallSessionRegistry(const CallSessionRegistry&) = delete;
    CallSessionRegistry& operator=(const CallSessionRegistry&) = delete;

    void SetListener(interfaces::ISessionListener* listener) noexcept { listener_ = listener; }

    /// Tracks of this stream are attached to every session created afterwards
    void SetLocalStream(std::shared_ptr<interfaces::IMediaStream> stream);

    /// Returns the existing session when there is one
    [[nodiscard]] Result<PeerSession*, CipherlinkFailure> CreateSession(const std::string& peer_uuid);

    [[nodiscard]] PeerSession* Find(const std::string& peer_uuid);
    [[nodiscard]] bool Contains(const std::string& peer_uuid) const;
    /// True while session_id is the live session of peer_uuid
    [[nodiscard]] bool IsCurrent(const std::string& peer_uuid, uint64_t session_id) const;
    [[nodiscard]] size_t Size() const noexcept { return sessions_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return sessions_.empty(); }
    [[nodiscard]] std::vector<std::string> PeerUuids() const;

    void EnqueueCandidate(const std::string& peer_uuid, const IceCandidate& candidate);

    [[nodiscard]] size_t BufferedCandidateCount(const std::string& peer_uuid) const;
    [[nodiscard]] size_t PreSessionPeerCount() const noexcept { return pre_session_candidates_.size(); }

    /// Completion runs after the queued candidates were applied
    void SetRemoteDescription(
        const std::string& peer_uuid,
        const SessionDescription& description,
        interfaces::IPeerConnection::CompletionCallback done);

    void AddTrackToAll(
        const std::shared_ptr<interfaces::IMediaTrack>& track,
        const std::shared_ptr<interfaces::IMediaStream>& stream);

    void AttachAnalyser(const std::string& peer_uuid, std::unique_ptr<interfaces::IAudioAnalyser> analyser);

    /// One sampling pass; returns the peers whose speaking flag flipped
    [[nodiscard]] std::vector<std::pair<std::string, bool>> SampleVoiceActivity(uint8_t threshold);

    void DropBufferedCandidates(const std::string& peer_uuid);
    void CloseSession(const std::string& peer_uuid) noexcept;
    void CloseAll() noexcept;

private:
    friend class SessionObserver;

    void HandleIceCandidate(const std::string& peer_uuid, uint64_t session_id, const IceCandidate& candidate);
    void HandleTrack(const std::string& peer_uuid, uint64_t session_id,
                     std::shared_ptr<interfaces::IMediaStream> stream);
    void HandleConnectionState(const std::string& peer_uuid, uint64_t session_id, PeerConnectionState state);
    void HandleIceState(const std::string& peer_uuid, uint64_t session_id, IceConnectionState state);

    [[nodiscard]] PeerSession* FindCurrent(const std::string& peer_uuid, uint64_t session_id);
    void FlushCandidates(PeerSession& session);
    void BufferPreSession(const std::string& peer_uuid, const IceCandidate& candidate);
    void ForgetPreSession(const std::string& peer_uuid);

    interfaces::IPeerConnectionFactory& factory_;
    configuration::CallConfig config_;
    interfaces::ISessionListener* listener_ = nullptr;
    std::shared_ptr<interfaces::IMediaStream> local_stream_;
    std::map<std::string, std::unique_ptr<PeerSession>> sessions_;
    std::map<std::string, std::vector<IceCandidate>> pre_session_candidates_;
    std::deque<std::string> pre_session_order_;
    uint64_t next_session_id_ = 1;
};

} // namespace cipherlink::call
