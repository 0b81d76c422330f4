#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/call/call_session_registry.hpp"
#include "cipherlink/call/rtc_types.hpp"
#include "cipherlink/call/voice_activity_monitor.hpp"
#include "cipherlink/configuration/call_config.hpp"
#include "cipherlink/interfaces/i_call_event_handler.hpp"
#include "cipherlink/interfaces/i_media_devices.hpp"
#include "cipherlink/interfaces/i_scheduler.hpp"
#include "cipherlink/interfaces/i_session_listener.hpp"
#include "cipherlink/interfaces/i_signal_handler.hpp"
#include "cipherlink/signaling/relay_client.hpp"
#include "cipherlink/signaling/relay_events.hpp"
#include "call/call_signal.pb.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cipherlink::call {

enum class CallPhase {
    Idle,
    AcquiringMedia,
    Active
};

/// The node's single call
struct CallSession {
    std::string group_id;
    CallRole role = CallRole::Group;
    CallType call_type = CallType::Voice;
    /// Set for OneToOne: the peer whose loss ends the call
    std::optional<std::string> direct_peer;
    std::shared_ptr<interfaces::IMediaStream> local_stream;
    std::chrono::steady_clock::time_point started_at{};
    bool muted = false;
    bool camera_on = false;
};

/**
 * @brief Perfect negotiation over the relay
 *
 * The smaller uuid is impolite: it initiates and never yields. An offer
 * that arrives while the local signaling state is not stable is dropped by
 * the impolite side; the polite side applies it (implicit rollback) and
 * answers. Both ends therefore converge on the impolite peer's offer.
 *
 * Signals received while local media is still being acquired are held and
 * replayed in order once the call is active.
 */
class CallNegotiator final
    : public interfaces::ISignalHandler
    , public interfaces::ISessionListener {
public:
    CallNegotiator(
        std::string local_uuid,
        CallSessionRegistry& registry,
        signaling::RelayClient& relay,
        interfaces::IMediaDevices& media,
        interfaces::IScheduler& scheduler,
        configuration::CallConfig config = configuration::CallConfig::Default());

    ~CallNegotiator() override;

    CallNegotiator(const CallNegotiator&) = delete;
    CallNegotiator& operator=(const CallNegotiator&) = delete;

    void SetEventHandler(std::shared_ptr<interfaces::ICallEventHandler> handler);

    /**
     * @brief Ends any current call, acquires media, then announces the join
     *
     * For OneToOne the group id is the remote peer's uuid. Media failure on
     * every rung is reported through OnCallFailed and leaves the node idle.
     */
    [[nodiscard]] Result<Unit, CipherlinkFailure> Join(
        const std::string& group_id,
        CallType call_type,
        CallRole role);

    void Leave() noexcept;

    /// Joins the ringing call and replays its offer once media is ready
    [[nodiscard]] Result<Unit, CipherlinkFailure> Accept();
    void Reject() noexcept;

    /// Fresh offers to every session whose signaling state is stable
    void Renegotiate();

    /// @return true when the microphone is now muted
    [[nodiscard]] Result<bool, CipherlinkFailure> ToggleMute();

    /// Flips an existing camera track, or acquires one and renegotiates
    [[nodiscard]] Result<Unit, CipherlinkFailure> ToggleCamera();

    void OnSignal(const std::string& from, const proto::call::CallSignal& signal) override;
    void OnParticipantsList(const signaling::CallParticipantsList& list);
    void OnUserJoined(const signaling::CallUserJoined& joined);
    void OnUserLeft(const signaling::CallUserLeft& left);

    void OnLocalCandidate(const std::string& peer_uuid, const IceCandidate& candidate) override;
    void OnRemoteStream(const std::string& peer_uuid, std::shared_ptr<interfaces::IMediaStream> stream) override;
    void OnSessionStateChanged(const std::string& peer_uuid,
                               PeerConnectionState connection_state,
                               IceConnectionState ice_state) override;

    [[nodiscard]] CallPhase Phase() const noexcept { return phase_; }
    [[nodiscard]] bool InCall() const noexcept { return phase_ != CallPhase::Idle; }
    [[nodiscard]] const std::optional<CallSession>& Session() const noexcept { return call_; }
    [[nodiscard]] const std::optional<interfaces::IncomingCall>& PendingIncoming() const noexcept {
        return pending_call_;
    }
    [[nodiscard]] const std::string& LocalUuid() const noexcept { return local_uuid_; }
    [[nodiscard]] bool IsPolite(const std::string& peer_uuid) const noexcept { return local_uuid_ > peer_uuid; }

    /// ideal video+audio -> basic video+audio -> audio only; voice calls ask for audio only
    [[nodiscard]] static std::vector<interfaces::MediaConstraints> MediaLadder(
        CallType call_type,
        const configuration::CallConfig& config);

    /// Camera only: ideal -> basic
    [[nodiscard]] static std::vector<interfaces::MediaConstraints> CameraLadder(
        const configuration::CallConfig& config);

private:
    using Signal = std::pair<std::string, proto::call::CallSignal>;
    using StreamResult = Result<std::shared_ptr<interfaces::IMediaStream>, CipherlinkFailure>;
    using StreamCallback = std::function<void(StreamResult)>;

    void StartCall(
        const std::string& group_id,
        CallType call_type,
        CallRole role,
        std::optional<std::string> direct_peer,
        std::vector<Signal> replay);

    void AcquireMedia(
        std::shared_ptr<const std::vector<interfaces::MediaConstraints>> ladder,
        size_t rung,
        uint64_t epoch,
        StreamCallback done);

    void OnCallMedia(uint64_t epoch, StreamResult acquired);
    void OnCameraMedia(uint64_t epoch, StreamResult acquired);

    void HoldIncoming(const std::string& from, const proto::call::CallSignal& offer);
    void HandleOffer(const std::string& from, const proto::call::CallSignal& offer);
    void HandleAnswer(const std::string& from, const proto::call::CallSignal& answer);

    /// Creates the session and offers; false when a session already existed
    bool OfferTo(const std::string& peer_uuid, bool ring);
    void SendOffer(const std::string& peer_uuid, bool ring);
    void SendAnswer(const std::string& peer_uuid, uint64_t session_id);
    void SendSignal(const std::string& to, proto::call::CallSignal signal);

    void RemovePeer(const std::string& peer_uuid);
    void ScheduleLeave(std::chrono::milliseconds delay);
    void CancelTimer(interfaces::TimerId& timer) noexcept;
    void SampleVoiceActivity();
    void ReportFailure(const CipherlinkFailure& failure);
    void ReportNegotiationFailure(const std::string& peer_uuid, const CipherlinkFailure& failure);

    [[nodiscard]] bool MatchesGroup(const std::string& group_id) const;

    std::string local_uuid_;
    CallSessionRegistry& registry_;
    signaling::RelayClient& relay_;
    interfaces::IMediaDevices& media_;
    interfaces::IScheduler& scheduler_;
    configuration::CallConfig config_;
    VoiceActivityMonitor vad_;
    std::shared_ptr<interfaces::ICallEventHandler> handler_;
    // Microphone of the current call, reported under local_uuid_
    std::unique_ptr<interfaces::IAudioAnalyser> local_analyser_;
    bool local_speaking_ = false;

    CallPhase phase_ = CallPhase::Idle;
    std::optional<CallSession> call_;
    /// Bumped on every start and leave; stale media completions compare against it
    uint64_t call_epoch_ = 0;
    std::vector<Signal> deferred_;

    std::optional<interfaces::IncomingCall> pending_call_;
    proto::call::CallSignal pending_offer_;

    interfaces::TimerId hangup_timer_ = interfaces::INVALID_TIMER;
    interfaces::TimerId leave_timer_ = interfaces::INVALID_TIMER;
    std::map<std::string, interfaces::TimerId> removal_timers_;

    /// Expires with the negotiator; device callbacks check it first
    std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

} // namespace cipherlink::call
