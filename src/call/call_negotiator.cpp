#include "cipherlink/call/call_negotiator.hpp"
#include "cipherlink/core/constants.hpp"
#include "cipherlink/core/format.hpp"
#include "cipherlink/debug/event_logger.hpp"

#include <algorithm>

namespace cipherlink::call {

namespace {
    using ProtoSignal = proto::call::CallSignal;

    CallType FromProto(const proto::call::CallType type) {
        // Offers without a call type ring as video
        return type == proto::call::CALL_TYPE_VOICE ? CallType::Voice : CallType::Video;
    }

    proto::call::CallType ToProto(const CallType type) {
        return type == CallType::Voice ? proto::call::CALL_TYPE_VOICE : proto::call::CALL_TYPE_VIDEO;
    }

    IceCandidate FromProto(const proto::call::IceCandidate& candidate) {
        return IceCandidate{candidate.candidate(), candidate.sdp_mid(), candidate.sdp_mline_index()};
    }

    std::shared_ptr<interfaces::IMediaTrack> FirstTrack(
        const std::shared_ptr<interfaces::IMediaStream>& stream,
        const MediaKind kind) {
        if (!stream) {
            return nullptr;
        }
        for (auto& track : stream->Tracks()) {
            if (track && track->Kind() == kind) {
                return track;
            }
        }
        return nullptr;
    }

    void StopTracks(const std::shared_ptr<interfaces::IMediaStream>& stream) noexcept {
        if (!stream) {
            return;
        }
        for (auto& track : stream->Tracks()) {
            if (track) {
                track->Stop();
            }
        }
    }

    CipherlinkFailure NoActiveCall() {
        return CipherlinkFailure::InvalidState(std::string(ErrorMessages::NO_ACTIVE_CALL));
    }
}

CallNegotiator::CallNegotiator(
    std::string local_uuid,
    CallSessionRegistry& registry,
    signaling::RelayClient& relay,
    interfaces::IMediaDevices& media,
    interfaces::IScheduler& scheduler,
    const configuration::CallConfig config)
    : local_uuid_(std::move(local_uuid))
    , registry_(registry)
    , relay_(relay)
    , media_(media)
    , scheduler_(scheduler)
    , config_(config)
    , vad_(scheduler, config) {
    registry_.SetListener(this);
}

CallNegotiator::~CallNegotiator() {
    Leave();
    registry_.SetListener(nullptr);
}

void CallNegotiator::SetEventHandler(std::shared_ptr<interfaces::ICallEventHandler> handler) {
    handler_ = std::move(handler);
}

std::vector<interfaces::MediaConstraints> CallNegotiator::MediaLadder(
    const CallType call_type,
    const configuration::CallConfig& config) {
    if (call_type == CallType::Voice) {
        return {interfaces::MediaConstraints{true, false, 0, 0, false}};
    }
    return {
        interfaces::MediaConstraints{true, true, config.IdealVideoWidth(), config.IdealVideoHeight(), true},
        interfaces::MediaConstraints{true, true, 0, 0, false},
        interfaces::MediaConstraints{true, false, 0, 0, false},
    };
}

std::vector<interfaces::MediaConstraints> CallNegotiator::CameraLadder(const configuration::CallConfig& config) {
    return {
        interfaces::MediaConstraints{false, true, config.IdealVideoWidth(), config.IdealVideoHeight(), true},
        interfaces::MediaConstraints{false, true, 0, 0, false},
    };
}

Result<Unit, CipherlinkFailure> CallNegotiator::Join(
    const std::string& group_id,
    const CallType call_type,
    const CallRole role) {
    if (group_id.empty()) {
        return Result<Unit, CipherlinkFailure>::Err(CipherlinkFailure::InvalidInput("Group id is empty"));
    }
    std::optional<std::string> direct_peer;
    if (role == CallRole::OneToOne) {
        direct_peer = group_id;
    }
    StartCall(group_id, call_type, role, std::move(direct_peer), {});
    return Result<Unit, CipherlinkFailure>::Ok(unit);
}

void CallNegotiator::StartCall(
    const std::string& group_id,
    const CallType call_type,
    const CallRole role,
    std::optional<std::string> direct_peer,
    std::vector<Signal> replay) {
    Leave();

    CallSession session;
    session.group_id = group_id;
    session.role = role;
    session.call_type = call_type;
    session.direct_peer = std::move(direct_peer);
    call_ = std::move(session);
    phase_ = CallPhase::AcquiringMedia;
    deferred_ = std::move(replay);
    const uint64_t epoch = ++call_epoch_;

    CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "joining", group_id,
        call_type == CallType::Video ? "video" : "voice");

    auto ladder = std::make_shared<const std::vector<interfaces::MediaConstraints>>(MediaLadder(call_type, config_));
    AcquireMedia(std::move(ladder), 0, epoch, [this, epoch](StreamResult acquired) {
        OnCallMedia(epoch, std::move(acquired));
    });
}

void CallNegotiator::AcquireMedia(
    std::shared_ptr<const std::vector<interfaces::MediaConstraints>> ladder,
    const size_t rung,
    const uint64_t epoch,
    StreamCallback done) {
    std::weak_ptr<int> alive = lifetime_;
    const auto constraints = (*ladder)[rung];
    media_.GetUserMedia(constraints,
        [this, alive, ladder = std::move(ladder), rung, epoch, done = std::move(done)](StreamResult acquired) mutable {
            if (alive.expired()) {
                if (acquired.IsOk()) {
                    StopTracks(acquired.Unwrap());
                }
                return;
            }
            if (acquired.IsOk() || rung + 1 >= ladder->size() || epoch != call_epoch_) {
                done(std::move(acquired));
                return;
            }
            CIPHERLINK_LOG_VALUE(debug::Component::Negotiator, "media rung failed", "rung", rung);
            AcquireMedia(std::move(ladder), rung + 1, epoch, std::move(done));
        });
}

void CallNegotiator::OnCallMedia(const uint64_t epoch, StreamResult acquired) {
    if (epoch != call_epoch_ || phase_ != CallPhase::AcquiringMedia) {
        if (acquired.IsOk()) {
            StopTracks(acquired.Unwrap());
        }
        return;
    }
    if (acquired.IsErr()) {
        const auto cause = std::move(acquired).UnwrapErr();
        // Nothing was announced yet, so there is nothing to leave
        call_.reset();
        deferred_.clear();
        phase_ = CallPhase::Idle;
        ++call_epoch_;
        ReportFailure(CipherlinkFailure::MediaAcquisition(
            compat::format("No usable capture device: {}", cause.message)));
        return;
    }

    auto stream = std::move(acquired).Unwrap();
    call_->local_stream = stream;
    call_->camera_on = call_->call_type == CallType::Video && FirstTrack(stream, MediaKind::Video) != nullptr;
    call_->started_at = scheduler_.Now();
    registry_.SetLocalStream(stream);
    if (FirstTrack(stream, MediaKind::Audio)) {
        local_analyser_ = media_.CreateAnalyser(stream);
    }
    phase_ = CallPhase::Active;

    if (auto sent = relay_.Send(signaling::JoinCall{call_->group_id}); sent.IsErr()) {
        ReportFailure(std::move(sent).UnwrapErr());
    }
    if (handler_) {
        handler_->OnCallStarted(call_->group_id, call_->role, call_->call_type);
    }
    vad_.Start([this] { SampleVoiceActivity(); });

    auto replay = std::move(deferred_);
    deferred_.clear();
    for (const auto& [from, signal] : replay) {
        if (phase_ != CallPhase::Active) {
            break;
        }
        OnSignal(from, signal);
    }
}

void CallNegotiator::Leave() noexcept {
    if (phase_ == CallPhase::Idle) {
        return;
    }
    const bool announced = phase_ == CallPhase::Active;
    CallSession session = std::move(*call_);
    call_.reset();
    phase_ = CallPhase::Idle;
    ++call_epoch_;
    deferred_.clear();

    vad_.Stop();
    local_analyser_.reset();
    local_speaking_ = false;
    CancelTimer(hangup_timer_);
    CancelTimer(leave_timer_);
    for (auto& [uuid, timer] : removal_timers_) {
        CancelTimer(timer);
    }
    removal_timers_.clear();

    registry_.CloseAll();
    registry_.SetLocalStream(nullptr);
    StopTracks(session.local_stream);

    if (!announced) {
        return;
    }
    if (auto sent = relay_.Send(signaling::LeaveCall{session.group_id}); sent.IsErr()) {
        CIPHERLINK_LOG_EVENT(debug::Component::Negotiator, "leave_call not sent", sent.UnwrapErr().message);
    }
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        scheduler_.Now() - session.started_at);
    CIPHERLINK_LOG_VALUE(debug::Component::Negotiator, "call ended", "ms", duration.count());
    if (handler_) {
        handler_->OnCallEnded(duration);
    }
}

Result<Unit, CipherlinkFailure> CallNegotiator::Accept() {
    if (!pending_call_) {
        return Result<Unit, CipherlinkFailure>::Err(CipherlinkFailure::InvalidState("No incoming call"));
    }
    const auto incoming = std::move(*pending_call_);
    auto offer = std::move(pending_offer_);
    pending_call_.reset();
    pending_offer_.Clear();

    const bool direct = incoming.group_id.empty() || incoming.group_id == local_uuid_;
    const auto group_id = incoming.group_id.empty() ? incoming.from : incoming.group_id;
    std::vector<Signal> replay;
    replay.emplace_back(incoming.from, std::move(offer));

    StartCall(group_id,
              incoming.call_type,
              direct ? CallRole::OneToOne : CallRole::Group,
              direct ? std::optional<std::string>(incoming.from) : std::nullopt,
              std::move(replay));
    return Result<Unit, CipherlinkFailure>::Ok(unit);
}

void CallNegotiator::Reject() noexcept {
    if (!pending_call_) {
        return;
    }
    CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "incoming call rejected", pending_call_->from, "");
    registry_.DropBufferedCandidates(pending_call_->from);
    pending_call_.reset();
    pending_offer_.Clear();
}

void CallNegotiator::OnSignal(const std::string& from, const ProtoSignal& signal) {
    if (from == local_uuid_) {
        return;
    }
    if (phase_ == CallPhase::Idle) {
        if (signal.type() == proto::call::SIGNAL_TYPE_OFFER) {
            HoldIncoming(from, signal);
        } else if (signal.type() == proto::call::SIGNAL_TYPE_CANDIDATE && signal.has_candidate() &&
                   pending_call_ && pending_call_->from == from) {
            registry_.EnqueueCandidate(from, FromProto(signal.candidate()));
        }
        return;
    }
    if (phase_ == CallPhase::AcquiringMedia) {
        deferred_.emplace_back(from, signal);
        return;
    }

    switch (signal.type()) {
        case proto::call::SIGNAL_TYPE_OFFER:
            HandleOffer(from, signal);
            break;
        case proto::call::SIGNAL_TYPE_ANSWER:
            HandleAnswer(from, signal);
            break;
        case proto::call::SIGNAL_TYPE_CANDIDATE:
            if (signal.has_candidate()) {
                registry_.EnqueueCandidate(from, FromProto(signal.candidate()));
            }
            break;
        default:
            CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "unknown signal type", from, "");
            break;
    }
}

void CallNegotiator::HoldIncoming(const std::string& from, const ProtoSignal& offer) {
    if (pending_call_ && pending_call_->from != from) {
        CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "busy, offer ignored", from, "");
        return;
    }
    interfaces::IncomingCall incoming{from, offer.group_id(), FromProto(offer.call_type())};
    const bool first_ring = !pending_call_.has_value();
    pending_call_ = incoming;
    pending_offer_ = offer;
    if (first_ring && handler_) {
        handler_->OnIncomingCall(incoming);
    }
}

void CallNegotiator::HandleOffer(const std::string& from, const ProtoSignal& offer) {
    auto created = registry_.CreateSession(from);
    if (created.IsErr()) {
        ReportNegotiationFailure(from, created.UnwrapErr());
        return;
    }
    PeerSession* session = created.Unwrap();
    const auto state = session->connection->GetSignalingState();
    const bool collision = session->making_offer || state != SignalingState::Stable;
    if (collision && !IsPolite(from)) {
        CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "colliding offer ignored", from,
            std::string(ToString(state)));
        return;
    }
    // The polite side gives up its own offer, including one still being created
    session->making_offer = false;

    const uint64_t session_id = session->id;
    registry_.SetRemoteDescription(from, SessionDescription{SdpType::Offer, offer.sdp()},
        [this, from, session_id](Result<Unit, CipherlinkFailure> applied) {
            if (!registry_.IsCurrent(from, session_id)) {
                return;
            }
            if (applied.IsErr()) {
                ReportNegotiationFailure(from, applied.UnwrapErr());
                return;
            }
            SendAnswer(from, session_id);
        });
}

void CallNegotiator::SendAnswer(const std::string& peer_uuid, const uint64_t session_id) {
    auto* session = registry_.Find(peer_uuid);
    if (!session) {
        return;
    }
    session->connection->CreateAnswer(
        [this, peer_uuid, session_id](Result<SessionDescription, CipherlinkFailure> created) {
            if (!registry_.IsCurrent(peer_uuid, session_id)) {
                return;
            }
            if (created.IsErr()) {
                ReportNegotiationFailure(peer_uuid, created.UnwrapErr());
                return;
            }
            auto answer = std::move(created).Unwrap();
            registry_.Find(peer_uuid)->connection->SetLocalDescription(answer,
                [this, peer_uuid, session_id, sdp = answer.sdp](Result<Unit, CipherlinkFailure> set) {
                    if (!registry_.IsCurrent(peer_uuid, session_id)) {
                        return;
                    }
                    if (set.IsErr()) {
                        ReportNegotiationFailure(peer_uuid, set.UnwrapErr());
                        return;
                    }
                    ProtoSignal signal;
                    signal.set_type(proto::call::SIGNAL_TYPE_ANSWER);
                    signal.set_sdp(sdp);
                    SendSignal(peer_uuid, std::move(signal));
                });
        });
}

void CallNegotiator::HandleAnswer(const std::string& from, const ProtoSignal& answer) {
    auto* session = registry_.Find(from);
    if (!session) {
        CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "answer without session", from, "");
        return;
    }
    if (session->connection->GetSignalingState() != SignalingState::HaveLocalOffer) {
        CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "stale answer ignored", from,
            std::string(ToString(session->connection->GetSignalingState())));
        return;
    }
    const uint64_t session_id = session->id;
    registry_.SetRemoteDescription(from, SessionDescription{SdpType::Answer, answer.sdp()},
        [this, from, session_id](Result<Unit, CipherlinkFailure> applied) {
            if (applied.IsErr() && registry_.IsCurrent(from, session_id)) {
                ReportNegotiationFailure(from, applied.UnwrapErr());
            }
        });
}

bool CallNegotiator::OfferTo(const std::string& peer_uuid, const bool ring) {
    if (registry_.Contains(peer_uuid)) {
        return false;
    }
    if (auto created = registry_.CreateSession(peer_uuid); created.IsErr()) {
        ReportNegotiationFailure(peer_uuid, created.UnwrapErr());
        return false;
    }
    SendOffer(peer_uuid, ring);
    return true;
}

void CallNegotiator::SendOffer(const std::string& peer_uuid, const bool ring) {
    auto* session = registry_.Find(peer_uuid);
    if (!session) {
        return;
    }
    const uint64_t session_id = session->id;
    session->making_offer = true;
    session->connection->CreateOffer(
        [this, peer_uuid, session_id, ring](Result<SessionDescription, CipherlinkFailure> created) {
            if (!registry_.IsCurrent(peer_uuid, session_id)) {
                return;
            }
            auto* current = registry_.Find(peer_uuid);
            if (!current->making_offer) {
                CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "offer superseded", peer_uuid, "");
                return;
            }
            if (created.IsErr()) {
                current->making_offer = false;
                ReportNegotiationFailure(peer_uuid, created.UnwrapErr());
                return;
            }
            auto offer = std::move(created).Unwrap();
            current->connection->SetLocalDescription(offer,
                [this, peer_uuid, session_id, ring, sdp = offer.sdp](Result<Unit, CipherlinkFailure> set) {
                    if (!registry_.IsCurrent(peer_uuid, session_id)) {
                        return;
                    }
                    auto* owner = registry_.Find(peer_uuid);
                    const bool superseded = !owner->making_offer;
                    owner->making_offer = false;
                    if (superseded) {
                        CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "offer superseded", peer_uuid, "");
                        return;
                    }
                    if (set.IsErr()) {
                        ReportNegotiationFailure(peer_uuid, set.UnwrapErr());
                        return;
                    }
                    ProtoSignal signal;
                    signal.set_type(proto::call::SIGNAL_TYPE_OFFER);
                    signal.set_sdp(sdp);
                    if (ring && call_) {
                        signal.set_call_type(ToProto(call_->call_type));
                        signal.set_group_id(call_->group_id);
                    }
                    SendSignal(peer_uuid, std::move(signal));
                });
        });
}

void CallNegotiator::SendSignal(const std::string& to, ProtoSignal signal) {
    if (auto sent = relay_.Send(signaling::SignalMessage{to, std::move(signal)}); sent.IsErr()) {
        CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "signal not sent", to, sent.UnwrapErr().message);
    }
}

bool CallNegotiator::MatchesGroup(const std::string& group_id) const {
    return call_ && (group_id.empty() || group_id == call_->group_id);
}

void CallNegotiator::OnParticipantsList(const signaling::CallParticipantsList& list) {
    if (phase_ != CallPhase::Active || !MatchesGroup(list.group_id)) {
        return;
    }
    CIPHERLINK_LOG_VALUE(debug::Component::Negotiator, "roster", "size", list.participants.size());

    // Ring: the other side of a 1:1 call is not in the call yet
    if (list.participants.size() <= 1 && call_->group_id != local_uuid_ &&
        call_->role == CallRole::OneToOne && call_->direct_peer) {
        OfferTo(*call_->direct_peer, true);
    }
    for (const auto& participant : list.participants) {
        if (participant == local_uuid_ || !(local_uuid_ < participant)) {
            continue;
        }
        OfferTo(participant, false);
    }
}

void CallNegotiator::OnUserJoined(const signaling::CallUserJoined& joined) {
    if (phase_ != CallPhase::Active || !MatchesGroup(joined.group_id) || joined.uuid == local_uuid_) {
        return;
    }
    if (local_uuid_ < joined.uuid) {
        OfferTo(joined.uuid, false);
    }
}

void CallNegotiator::OnUserLeft(const signaling::CallUserLeft& left) {
    if (phase_ != CallPhase::Active || !MatchesGroup(left.group_id)) {
        return;
    }
    RemovePeer(left.uuid);
    if (call_->direct_peer == left.uuid || registry_.Empty()) {
        ScheduleLeave(config_.PeerLeftHangupDelay());
    }
}

void CallNegotiator::RemovePeer(const std::string& peer_uuid) {
    if (const auto it = removal_timers_.find(peer_uuid); it != removal_timers_.end()) {
        scheduler_.Cancel(it->second);
        removal_timers_.erase(it);
    }
    const bool existed = registry_.Contains(peer_uuid);
    registry_.CloseSession(peer_uuid);
    if (existed && handler_) {
        handler_->OnPeerRemoved(peer_uuid);
    }
}

void CallNegotiator::ScheduleLeave(const std::chrono::milliseconds delay) {
    if (leave_timer_ != interfaces::INVALID_TIMER) {
        return;
    }
    leave_timer_ = scheduler_.ScheduleAfter(delay, [this] {
        leave_timer_ = interfaces::INVALID_TIMER;
        Leave();
    });
}

void CallNegotiator::CancelTimer(interfaces::TimerId& timer) noexcept {
    if (timer != interfaces::INVALID_TIMER) {
        scheduler_.Cancel(timer);
        timer = interfaces::INVALID_TIMER;
    }
}

void CallNegotiator::Renegotiate() {
    if (phase_ != CallPhase::Active) {
        return;
    }
    for (const auto& peer_uuid : registry_.PeerUuids()) {
        auto* session = registry_.Find(peer_uuid);
        if (session && session->connection->GetSignalingState() == SignalingState::Stable) {
            CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "renegotiating", peer_uuid, "");
            SendOffer(peer_uuid, false);
        }
    }
}

Result<bool, CipherlinkFailure> CallNegotiator::ToggleMute() {
    if (phase_ != CallPhase::Active) {
        return Result<bool, CipherlinkFailure>::Err(NoActiveCall());
    }
    auto track = FirstTrack(call_->local_stream, MediaKind::Audio);
    if (!track) {
        return Result<bool, CipherlinkFailure>::Err(
            CipherlinkFailure::MediaAcquisition("Local stream has no audio track"));
    }
    track->SetEnabled(!track->IsEnabled());
    call_->muted = !track->IsEnabled();
    return Result<bool, CipherlinkFailure>::Ok(call_->muted);
}

Result<Unit, CipherlinkFailure> CallNegotiator::ToggleCamera() {
    if (phase_ != CallPhase::Active) {
        return Result<Unit, CipherlinkFailure>::Err(NoActiveCall());
    }
    if (auto track = FirstTrack(call_->local_stream, MediaKind::Video)) {
        track->SetEnabled(!track->IsEnabled());
        call_->camera_on = track->IsEnabled();
        return Result<Unit, CipherlinkFailure>::Ok(unit);
    }

    const uint64_t epoch = call_epoch_;
    auto ladder = std::make_shared<const std::vector<interfaces::MediaConstraints>>(CameraLadder(config_));
    AcquireMedia(std::move(ladder), 0, epoch, [this, epoch](StreamResult acquired) {
        OnCameraMedia(epoch, std::move(acquired));
    });
    return Result<Unit, CipherlinkFailure>::Ok(unit);
}

void CallNegotiator::OnCameraMedia(const uint64_t epoch, StreamResult acquired) {
    if (epoch != call_epoch_ || phase_ != CallPhase::Active) {
        if (acquired.IsOk()) {
            StopTracks(acquired.Unwrap());
        }
        return;
    }
    if (acquired.IsErr()) {
        ReportFailure(CipherlinkFailure::MediaAcquisition(
            compat::format("Camera unavailable: {}", acquired.UnwrapErr().message)));
        return;
    }
    auto camera = std::move(acquired).Unwrap();
    auto track = FirstTrack(camera, MediaKind::Video);
    if (!track) {
        ReportFailure(CipherlinkFailure::MediaAcquisition("Camera stream has no video track"));
        return;
    }
    call_->local_stream->AddTrack(track);
    registry_.AddTrackToAll(track, call_->local_stream);
    call_->camera_on = true;
    Renegotiate();
}

void CallNegotiator::OnLocalCandidate(const std::string& peer_uuid, const IceCandidate& candidate) {
    ProtoSignal signal;
    signal.set_type(proto::call::SIGNAL_TYPE_CANDIDATE);
    auto* body = signal.mutable_candidate();
    body->set_candidate(candidate.candidate);
    body->set_sdp_mid(candidate.sdp_mid);
    body->set_sdp_mline_index(candidate.sdp_mline_index);
    SendSignal(peer_uuid, std::move(signal));
}

void CallNegotiator::OnRemoteStream(const std::string& peer_uuid, std::shared_ptr<interfaces::IMediaStream> stream) {
    if (FirstTrack(stream, MediaKind::Audio)) {
        registry_.AttachAnalyser(peer_uuid, media_.CreateAnalyser(stream));
    }
    if (handler_) {
        handler_->OnRemoteStream(peer_uuid, std::move(stream));
    }
}

void CallNegotiator::OnSessionStateChanged(
    const std::string& peer_uuid,
    const PeerConnectionState connection_state,
    const IceConnectionState ice_state) {
    if (handler_) {
        handler_->OnPeerUpdated(peer_uuid, connection_state, ice_state);
    }
    if (phase_ != CallPhase::Active) {
        return;
    }

    const bool terminal = IsTerminal(connection_state) || IsTerminal(ice_state);
    const bool recovered = connection_state == PeerConnectionState::Connected ||
                           ice_state == IceConnectionState::Connected ||
                           ice_state == IceConnectionState::Completed;
    const bool direct = call_->direct_peer == peer_uuid;

    if (terminal) {
        if (direct) {
            if (hangup_timer_ == interfaces::INVALID_TIMER) {
                CIPHERLINK_LOG_PEER(debug::Component::Negotiator, "peer lost, hangup armed", peer_uuid, "");
                hangup_timer_ = scheduler_.ScheduleAfter(config_.HangupDebounce(), [this] {
                    hangup_timer_ = interfaces::INVALID_TIMER;
                    Leave();
                });
            }
        } else if (!removal_timers_.contains(peer_uuid)) {
            removal_timers_[peer_uuid] = scheduler_.ScheduleAfter(config_.HangupDebounce(), [this, peer_uuid] {
                removal_timers_.erase(peer_uuid);
                RemovePeer(peer_uuid);
            });
        }
        return;
    }
    if (recovered) {
        if (direct) {
            CancelTimer(hangup_timer_);
        } else if (const auto it = removal_timers_.find(peer_uuid); it != removal_timers_.end()) {
            scheduler_.Cancel(it->second);
            removal_timers_.erase(it);
        }
    }
}

void CallNegotiator::SampleVoiceActivity() {
    if (local_analyser_) {
        const auto bins = local_analyser_->ByteFrequencyData();
        const bool speaking = VoiceActivityMonitor::IsSpeaking(bins, config_.VoiceActivityThreshold());
        if (speaking != local_speaking_) {
            local_speaking_ = speaking;
            if (handler_) {
                handler_->OnSpeakingChanged(local_uuid_, speaking);
            }
        }
    }
    for (const auto& [peer_uuid, speaking] : registry_.SampleVoiceActivity(config_.VoiceActivityThreshold())) {
        if (handler_) {
            handler_->OnSpeakingChanged(peer_uuid, speaking);
        }
    }
}

void CallNegotiator::ReportFailure(const CipherlinkFailure& failure) {
    CIPHERLINK_LOG_EVENT(debug::Component::Negotiator, FailureTypeName(failure.type).data(), failure.message);
    if (handler_) {
        handler_->OnCallFailed(failure);
    }
}

void CallNegotiator::ReportNegotiationFailure(const std::string& peer_uuid, const CipherlinkFailure& failure) {
    ReportFailure(CipherlinkFailure::Negotiation(compat::format("{}: {}", peer_uuid, failure.message)));
}

} // namespace cipherlink::call
