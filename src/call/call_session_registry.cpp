#include "cipherlink/call/call_session_registry.hpp"
#include "cipherlink/call/voice_activity_monitor.hpp"
#include "cipherlink/core/format.hpp"
#include "cipherlink/debug/event_logger.hpp"

namespace cipherlink::call {

SessionObserver::SessionObserver(CallSessionRegistry& registry, std::string peer_uuid, const uint64_t session_id)
    : registry_(registry)
    , peer_uuid_(std::move(peer_uuid))
    , session_id_(session_id) {}

void SessionObserver::OnIceCandidate(const IceCandidate& candidate) {
    registry_.HandleIceCandidate(peer_uuid_, session_id_, candidate);
}

void SessionObserver::OnTrack(
    std::shared_ptr<interfaces::IMediaTrack>,
    std::shared_ptr<interfaces::IMediaStream> stream) {
    registry_.HandleTrack(peer_uuid_, session_id_, std::move(stream));
}

void SessionObserver::OnConnectionStateChange(const PeerConnectionState state) {
    registry_.HandleConnectionState(peer_uuid_, session_id_, state);
}

void SessionObserver::OnIceConnectionStateChange(const IceConnectionState state) {
    registry_.HandleIceState(peer_uuid_, session_id_, state);
}

PeerSession::~PeerSession() {
    if (connection) {
        connection->Close();
    }
}

CallSessionRegistry::CallSessionRegistry(
    interfaces::IPeerConnectionFactory& factory,
    const configuration::CallConfig config)
    : factory_(factory)
    , config_(config) {}

CallSessionRegistry::~CallSessionRegistry() {
    CloseAll();
}

void CallSessionRegistry::SetLocalStream(std::shared_ptr<interfaces::IMediaStream> stream) {
    local_stream_ = std::move(stream);
}

Result<PeerSession*, CipherlinkFailure> CallSessionRegistry::CreateSession(const std::string& peer_uuid) {
    if (auto* existing = Find(peer_uuid)) {
        return Result<PeerSession*, CipherlinkFailure>::Ok(existing);
    }

    auto session = std::make_unique<PeerSession>();
    session->id = next_session_id_++;
    session->peer_uuid = peer_uuid;
    session->observer = std::make_unique<SessionObserver>(*this, peer_uuid, session->id);

    RtcConfiguration rtc_config;
    for (const auto& server : config_.IceServers()) {
        rtc_config.ice_servers.emplace_back(server);
    }
    session->connection = factory_.Create(rtc_config, *session->observer);
    if (!session->connection) {
        return Result<PeerSession*, CipherlinkFailure>::Err(CipherlinkFailure::Negotiation(
            compat::format("Peer connection factory returned nothing for {}", peer_uuid)));
    }

    if (local_stream_) {
        for (const auto& track : local_stream_->Tracks()) {
            session->connection->AddTrack(track, local_stream_);
        }
    }

    if (const auto it = pre_session_candidates_.find(peer_uuid); it != pre_session_candidates_.end()) {
        session->candidate_queue = std::move(it->second);
        ForgetPreSession(peer_uuid);
    }

    CIPHERLINK_LOG_PEER(debug::Component::Registry, "session created", peer_uuid,
        compat::format("id={} queued={}", session->id, session->candidate_queue.size()));
    auto* raw = session.get();
    sessions_.emplace(peer_uuid, std::move(session));
    return Result<PeerSession*, CipherlinkFailure>::Ok(raw);
}

PeerSession* CallSessionRegistry::Find(const std::string& peer_uuid) {
    const auto it = sessions_.find(peer_uuid);
    return it == sessions_.end() ? nullptr : it->second.get();
}

bool CallSessionRegistry::Contains(const std::string& peer_uuid) const {
    return sessions_.contains(peer_uuid);
}

bool CallSessionRegistry::IsCurrent(const std::string& peer_uuid, const uint64_t session_id) const {
    const auto it = sessions_.find(peer_uuid);
    return it != sessions_.end() && it->second->id == session_id;
}

PeerSession* CallSessionRegistry::FindCurrent(const std::string& peer_uuid, const uint64_t session_id) {
    auto* session = Find(peer_uuid);
    if (!session || session->id != session_id) {
        return nullptr;
    }
    return session;
}

std::vector<std::string> CallSessionRegistry::PeerUuids() const {
    std::vector<std::string> uuids;
    uuids.reserve(sessions_.size());
    for (const auto& [uuid, session] : sessions_) {
        uuids.push_back(uuid);
    }
    return uuids;
}

void CallSessionRegistry::EnqueueCandidate(const std::string& peer_uuid, const IceCandidate& candidate) {
    auto* session = Find(peer_uuid);
    if (!session) {
        BufferPreSession(peer_uuid, candidate);
        return;
    }
    if (!session->connection->HasRemoteDescription()) {
        session->candidate_queue.push_back(candidate);
        return;
    }
    if (auto added = session->connection->AddIceCandidate(candidate); added.IsErr()) {
        CIPHERLINK_LOG_PEER(debug::Component::Registry, "candidate rejected", peer_uuid, added.UnwrapErr().message);
    }
}

void CallSessionRegistry::BufferPreSession(const std::string& peer_uuid, const IceCandidate& candidate) {
    auto it = pre_session_candidates_.find(peer_uuid);
    if (it == pre_session_candidates_.end()) {
        if (pre_session_candidates_.size() >= config_.MaxPreSessionPeers()) {
            const std::string oldest = pre_session_order_.front();
            CIPHERLINK_LOG_PEER(debug::Component::Registry, "pre-session buffer evicted", oldest, "");
            ForgetPreSession(oldest);
        }
        it = pre_session_candidates_.emplace(peer_uuid, std::vector<IceCandidate>{}).first;
        pre_session_order_.push_back(peer_uuid);
    }
    if (it->second.size() >= config_.MaxPreSessionCandidates()) {
        CIPHERLINK_LOG_PEER(debug::Component::Registry, "pre-session candidate dropped", peer_uuid, candidate.candidate);
        return;
    }
    it->second.push_back(candidate);
}

void CallSessionRegistry::ForgetPreSession(const std::string& peer_uuid) {
    pre_session_candidates_.erase(peer_uuid);
    std::erase(pre_session_order_, peer_uuid);
}

size_t CallSessionRegistry::BufferedCandidateCount(const std::string& peer_uuid) const {
    if (const auto it = sessions_.find(peer_uuid); it != sessions_.end()) {
        return it->second->candidate_queue.size();
    }
    if (const auto it = pre_session_candidates_.find(peer_uuid); it != pre_session_candidates_.end()) {
        return it->second.size();
    }
    return 0;
}

void CallSessionRegistry::SetRemoteDescription(
    const std::string& peer_uuid,
    const SessionDescription& description,
    interfaces::IPeerConnection::CompletionCallback done) {
    auto* session = Find(peer_uuid);
    if (!session) {
        done(Result<Unit, CipherlinkFailure>::Err(CipherlinkFailure::InvalidState(
            compat::format("No session for {}", peer_uuid))));
        return;
    }
    const uint64_t session_id = session->id;
    session->connection->SetRemoteDescription(description,
        [this, peer_uuid, session_id, done = std::move(done)](Result<Unit, CipherlinkFailure> applied) {
            auto* current = FindCurrent(peer_uuid, session_id);
            if (!current) {
                done(Result<Unit, CipherlinkFailure>::Err(CipherlinkFailure::InvalidState(
                    compat::format("Session for {} closed during negotiation", peer_uuid))));
                return;
            }
            if (applied.IsOk()) {
                FlushCandidates(*current);
            }
            done(std::move(applied));
        });
}

void CallSessionRegistry::FlushCandidates(PeerSession& session) {
    // Detached first: nothing appended during application can be applied twice
    auto queue = std::move(session.candidate_queue);
    session.candidate_queue.clear();
    CIPHERLINK_LOG_VALUE(debug::Component::Registry, "flushing candidates", "count", queue.size());
    for (const auto& candidate : queue) {
        if (auto added = session.connection->AddIceCandidate(candidate); added.IsErr()) {
            CIPHERLINK_LOG_PEER(debug::Component::Registry, "queued candidate rejected",
                session.peer_uuid, added.UnwrapErr().message);
        }
    }
}

void CallSessionRegistry::AddTrackToAll(
    const std::shared_ptr<interfaces::IMediaTrack>& track,
    const std::shared_ptr<interfaces::IMediaStream>& stream) {
    for (auto& [uuid, session] : sessions_) {
        session->connection->AddTrack(track, stream);
    }
}

void CallSessionRegistry::AttachAnalyser(
    const std::string& peer_uuid,
    std::unique_ptr<interfaces::IAudioAnalyser> analyser) {
    if (auto* session = Find(peer_uuid)) {
        session->analyser = std::move(analyser);
    }
}

std::vector<std::pair<std::string, bool>> CallSessionRegistry::SampleVoiceActivity(const uint8_t threshold) {
    std::vector<std::pair<std::string, bool>> changes;
    for (auto& [uuid, session] : sessions_) {
        if (!session->analyser) {
            continue;
        }
        const auto bins = session->analyser->ByteFrequencyData();
        const bool speaking = VoiceActivityMonitor::IsSpeaking(bins, threshold);
        if (speaking != session->speaking) {
            session->speaking = speaking;
            changes.emplace_back(uuid, speaking);
        }
    }
    return changes;
}

void CallSessionRegistry::DropBufferedCandidates(const std::string& peer_uuid) {
    ForgetPreSession(peer_uuid);
}

void CallSessionRegistry::CloseSession(const std::string& peer_uuid) noexcept {
    ForgetPreSession(peer_uuid);
    const auto it = sessions_.find(peer_uuid);
    if (it == sessions_.end()) {
        return;
    }
    // Unlinked before Close so a re-entrant lookup cannot see a closing session
    auto session = std::move(it->second);
    sessions_.erase(it);
    CIPHERLINK_LOG_PEER(debug::Component::Registry, "session closed", peer_uuid, "");
    session.reset();
}

void CallSessionRegistry::CloseAll() noexcept {
    auto sessions = std::move(sessions_);
    sessions_.clear();
    pre_session_candidates_.clear();
    pre_session_order_.clear();
    sessions.clear();
}

void CallSessionRegistry::HandleIceCandidate(
    const std::string& peer_uuid,
    const uint64_t session_id,
    const IceCandidate& candidate) {
    if (!FindCurrent(peer_uuid, session_id)) {
        return;
    }
    if (listener_) {
        listener_->OnLocalCandidate(peer_uuid, candidate);
    }
}

void CallSessionRegistry::HandleTrack(
    const std::string& peer_uuid,
    const uint64_t session_id,
    std::shared_ptr<interfaces::IMediaStream> stream) {
    auto* session = FindCurrent(peer_uuid, session_id);
    if (!session || !stream) {
        return;
    }
    session->remote_stream = stream;
    if (listener_) {
        listener_->OnRemoteStream(peer_uuid, std::move(stream));
    }
}

void CallSessionRegistry::HandleConnectionState(
    const std::string& peer_uuid,
    const uint64_t session_id,
    const PeerConnectionState state) {
    auto* session = FindCurrent(peer_uuid, session_id);
    if (!session) {
        return;
    }
    session->connection_state = state;
    CIPHERLINK_LOG_PEER(debug::Component::Registry, "connection state", peer_uuid, std::string(ToString(state)));
    if (listener_) {
        listener_->OnSessionStateChanged(peer_uuid, session->connection_state, session->ice_state);
    }
}

void CallSessionRegistry::HandleIceState(
    const std::string& peer_uuid,
    const uint64_t session_id,
    const IceConnectionState state) {
    auto* session = FindCurrent(peer_uuid, session_id);
    if (!session) {
        return;
    }
    session->ice_state = state;
    if (listener_) {
        listener_->OnSessionStateChanged(peer_uuid, session->connection_state, session->ice_state);
    }
}

} // namespace cipherlink::call
