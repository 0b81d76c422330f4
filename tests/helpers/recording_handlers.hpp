#pragma once

#include "cipherlink/interfaces/i_message_sink.hpp"
#include "cipherlink/interfaces/i_signal_handler.hpp"
#include "cipherlink/interfaces/i_call_event_handler.hpp"

#include <string>
#include <utility>
#include <vector>

namespace cipherlink::test_helpers {

class RecordingMessageSink final : public interfaces::IMessageSink {
public:
    void OnMessage(const interfaces::InboundMessage& message) override { messages.push_back(message); }

    void OnSystemMessage(const std::string& from, const messaging::SystemMessage& message) override {
        system.emplace_back(from, message);
    }

    void OnReadReceipt(const std::string& from, const std::string& msg_id) override {
        receipts.emplace_back(from, msg_id);
    }

    void OnDeliveryStatus(const signaling::DispatchStatus& status) override { statuses.push_back(status); }

    std::vector<interfaces::InboundMessage> messages;
    std::vector<std::pair<std::string, messaging::SystemMessage>> system;
    std::vector<std::pair<std::string, std::string>> receipts;
    std::vector<signaling::DispatchStatus> statuses;
};

class RecordingSignalHandler final : public interfaces::ISignalHandler {
public:
    void OnSignal(const std::string& from, const proto::call::CallSignal& signal) override {
        signals.emplace_back(from, signal);
    }

    std::vector<std::pair<std::string, proto::call::CallSignal>> signals;
};

class RecordingCallHandler final : public interfaces::ICallEventHandler {
public:
    struct PeerUpdate {
        std::string peer;
        call::PeerConnectionState connection;
        call::IceConnectionState ice;
    };

    void OnIncomingCall(const interfaces::IncomingCall& call) override { incoming.push_back(call); }

    void OnCallStarted(const std::string& group_id, call::CallRole role, call::CallType) override {
        started.emplace_back(group_id, role);
    }

    void OnCallEnded(const std::chrono::milliseconds duration) override { ended.push_back(duration); }

    void OnCallFailed(const CipherlinkFailure& failure) override { failures.push_back(failure); }

    void OnPeerUpdated(const std::string& peer_uuid,
                       const call::PeerConnectionState connection_state,
                       const call::IceConnectionState ice_state) override {
        peer_updates.push_back({peer_uuid, connection_state, ice_state});
    }

    void OnSpeakingChanged(const std::string& peer_uuid, const bool speaking) override {
        speaking_changes.emplace_back(peer_uuid, speaking);
    }

    void OnRemoteStream(const std::string& peer_uuid, std::shared_ptr<interfaces::IMediaStream>) override {
        remote_streams.push_back(peer_uuid);
    }

    void OnPeerRemoved(const std::string& peer_uuid) override { removed.push_back(peer_uuid); }

    std::vector<interfaces::IncomingCall> incoming;
    std::vector<std::pair<std::string, call::CallRole>> started;
    std::vector<std::chrono::milliseconds> ended;
    std::vector<CipherlinkFailure> failures;
    std::vector<PeerUpdate> peer_updates;
    std::vector<std::pair<std::string, bool>> speaking_changes;
    std::vector<std::string> remote_streams;
    std::vector<std::string> removed;
};

} // namespace cipherlink::test_helpers
