#pragma once

#include "call/call_signal.pb.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cipherlink::signaling {

// ---------------------------------------------------------------------------
// Outbound (node -> relay)
// ---------------------------------------------------------------------------

struct RegisterMaster {
    std::string uuid;
    std::optional<std::vector<uint8_t>> public_key;
};

struct GetSalt {
    std::string username;
};

struct RelayMessage {
    std::string to;
    std::vector<uint8_t> payload;
    std::string msg_id;
};

struct MsgAck {
    std::string to;
    std::string msg_id;
};

struct SignalMessage {
    std::string to;
    proto::call::CallSignal body;
};

struct JoinCall {
    std::string group_id;
};

struct LeaveCall {
    std::string group_id;
};

using OutboundEvent = std::variant<
    RegisterMaster,
    GetSalt,
    RelayMessage,
    MsgAck,
    SignalMessage,
    JoinCall,
    LeaveCall>;

// ---------------------------------------------------------------------------
// Inbound (relay -> node)
// ---------------------------------------------------------------------------

struct KdfParams {
    uint32_t time_cost = 2;
    uint32_t memory_kib = 16384;
    uint32_t parallelism = 1;
};

struct SaltFound {
    std::string uuid;
    std::string salt;
    KdfParams kdf_params;
};

struct SaltNotFound {};

struct RelayPush {
    std::string from;
    std::string to;
    std::vector<uint8_t> payload;
    int64_t timestamp = 0;
    std::string msg_id;
};

/// Messages queued while offline, replayed in order through the relay_push path
struct QueueFlush {
    std::vector<RelayPush> payloads;
};

struct MsgAckPush {
    std::string from;
    std::string msg_id;
};

enum class DeliveryStatus {
    Delivered,
    Queued,
    Dropped
};

struct DispatchStatus {
    std::string to;
    std::string msg_id;
    DeliveryStatus status = DeliveryStatus::Delivered;
};

struct SignalPush {
    std::string from;
    proto::call::CallSignal body;
};

struct CallParticipantsList {
    std::string group_id;
    std::vector<std::string> participants;
};

struct CallUserJoined {
    std::string uuid;
    std::string group_id;
};

struct CallUserLeft {
    std::string uuid;
    std::string group_id;
};

enum class PresenceStatus {
    Online,
    Offline
};

struct PresenceUpdate {
    std::string uuid;
    PresenceStatus status = PresenceStatus::Offline;
    std::optional<std::vector<uint8_t>> public_key;
};

struct PresenceAll {
    std::vector<PresenceUpdate> entries;
};

using InboundEvent = std::variant<
    SaltFound,
    SaltNotFound,
    RelayPush,
    QueueFlush,
    MsgAckPush,
    DispatchStatus,
    SignalPush,
    CallParticipantsList,
    CallUserJoined,
    CallUserLeft,
    PresenceUpdate,
    PresenceAll>;

} // namespace cipherlink::signaling
