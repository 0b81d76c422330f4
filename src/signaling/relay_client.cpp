#include "cipherlink/signaling/relay_client.hpp"
#include "cipherlink/debug/event_logger.hpp"

#include <algorithm>

namespace cipherlink::signaling {

RelayClient::RelayClient(
    std::unique_ptr<interfaces::IRelayTransport> transport,
    interfaces::IScheduler& scheduler,
    const configuration::RelayConfig config)
    : transport_(std::move(transport))
    , scheduler_(scheduler)
    , config_(config)
    , inbound_(config.InboundQueueCapacity()) {}

RelayClient::~RelayClient() {
    Close();
}

Result<Unit, CipherlinkFailure> RelayClient::Open() {
    if (!transport_) {
        return Result<Unit, CipherlinkFailure>::Err(
            CipherlinkFailure::InvalidState("Relay client has no transport"));
    }
    if (transport_->IsOpen()) {
        return Result<Unit, CipherlinkFailure>::Ok(unit);
    }
    CIPHERLINK_LOG_EVENT(debug::Component::Relay, "open", "");
    return transport_->Open(*this);
}

void RelayClient::Close() noexcept {
    if (transport_) {
        transport_->Close();
    }
    // Lookups cannot be answered any more
    auto pending = std::move(lookups_);
    lookups_.clear();
    replies_owed_to_expired_ = 0;
    for (auto& lookup : pending) {
        scheduler_.Cancel(lookup.timer);
        if (lookup.callback) {
            lookup.callback(std::nullopt);
        }
    }
}

bool RelayClient::IsOpen() const {
    return transport_ && transport_->IsOpen();
}

Result<Unit, CipherlinkFailure> RelayClient::Send(const OutboundEvent& event) {
    if (!IsOpen()) {
        return Result<Unit, CipherlinkFailure>::Err(
            CipherlinkFailure::InvalidState("Relay connection is not open"));
    }
    return transport_->Send(event);
}

Result<Unit, CipherlinkFailure> RelayClient::RegisterMaster(
    const std::string& uuid,
    std::optional<std::vector<uint8_t>> public_key) {
    CIPHERLINK_LOG_PEER(debug::Component::Relay, "register_master", uuid,
        public_key.has_value() ? "with key" : "without key");
    return Send(signaling::RegisterMaster{uuid, std::move(public_key)});
}

void RelayClient::LookupSalt(const std::string& username, LookupCallback callback) {
    if (auto sent = Send(GetSalt{username}); sent.IsErr()) {
        CIPHERLINK_LOG_EVENT(debug::Component::Relay, "get_salt not sent", sent.UnwrapErr().message);
        callback(std::nullopt);
        return;
    }
    const uint64_t id = next_lookup_++;
    const auto timer = scheduler_.ScheduleAfter(config_.LookupTimeout(), [this, id] { ExpireLookup(id); });
    lookups_.push_back(PendingLookup{id, username, std::move(callback), timer});
}

void RelayClient::ResolveLookup(std::optional<SaltFound> found) {
    // The relay answers in order, so the next replies belong to lookups that already expired
    if (replies_owed_to_expired_ > 0) {
        --replies_owed_to_expired_;
        CIPHERLINK_LOG_EVENT(debug::Component::Relay, "late salt reply dropped", "");
        return;
    }
    if (lookups_.empty()) {
        CIPHERLINK_LOG_EVENT(debug::Component::Relay, "salt reply without lookup", "");
        return;
    }
    PendingLookup lookup = std::move(lookups_.front());
    lookups_.pop_front();
    scheduler_.Cancel(lookup.timer);
    lookup.callback(std::move(found));
}

void RelayClient::ExpireLookup(const uint64_t id) {
    const auto it = std::find_if(lookups_.begin(), lookups_.end(),
        [id](const PendingLookup& lookup) { return lookup.id == id; });
    if (it == lookups_.end()) {
        return;
    }
    PendingLookup lookup = std::move(*it);
    lookups_.erase(it);
    ++replies_owed_to_expired_;
    CIPHERLINK_LOG_EVENT(debug::Component::Relay, "salt lookup timed out", lookup.username);
    lookup.callback(std::nullopt);
}

Result<Unit, CipherlinkFailure> RelayClient::Deliver(InboundEvent event) {
    return inbound_.TryPush(std::move(event));
}

} // namespace cipherlink::signaling
