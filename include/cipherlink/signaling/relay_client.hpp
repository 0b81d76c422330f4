#pragma once

#include "cipherlink/core/result.hpp"
#include "cipherlink/core/failures.hpp"
#include "cipherlink/configuration/relay_config.hpp"
#include "cipherlink/interfaces/i_relay_transport.hpp"
#include "cipherlink/interfaces/i_scheduler.hpp"
#include "cipherlink/signaling/relay_events.hpp"
#include "cipherlink/signaling/signaling_queue.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cipherlink::signaling {

/**
 * @brief Owner of the relay connection
 *
 * Outbound events go straight to the transport. Inbound events enter the
 * bounded SignalingQueue from the transport thread and are consumed by the
 * EventDispatcher on the dispatch context.
 *
 * Salt lookups are answered in request order: salt_found carries no username,
 * so the oldest pending lookup takes each reply. A lookup that timed out is
 * still owed its reply; that reply is discarded when it arrives.
 */
class RelayClient final : public interfaces::IInboundEventSink {
public:
    /// nullopt when the relay reported not-found or the lookup timed out
    using LookupCallback = std::function<void(std::optional<SaltFound>)>;

    RelayClient(
        std::unique_ptr<interfaces::IRelayTransport> transport,
        interfaces::IScheduler& scheduler,
        configuration::RelayConfig config = configuration::RelayConfig::Default());

    ~RelayClient() override;

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    [[nodiscard]] Result<Unit, CipherlinkFailure> Open();
    void Close() noexcept;
    [[nodiscard]] bool IsOpen() const;

    [[nodiscard]] Result<Unit, CipherlinkFailure> Send(const OutboundEvent& event);

    [[nodiscard]] Result<Unit, CipherlinkFailure> RegisterMaster(
        const std::string& uuid,
        std::optional<std::vector<uint8_t>> public_key);

    /// Callback runs on the dispatch context exactly once
    void LookupSalt(const std::string& username, LookupCallback callback);

    /// Completes the oldest pending lookup; replies owed to expired lookups and
    /// replies with none pending are dropped
    void ResolveLookup(std::optional<SaltFound> found);

    [[nodiscard]] size_t PendingLookups() const noexcept { return lookups_.size(); }

    [[nodiscard]] Result<Unit, CipherlinkFailure> Deliver(InboundEvent event) override;

    [[nodiscard]] SignalingQueue& Inbound() noexcept { return inbound_; }

private:
    struct PendingLookup {
        uint64_t id;
        std::string username;
        LookupCallback callback;
        interfaces::TimerId timer;
    };

    void ExpireLookup(uint64_t id);

    std::unique_ptr<interfaces::IRelayTransport> transport_;
    interfaces::IScheduler& scheduler_;
    configuration::RelayConfig config_;
    SignalingQueue inbound_;
    std::deque<PendingLookup> lookups_;
    uint64_t next_lookup_ = 1;
    size_t replies_owed_to_expired_ = 0;
};

} // namespace cipherlink::signaling
