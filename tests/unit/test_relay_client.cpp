#include <catch2/catch_test_macros.hpp>
#include "cipherlink/signaling/relay_client.hpp"
#include "helpers/manual_scheduler.hpp"
#include "helpers/recording_transport.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

using namespace cipherlink;
using namespace cipherlink::signaling;
using namespace cipherlink::test_helpers;
using namespace std::chrono_literals;

namespace {
    struct RelayFixture {
        RelayFixture()
            : relay(MakeTransport(), scheduler) {}

        ManualScheduler scheduler;
        RecordingTransport* wire = nullptr;
        RelayClient relay;

    private:
        std::unique_ptr<interfaces::IRelayTransport> MakeTransport() {
            auto transport = std::make_unique<RecordingTransport>();
            wire = transport.get();
            return transport;
        }
    };

    /// Collects every lookup completion
    struct LookupLog {
        RelayClient::LookupCallback Callback() {
            return [this](std::optional<SaltFound> found) { results.push_back(std::move(found)); };
        }
        std::vector<std::optional<SaltFound>> results;
    };
}

TEST_CASE("RelayClient - Connection", "[relay][signaling]") {
    RelayFixture fixture;

    SECTION("Send requires an open connection") {
        auto sent = fixture.relay.Send(JoinCall{"g1"});
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().type == FailureType::InvalidState);
        REQUIRE(fixture.wire->sent.empty());
    }
    SECTION("Open is idempotent and Close disconnects") {
        REQUIRE(fixture.relay.Open().IsOk());
        REQUIRE(fixture.relay.Open().IsOk());
        REQUIRE(fixture.relay.IsOpen());
        REQUIRE(fixture.relay.Send(JoinCall{"g1"}).IsOk());
        REQUIRE(fixture.wire->SentOf<JoinCall>().size() == 1);

        fixture.relay.Close();
        REQUIRE_FALSE(fixture.relay.IsOpen());
        REQUIRE(fixture.relay.Send(LeaveCall{"g1"}).IsErr());
    }
    SECTION("A refused connection is reported") {
        fixture.wire->fail_open = true;
        REQUIRE(fixture.relay.Open().IsErr());
        REQUIRE_FALSE(fixture.relay.IsOpen());
    }
    SECTION("RegisterMaster carries the public key when present") {
        REQUIRE(fixture.relay.Open().IsOk());
        REQUIRE(fixture.relay.RegisterMaster("u1", std::vector<uint8_t>{0x04, 0x01}).IsOk());
        REQUIRE(fixture.relay.RegisterMaster("u1", std::nullopt).IsOk());
        const auto registrations = fixture.wire->SentOf<RegisterMaster>();
        REQUIRE(registrations.size() == 2);
        REQUIRE(registrations[0].uuid == "u1");
        REQUIRE(registrations[0].public_key.has_value());
        REQUIRE(*registrations[0].public_key == std::vector<uint8_t>{0x04, 0x01});
        REQUIRE_FALSE(registrations[1].public_key.has_value());
    }
    SECTION("Inbound events land in the queue") {
        REQUIRE(fixture.relay.Open().IsOk());
        REQUIRE(fixture.wire->Inject(MsgAckPush{"u2", "m1"}).IsOk());
        REQUIRE(fixture.relay.Inbound().Size() == 1);
    }
}

TEST_CASE("RelayClient - Inbound back-pressure", "[relay][signaling]") {
    ManualScheduler scheduler;
    auto transport = std::make_unique<RecordingTransport>();
    auto* wire = transport.get();
    RelayClient relay(std::move(transport), scheduler, configuration::RelayConfig::WithQueueCapacity(2));
    REQUIRE(relay.Open().IsOk());

    REQUIRE(wire->Inject(SaltNotFound{}).IsOk());
    REQUIRE(wire->Inject(SaltNotFound{}).IsOk());
    auto refused = wire->Inject(SaltNotFound{});
    REQUIRE(refused.IsErr());
    REQUIRE(refused.UnwrapErr().type == FailureType::QueueFull);
}

TEST_CASE("RelayClient - Salt lookups", "[relay][signaling]") {
    LookupLog log;
    RelayFixture fixture;
    REQUIRE(fixture.relay.Open().IsOk());

    SECTION("Replies resolve lookups in request order") {
        fixture.relay.LookupSalt("alice", log.Callback());
        fixture.relay.LookupSalt("bob", log.Callback());
        const auto requests = fixture.wire->SentOf<GetSalt>();
        REQUIRE(requests.size() == 2);
        REQUIRE(requests[0].username == "alice");
        REQUIRE(fixture.relay.PendingLookups() == 2);

        fixture.relay.ResolveLookup(SaltFound{"uuid-a", "salt-a", {}});
        fixture.relay.ResolveLookup(std::nullopt);

        REQUIRE(log.results.size() == 2);
        REQUIRE(log.results[0]->uuid == "uuid-a");
        REQUIRE(log.results[0]->kdf_params.memory_kib == 16384);
        REQUIRE_FALSE(log.results[1].has_value());
        REQUIRE(fixture.relay.PendingLookups() == 0);
        REQUIRE(fixture.scheduler.PendingCount() == 0);
    }
    SECTION("Unanswered lookups time out with nothing") {
        fixture.relay.LookupSalt("alice", log.Callback());
        fixture.scheduler.AdvanceBy(2999ms);
        REQUIRE(log.results.empty());

        fixture.scheduler.AdvanceBy(1ms);
        REQUIRE(log.results.size() == 1);
        REQUIRE_FALSE(log.results[0].has_value());
        REQUIRE(fixture.relay.PendingLookups() == 0);

        // A late reply finds nothing pending
        fixture.relay.ResolveLookup(SaltFound{"late", "salt", {}});
        REQUIRE(log.results.size() == 1);
    }
    SECTION("A late reply to a timed-out lookup is not given to the next one") {
        fixture.relay.LookupSalt("alice", log.Callback());
        fixture.scheduler.AdvanceBy(3000ms);
        REQUIRE(log.results.size() == 1);
        REQUIRE_FALSE(log.results[0].has_value());

        fixture.relay.LookupSalt("bob", log.Callback());
        fixture.relay.ResolveLookup(SaltFound{"uuid-alice", "salt-alice", {}});
        REQUIRE(log.results.size() == 1);
        REQUIRE(fixture.relay.PendingLookups() == 1);

        fixture.relay.ResolveLookup(SaltFound{"uuid-bob", "salt-bob", {}});
        REQUIRE(log.results.size() == 2);
        REQUIRE(log.results[1]->uuid == "uuid-bob");
        REQUIRE(fixture.relay.PendingLookups() == 0);
    }
    SECTION("A late not-found reply is discarded as well") {
        fixture.relay.LookupSalt("alice", log.Callback());
        fixture.scheduler.AdvanceBy(2000ms);
        fixture.relay.LookupSalt("bob", log.Callback());
        fixture.scheduler.AdvanceBy(1000ms);
        fixture.relay.ResolveLookup(std::nullopt);
        fixture.relay.ResolveLookup(SaltFound{"uuid-bob", "salt-bob", {}});

        REQUIRE(log.results.size() == 2);
        REQUIRE_FALSE(log.results[0].has_value());
        REQUIRE(log.results[1]->uuid == "uuid-bob");
    }
    SECTION("Close forgets replies owed to expired lookups") {
        fixture.relay.LookupSalt("alice", log.Callback());
        fixture.scheduler.AdvanceBy(3000ms);
        fixture.relay.Close();
        REQUIRE(fixture.relay.Open().IsOk());

        fixture.relay.LookupSalt("bob", log.Callback());
        fixture.relay.ResolveLookup(SaltFound{"uuid-bob", "salt-bob", {}});
        REQUIRE(log.results.size() == 2);
        REQUIRE(log.results[1]->uuid == "uuid-bob");
    }
    SECTION("An unsent lookup completes immediately") {
        fixture.wire->fail_sends = true;
        fixture.relay.LookupSalt("alice", log.Callback());
        REQUIRE(log.results.size() == 1);
        REQUIRE_FALSE(log.results[0].has_value());
        REQUIRE(fixture.relay.PendingLookups() == 0);
    }
    SECTION("Close completes pending lookups") {
        fixture.relay.LookupSalt("alice", log.Callback());
        fixture.relay.LookupSalt("bob", log.Callback());
        fixture.relay.Close();
        REQUIRE(log.results.size() == 2);
        REQUIRE_FALSE(log.results[0].has_value());
        REQUIRE_FALSE(log.results[1].has_value());
        REQUIRE(fixture.scheduler.PendingCount() == 0);
    }
}
