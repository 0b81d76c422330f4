#include <catch2/catch_test_macros.hpp>
#include "cipherlink/signaling/signaling_queue.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace cipherlink;
using namespace cipherlink::signaling;

namespace {
    InboundEvent Ack(const std::string& msg_id) {
        return MsgAckPush{"peer", msg_id};
    }

    std::string AckId(const InboundEvent& event) {
        return std::get<MsgAckPush>(event).msg_id;
    }
}

TEST_CASE("SignalingQueue - Bounded FIFO", "[queue][signaling]") {
    SignalingQueue queue(3);
    REQUIRE(queue.Capacity() == 3);

    SECTION("Pop returns events in arrival order") {
        REQUIRE(queue.TryPush(Ack("1")).IsOk());
        REQUIRE(queue.TryPush(Ack("2")).IsOk());
        REQUIRE(AckId(*queue.TryPop()) == "1");
        REQUIRE(AckId(*queue.TryPop()) == "2");
        REQUIRE_FALSE(queue.TryPop().has_value());
    }
    SECTION("A full queue refuses with QueueFull") {
        for (int i = 0; i < 3; ++i) {
            REQUIRE(queue.TryPush(Ack(std::to_string(i))).IsOk());
        }
        auto refused = queue.TryPush(Ack("overflow"));
        REQUIRE(refused.IsErr());
        REQUIRE(refused.UnwrapErr().type == FailureType::QueueFull);
        REQUIRE(queue.Size() == 3);

        (void)queue.TryPop();
        REQUIRE(queue.TryPush(Ack("again")).IsOk());
    }
    SECTION("DrainAll empties the queue in order") {
        REQUIRE(queue.TryPush(Ack("a")).IsOk());
        REQUIRE(queue.TryPush(Ack("b")).IsOk());
        const auto drained = queue.DrainAll();
        REQUIRE(drained.size() == 2);
        REQUIRE(AckId(drained[0]) == "a");
        REQUIRE(AckId(drained[1]) == "b");
        REQUIRE(queue.Size() == 0);
        REQUIRE(queue.DrainAll().empty());
    }
    SECTION("Notifier fires only for accepted events") {
        int notified = 0;
        queue.SetNotifier([&notified] { ++notified; });
        for (int i = 0; i < 4; ++i) {
            (void)queue.TryPush(Ack(std::to_string(i)));
        }
        REQUIRE(notified == 3);
    }
}

TEST_CASE("SignalingQueue - Concurrent producers", "[queue][signaling][concurrency]") {
    constexpr int PRODUCERS = 4;
    constexpr int PER_PRODUCER = 200;
    SignalingQueue queue(PRODUCERS * PER_PRODUCER);
    std::atomic<int> notified{0};
    queue.SetNotifier([&notified] { notified.fetch_add(1, std::memory_order_relaxed); });

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&queue, p] {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                (void)queue.TryPush(MsgAckPush{std::to_string(p), std::to_string(i)});
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    const auto drained = queue.DrainAll();
    REQUIRE(drained.size() == PRODUCERS * PER_PRODUCER);
    REQUIRE(notified.load() == PRODUCERS * PER_PRODUCER);

    // Each producer's events keep their relative order
    std::vector<int> next(PRODUCERS, 0);
    for (const auto& event : drained) {
        const auto& ack = std::get<MsgAckPush>(event);
        const int producer = std::stoi(ack.from);
        REQUIRE(std::stoi(ack.msg_id) == next[producer]);
        ++next[producer];
    }
}
