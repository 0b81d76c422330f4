#include <catch2/catch_test_macros.hpp>
#include "cipherlink/core/constants.hpp"
#include "cipherlink/signaling/event_dispatcher.hpp"
#include "helpers/messaging_node.hpp"

using namespace cipherlink;
using namespace cipherlink::messaging;
using namespace cipherlink::signaling;
using namespace cipherlink::test_helpers;

namespace {
    /// A node plus the dispatcher that drains its relay queue
    struct Device {
        Device(std::string_view passphrase, std::string_view salt, std::string name)
            : node(passphrase, salt, std::move(name))
            , dispatcher(node.relay, node.messaging, node.account.keys) {}

        MessagingNode node;
        EventDispatcher dispatcher;
    };

    /// Relays everything `from` sent as pushes to `to` and dispatches them
    size_t Pump(Device& from, Device& to) {
        const auto pushes = from.node.TakeOutbound();
        for (const auto& push : pushes) {
            REQUIRE(to.node.wire->Inject(push).IsOk());
        }
        to.dispatcher.DrainPending();
        return pushes.size();
    }

    const std::string& TextOf(const interfaces::InboundMessage& message) {
        return std::get<PlainMessage>(message.payload).text;
    }
}

TEST_CASE("Two-party messaging - First contact repairs itself", "[integration][messaging]") {
    Device alice("alice-pass", "alice-salt", "alice");
    Device bob("bob-pass", "bob-salt", "bob");
    const auto alice_uuid = alice.node.Uuid();
    const auto bob_uuid = bob.node.Uuid();

    // Alice knows nothing about Bob yet and falls back to her master secret
    REQUIRE(alice.node.messaging.SendText(bob_uuid, "hello?").IsOk());
    REQUIRE(Pump(alice, bob) == 1);

    REQUIRE(bob.node.sink->messages.size() == 1);
    const auto& first = bob.node.sink->messages[0];
    REQUIRE(first.undecryptable);
    REQUIRE(std::get<Unrecognized>(first.payload).text == DisplayText::UNDECRYPTABLE_MESSAGE);
    REQUIRE(bob.node.account.keys.CachedPeerKey(alice_uuid).has_value());

    // Bob asked for a rehandshake; Alice learns his key from the ping and answers
    REQUIRE(Pump(bob, alice) == 1);
    REQUIRE(alice.node.account.keys.CachedPeerKey(bob_uuid).has_value());
    REQUIRE(alice.node.sink->messages.empty());

    // The pong needs no reply
    REQUIRE(Pump(alice, bob) == 1);
    REQUIRE(bob.node.sink->messages.size() == 1);
    REQUIRE(bob.node.TakeOutbound().empty());

    SECTION("Later messages decrypt both ways") {
        REQUIRE(alice.node.messaging.SendText(bob_uuid, "can you read this").IsOk());
        REQUIRE(Pump(alice, bob) == 1);
        REQUIRE(bob.node.sink->messages.size() == 2);
        REQUIRE_FALSE(bob.node.sink->messages[1].undecryptable);
        REQUIRE(TextOf(bob.node.sink->messages[1]) == "can you read this");
        REQUIRE(bob.node.TakeOutbound().empty());

        REQUIRE(bob.node.messaging.SendText(alice_uuid, "loud and clear").IsOk());
        REQUIRE(Pump(bob, alice) == 1);
        REQUIRE(alice.node.sink->messages.size() == 1);
        REQUIRE(TextOf(alice.node.sink->messages[0]) == "loud and clear");
        REQUIRE(alice.node.sink->messages[0].conversation_id == bob_uuid);
    }
    SECTION("Echoes of own messages open with the conversation secret") {
        auto msg_id = alice.node.messaging.SendText(bob_uuid, "note to self");
        REQUIRE(msg_id.IsOk());
        const auto outbound = alice.node.wire->SentOf<RelayMessage>();
        REQUIRE(outbound.size() == 1);

        REQUIRE(alice.node.wire->Inject(alice.node.AsPush(outbound[0])).IsOk());
        alice.dispatcher.DrainPending();
        REQUIRE(alice.node.sink->messages.size() == 1);
        const auto& echo = alice.node.sink->messages[0];
        REQUIRE(echo.is_echo);
        REQUIRE(echo.conversation_id == bob_uuid);
        REQUIRE(TextOf(echo) == "note to self");
    }
    SECTION("Read receipts travel back to the sender") {
        auto msg_id = alice.node.messaging.SendText(bob_uuid, "read me");
        REQUIRE(msg_id.IsOk());
        REQUIRE(Pump(alice, bob) == 1);

        REQUIRE(bob.node.messaging.Acknowledge(alice_uuid, bob.node.sink->messages.back().msg_id).IsOk());
        const auto acks = bob.node.wire->SentOf<MsgAck>();
        REQUIRE(acks.size() == 1);
        REQUIRE(alice.node.wire->Inject(MsgAckPush{bob_uuid, acks[0].msg_id}).IsOk());
        alice.dispatcher.DrainPending();

        REQUIRE(alice.node.sink->receipts.size() == 1);
        REQUIRE(alice.node.sink->receipts[0].first == bob_uuid);
        REQUIRE(alice.node.sink->receipts[0].second == msg_id.Unwrap());
    }
    SECTION("Redelivered messages are shown once") {
        REQUIRE(alice.node.messaging.SendText(bob_uuid, "once").IsOk());
        const auto pushes = alice.node.TakeOutbound();
        REQUIRE(pushes.size() == 1);
        REQUIRE(bob.node.wire->Inject(pushes[0]).IsOk());
        REQUIRE(bob.node.wire->Inject(QueueFlush{{pushes[0]}}).IsOk());
        REQUIRE(bob.dispatcher.DrainPending() == 2);
        REQUIRE(bob.node.sink->messages.size() == 2);
        REQUIRE(TextOf(bob.node.sink->messages[1]) == "once");
    }
}
