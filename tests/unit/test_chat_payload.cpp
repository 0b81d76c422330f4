#include <catch2/catch_test_macros.hpp>
#include "cipherlink/messaging/chat_payload.hpp"

using namespace cipherlink;
using namespace cipherlink::messaging;

TEST_CASE("ChatPayloadCodec - Plain messages", "[payload][messaging]") {
    PlainMessage message;
    message.text = "hi there";
    message.timestamp = 1700000000000;

    SECTION("Direct message keeps optional fields empty") {
        const auto parsed = ChatPayloadCodec::Parse(ChatPayloadCodec::Serialize(message));
        const auto* plain = std::get_if<PlainMessage>(&parsed);
        REQUIRE(plain != nullptr);
        REQUIRE(plain->text == "hi there");
        REQUIRE(plain->timestamp == 1700000000000);
        REQUIRE_FALSE(plain->reply_to.has_value());
        REQUIRE_FALSE(plain->group_id.has_value());
        REQUIRE(plain->participants.empty());
    }
    SECTION("Group message with a reply") {
        message.reply_to = ReplyReference{"m-1", "earlier", "bob"};
        message.group_id = "g1";
        message.group_name = "Friends";
        message.participants = {"u0", "u1", "u2"};

        const auto parsed = ChatPayloadCodec::Parse(ChatPayloadCodec::Serialize(message));
        const auto& plain = std::get<PlainMessage>(parsed);
        REQUIRE(plain.reply_to->message_id == "m-1");
        REQUIRE(plain.reply_to->sender == "bob");
        REQUIRE(plain.group_id == "g1");
        REQUIRE(plain.group_name == "Friends");
        REQUIRE(plain.participants == std::vector<std::string>{"u0", "u1", "u2"});
        REQUIRE_FALSE(ChatPayloadCodec::IsSystem(parsed));
    }
}

TEST_CASE("ChatPayloadCodec - System messages", "[payload][messaging]") {
    SECTION("Ping carries the sender name") {
        const auto parsed = ChatPayloadCodec::Parse(
            ChatPayloadCodec::Serialize(SystemMessage{SystemKind::E2eePing, "alice", std::nullopt}));
        REQUIRE(ChatPayloadCodec::IsSystem(parsed));
        const auto& system = std::get<SystemMessage>(parsed);
        REQUIRE(system.kind == SystemKind::E2eePing);
        REQUIRE(system.username == "alice");
        REQUIRE_FALSE(system.signal.has_value());
    }
    SECTION("WebRTC signal keeps its body") {
        proto::call::CallSignal signal;
        signal.set_type(proto::call::SIGNAL_TYPE_OFFER);
        signal.set_sdp("v=0");
        signal.set_group_id("g1");
        const auto parsed = ChatPayloadCodec::Parse(
            ChatPayloadCodec::Serialize(SystemMessage{SystemKind::WebRtcSignal, "alice", signal}));
        const auto& system = std::get<SystemMessage>(parsed);
        REQUIRE(system.signal.has_value());
        REQUIRE(system.signal->sdp() == "v=0");
        REQUIRE(system.signal->group_id() == "g1");
    }
    SECTION("WebRTC signal without a body is not trusted") {
        const auto parsed = ChatPayloadCodec::Parse(
            ChatPayloadCodec::Serialize(SystemMessage{SystemKind::WebRtcSignal, "alice", std::nullopt}));
        REQUIRE(std::holds_alternative<Unrecognized>(parsed));
    }
    SECTION("Kind names") {
        REQUIRE(ToString(SystemKind::FriendRequest) == "FRIEND_REQUEST");
        REQUIRE(ToString(SystemKind::E2eePong) == "E2EE_PONG");
        REQUIRE(ToString(SystemKind::WebRtcSignal) == "WEBRTC_SIGNAL");
    }
}

TEST_CASE("ChatPayloadCodec - Unrecognized input", "[payload][messaging]") {
    SECTION("Bytes that are not a payload keep their text") {
        const std::string junk("\xff\xff\xff", 3);
        const auto parsed = ChatPayloadCodec::Parse(junk);
        REQUIRE(std::get<Unrecognized>(parsed).text == junk);
    }
    SECTION("Empty payload has no body") {
        REQUIRE(std::holds_alternative<Unrecognized>(ChatPayloadCodec::Parse("")));
    }
}
