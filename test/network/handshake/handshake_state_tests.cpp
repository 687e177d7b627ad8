// Tests for HandshakeStateMachine in isolation (no transport)
#include <catch2/catch_test_macros.hpp>
#include "network/handshake.hpp"
#include "network/protocol.hpp"
#include "../infra/handler_pair.hpp"

using namespace parley;
using namespace parley::network;
using parley::test::MakeIdentity;

namespace {

template <typename T> const T& ReplyAs(const HandshakeStep& step) {
    REQUIRE(step.reply);
    return static_cast<const T&>(*step.reply);
}

// Pass a reply through the wire format, as the peer would see it
template <typename T> T Reparse(const message::Message& msg) {
    T out;
    auto bytes = msg.serialize();
    REQUIRE(out.deserialize(bytes.data(), bytes.size()));
    return out;
}

} // namespace

TEST_CASE("Handshake - Full mutual authentication", "[network][handshake]") {
    auto id_a = MakeIdentity();
    auto id_b = MakeIdentity();
    HandshakeStateMachine a(id_a, true, 11, std::vector<uint8_t>{0x0a});
    HandshakeStateMachine b(id_b, false, 22);

    REQUIRE(a.state() == HandshakeState::CONNECTED_OUT);
    REQUIRE(b.state() == HandshakeState::CONNECTED_IN);
    REQUIRE(a.set_peer(id_b->public_key()));

    // A: HELLO
    auto s1 = a.start();
    REQUIRE(s1.ok);
    CHECK(a.state() == HandshakeState::HELLO_SENT);
    auto hello = Reparse<message::HelloMessage>(*s1.reply);
    CHECK(hello.public_key == id_a->public_key());
    CHECK(hello.receiver == id_b->public_key());
    CHECK(hello.client_id == 11);
    REQUIRE(hello.address.has_value());

    // B: CHALLENGE
    auto s2 = b.on_hello(hello);
    REQUIRE(s2.ok);
    CHECK(b.state() == HandshakeState::CHALLENGE_SENT);
    CHECK(b.peer() == std::optional<std::vector<uint8_t>>(id_a->public_key()));
    CHECK(b.peer_client_id() == 11);
    auto challenge = Reparse<message::ChallengeMessage>(*s2.reply);
    CHECK(challenge.challenge.size() == protocol::CHALLENGE_SIZE);

    // A: CHALLENGE_ANSWER
    auto s3 = a.on_challenge(challenge);
    REQUIRE(s3.ok);
    CHECK(a.state() == HandshakeState::CHALLENGE_ANSWERED);
    CHECK(s3.reply->type() == protocol::MessageType::CHALLENGE_ANSWER);

    // B: verify, OK(0)
    auto s4 = b.on_answer(Reparse<message::ChallengeAnswerMessage>(*s3.reply));
    REQUIRE(s4.ok);
    CHECK(s4.peer_authenticated);
    CHECK(b.state() == HandshakeState::AUTH_DONE);
    CHECK(ReplyAs<message::OkMessage>(s4).id == 0);

    // A: CHALLENGE2
    auto s5 = a.on_ok();
    REQUIRE(s5.ok);
    CHECK(a.state() == HandshakeState::CHALLENGE2_SENT);
    auto challenge2 = ReplyAs<message::ChallengeMessage>(s5);
    CHECK(challenge2.second);
    CHECK(challenge2.challenge != challenge.challenge);

    // B: CHALLENGE_ANSWER2
    auto s6 = b.on_challenge(Reparse<message::ChallengeMessage>(*s5.reply));
    REQUIRE(s6.ok);
    CHECK(b.state() == HandshakeState::CHALLENGE2_ANSWERED);
    CHECK(s6.reply->type() == protocol::MessageType::CHALLENGE_ANSWER2);
    CHECK_FALSE(s6.peer_authenticated);

    // A: verify, OK(0)
    auto s7 = a.on_answer(Reparse<message::ChallengeAnswerMessage>(*s6.reply));
    REQUIRE(s7.ok);
    CHECK(s7.peer_authenticated);
    CHECK(a.authenticated());

    // B: done
    auto s8 = b.on_ok();
    REQUIRE(s8.ok);
    CHECK_FALSE(s8.reply);
    CHECK(b.authenticated());

    // Stray OK(0) afterwards is harmless
    auto s9 = b.on_ok();
    CHECK(s9.ok);
    CHECK(b.authenticated());
}

TEST_CASE("Handshake - HELLO validation", "[network][handshake]") {
    auto id_b = MakeIdentity();
    HandshakeStateMachine b(id_b, false, 0);

    message::HelloMessage hello;
    hello.public_key = MakeIdentity()->public_key();
    hello.receiver = id_b->public_key();

    SECTION("Addressed to someone else") {
        hello.receiver = MakeIdentity()->public_key();
        auto step = b.on_hello(hello);
        CHECK_FALSE(step.ok);
        CHECK_FALSE(step.reply);
        CHECK_FALSE(b.peer().has_value());
    }

    SECTION("Short sender key") {
        hello.public_key.resize(16);
        CHECK_FALSE(b.on_hello(hello).ok);
    }

    SECTION("Second HELLO") {
        REQUIRE(b.on_hello(hello).ok);
        CHECK_FALSE(b.on_hello(hello).ok);
    }

    SECTION("HELLO to an initiator") {
        HandshakeStateMachine a(MakeIdentity(), true, 0);
        hello.receiver = MakeIdentity()->public_key();
        CHECK_FALSE(a.on_hello(hello).ok);
    }
}

TEST_CASE("Handshake - Out of order messages are fatal", "[network][handshake]") {
    auto id_a = MakeIdentity();
    auto id_b = MakeIdentity();
    std::vector<uint8_t> bytes32(protocol::CHALLENGE_SIZE, 0x5A);

    SECTION("Outbound start needs a peer") {
        HandshakeStateMachine a(id_a, true, 0);
        CHECK_FALSE(a.start().ok);
    }

    SECTION("Peer can be set once") {
        HandshakeStateMachine a(id_a, true, 0);
        CHECK(a.set_peer(id_b->public_key()));
        CHECK_FALSE(a.set_peer(id_a->public_key()));
    }

    SECTION("CHALLENGE before HELLO was sent") {
        HandshakeStateMachine a(id_a, true, 0);
        CHECK_FALSE(a.on_challenge(message::ChallengeMessage(bytes32, false)).ok);
    }

    SECTION("Acceptor is never asked to sign before it verified") {
        HandshakeStateMachine b(id_b, false, 0);
        CHECK_FALSE(b.on_challenge(message::ChallengeMessage(bytes32, false)).ok);
        CHECK_FALSE(b.on_challenge(message::ChallengeMessage(bytes32, true)).ok);
    }

    SECTION("Challenge of the wrong size") {
        HandshakeStateMachine a(id_a, true, 0);
        REQUIRE(a.set_peer(id_b->public_key()));
        REQUIRE(a.start().ok);
        CHECK_FALSE(a.on_challenge(message::ChallengeMessage({0x01, 0x02}, false)).ok);
    }

    SECTION("Answer without a challenge") {
        HandshakeStateMachine b(id_b, false, 0);
        CHECK_FALSE(b.on_answer(message::ChallengeAnswerMessage(
                                    std::vector<uint8_t>(64, 0), false))
                        .ok);
    }

    SECTION("OK(0) before any challenge") {
        HandshakeStateMachine a(id_a, true, 0);
        CHECK_FALSE(a.on_ok().ok);
    }
}

TEST_CASE("Handshake - Forged signatures", "[network][handshake][security]") {
    auto id_a = MakeIdentity();
    auto id_b = MakeIdentity();
    auto mallory = MakeIdentity();

    SECTION("Initiator claims a key it does not hold") {
        HandshakeStateMachine b(id_b, false, 0);
        message::HelloMessage hello;
        hello.public_key = id_a->public_key();
        hello.receiver = id_b->public_key();
        auto s1 = b.on_hello(hello);
        REQUIRE(s1.ok);
        auto challenge = ReplyAs<message::ChallengeMessage>(s1);

        auto step = b.on_answer(message::ChallengeAnswerMessage(
            mallory->Sign(challenge.challenge), false));
        CHECK_FALSE(step.ok);
        CHECK_FALSE(step.peer_authenticated);
        CHECK(b.state() == HandshakeState::CHALLENGE_SENT);
    }

    SECTION("Acceptor impersonated in the reverse round") {
        HandshakeStateMachine a(id_a, true, 0);
        REQUIRE(a.set_peer(id_b->public_key()));
        REQUIRE(a.start().ok);
        REQUIRE(a.on_challenge(message::ChallengeMessage(
                                   std::vector<uint8_t>(protocol::CHALLENGE_SIZE, 1), false))
                    .ok);
        auto s = a.on_ok();
        REQUIRE(s.ok);
        auto challenge2 = ReplyAs<message::ChallengeMessage>(s);

        auto step = a.on_answer(message::ChallengeAnswerMessage(
            mallory->Sign(challenge2.challenge), true));
        CHECK_FALSE(step.ok);
        CHECK_FALSE(a.authenticated());
    }

    SECTION("Replayed signature over a different challenge") {
        HandshakeStateMachine b(id_b, false, 0);
        message::HelloMessage hello;
        hello.public_key = id_a->public_key();
        hello.receiver = id_b->public_key();
        REQUIRE(b.on_hello(hello).ok);

        auto stale = id_a->Sign(std::vector<uint8_t>(protocol::CHALLENGE_SIZE, 0));
        CHECK_FALSE(b.on_answer(message::ChallengeAnswerMessage(stale, false)).ok);
    }
}
