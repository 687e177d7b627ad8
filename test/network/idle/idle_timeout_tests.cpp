// Idle, keep-alive and in-call timeout tests (mock time)
#include <catch2/catch_test_macros.hpp>
#include "network/connection_handler.hpp"
#include "network/protocol.hpp"
#include "util/time.hpp"
#include "../infra/handler_pair.hpp"

using namespace parley;
using namespace parley::network;
using namespace parley::test;
using protocol::MessageType;

namespace {

void EstablishCall(HandlerPair& pair) {
    pair.a->start_call();
    REQUIRE(pair.pump_until([&] { return pair.b->call_status() == calls::CallStatus::RECEIVING; }));
    pair.b->answer_call(true);
    REQUIRE(pair.pump_until([&] {
        return pair.a->call_status() == calls::CallStatus::IN_CALL &&
               pair.b->call_status() == calls::CallStatus::IN_CALL;
    }));
}

} // namespace

TEST_CASE("Idle timeout - quiet session", "[network][idle][timeout]") {
    util::MockTimeScope mock(1700000000);
    HandlerPair pair;
    REQUIRE(pair.connect());

    // Pings flow in the meantime but do not count as activity
    util::AdvanceMockTimeMillis(protocol::IDLE_TIMEOUT_MS - 1);
    pair.pump(4);
    REQUIRE_FALSE(pair.a->is_finished());
    CHECK(pair.conn_a->count_sent(MessageType::PING) >= 1);
    CHECK(pair.conn_b->count_sent(MessageType::PONG) >= 1);

    util::AdvanceMockTimeMillis(1);
    CHECK_FALSE(Step(pair.a));
    CHECK(pair.a->disconnect_reason() == DisconnectReason::IDLE_TIMEOUT);
    CHECK(pair.events_a->count("closed") == 1);
}

TEST_CASE("Idle timeout - messages keep the session alive", "[network][idle][timeout]") {
    util::MockTimeScope mock(1700000000);
    HandlerPair pair;
    REQUIRE(pair.connect());

    util::AdvanceMockTimeMillis(protocol::IDLE_TIMEOUT_MS - 100000);
    REQUIRE(pair.a->send_message(1, 0, 1, 0, protocol::content::TEXT, {'h', 'i'}));
    REQUIRE(pair.pump_until([&] { return pair.events_a->count("delivered") == 1; }));
    // Let the ping exchange that came due in the meantime finish
    pair.pump(4);

    util::AdvanceMockTimeMillis(200000);
    pair.pump(3);
    CHECK_FALSE(pair.a->is_finished());
    CHECK_FALSE(pair.b->is_finished());
}

TEST_CASE("Keep-alive - ping and pong", "[network][idle][ping]") {
    util::MockTimeScope mock(1700000000);
    HandlerPair pair;
    REQUIRE(pair.connect());
    CHECK(pair.a->stats().ping_time_ms.load().count() == -1);

    SECTION("No ping before the interval") {
        util::AdvanceMockTimeMillis(protocol::PING_INTERVAL_MS / 2);
        pair.pump(2);
        CHECK(pair.conn_a->count_sent(MessageType::PING) == 0);
    }

    SECTION("Ping after the interval, round trip measured") {
        util::AdvanceMockTimeMillis(protocol::PING_INTERVAL_MS);
        REQUIRE(Step(pair.a));
        message::PingMessage ping;
        REQUIRE(pair.conn_a->last_sent(MessageType::PING, ping));

        pair.pump(2);
        message::PongMessage pong;
        REQUIRE(pair.conn_b->last_sent(MessageType::PONG, pong));
        CHECK(pong.nonce == ping.nonce);
        CHECK(pair.a->stats().ping_time_ms.load().count() == 0);
    }

    SECTION("Unanswered ping") {
        util::AdvanceMockTimeMillis(protocol::PING_INTERVAL_MS);
        REQUIRE(Step(pair.a));
        // B is never ticked, so nobody answers
        util::AdvanceMockTimeMillis(protocol::PING_TIMEOUT_MS - 1);
        REQUIRE(Step(pair.a));
        util::AdvanceMockTimeMillis(1);
        CHECK_FALSE(Step(pair.a));
        CHECK(pair.a->disconnect_reason() == DisconnectReason::PING_TIMEOUT);
    }

    SECTION("Pong with a stale nonce is ignored") {
        pair.conn_b->write(message::build_frame(message::PongMessage(12345)));
        pair.pump(2);
        CHECK_FALSE(pair.a->is_finished());
        CHECK(pair.a->stats().ping_time_ms.load().count() == -1);
    }
}

TEST_CASE("Call timeouts", "[network][idle][calls]") {
    util::MockTimeScope mock(1700000000);
    HandlerPair pair;
    REQUIRE(pair.connect());

    SECTION("Ringing call uses the short threshold") {
        pair.a->start_call();
        REQUIRE(pair.pump_until([&] { return pair.events_b->count("incoming_call") == 1; }));
        util::AdvanceMockTimeMillis(protocol::CALL_IDLE_TIMEOUT_MS);
        CHECK_FALSE(Step(pair.b));
        CHECK(pair.b->disconnect_reason() == DisconnectReason::IDLE_TIMEOUT);
    }

    SECTION("Silent call ends the session") {
        EstablishCall(pair);
        util::AdvanceMockTimeMillis(protocol::CALL_IDLE_TIMEOUT_MS);
        CHECK_FALSE(Step(pair.a));
        CHECK(pair.a->disconnect_reason() == DisconnectReason::IDLE_TIMEOUT);

        auto events = pair.events_a->events();
        REQUIRE(events.size() >= 2);
        CHECK(events[events.size() - 2] == "call:hangup");
        CHECK(events.back() == "closed");
        CHECK(pair.audio_a->log->senders_running == 0);
    }

    SECTION("Pings every two seconds in a call") {
        EstablishCall(pair);
        pair.conn_a->clear_sent();
        util::AdvanceMockTimeMillis(protocol::CALL_PING_INTERVAL_MS);
        REQUIRE(Step(pair.a));
        CHECK(pair.conn_a->count_sent(MessageType::PING) == 1);
    }

    SECTION("Audio keeps the call alive") {
        EstablishCall(pair);
        for (int i = 0; i < 6; ++i) {
            util::AdvanceMockTimeMillis(1000);
            REQUIRE(pair.audio_a->last_sender->emit({0x01}));
            REQUIRE(pair.audio_b->last_sender->emit({0x02}));
            pair.pump(3);
            REQUIRE_FALSE(pair.a->is_finished());
            REQUIRE_FALSE(pair.b->is_finished());
        }
        CHECK(pair.audio_b->log->played_count() == 6);
    }

    SECTION("Back to the long threshold after hangup") {
        EstablishCall(pair);
        pair.a->hangup_call();
        REQUIRE(pair.pump_until([&] { return pair.b->call_status() == calls::CallStatus::IDLE; }));
        util::AdvanceMockTimeMillis(protocol::CALL_IDLE_TIMEOUT_MS * 2);
        pair.pump(3);
        CHECK_FALSE(pair.a->is_finished());
        CHECK_FALSE(pair.b->is_finished());
    }
}
