// Call signaling through a pair of sessions
#include <catch2/catch_test_macros.hpp>
#include "network/connection_handler.hpp"
#include "network/message.hpp"
#include "network/protocol.hpp"
#include "../infra/handler_pair.hpp"

using namespace parley;
using namespace parley::network;
using namespace parley::test;
using calls::CallStatus;
using protocol::MessageType;

namespace {

bool BothInCall(HandlerPair &pair) {
    return pair.a->call_status() == CallStatus::IN_CALL &&
           pair.b->call_status() == CallStatus::IN_CALL;
}

} // namespace

TEST_CASE("Call signaling - accepted call", "[network][handler][calls]") {
    HandlerPair pair;
    REQUIRE(pair.connect());

    pair.a->start_call();
    REQUIRE(pair.pump_until([&] { return pair.events_b->count("incoming_call") == 1; }));
    CHECK(pair.a->call_status() == CallStatus::CALLING);
    CHECK(pair.b->call_status() == CallStatus::RECEIVING);
    CHECK(pair.events_a->count("call:calling") == 1);
    pair.events_b->locked([&] {
        REQUIRE(pair.events_b->incoming_calls.size() == 1);
        CHECK(pair.events_b->incoming_calls[0] == pair.key_a());
    });

    message::CallOfferMessage offer;
    REQUIRE(pair.conn_a->last_sent(MessageType::CALL_OFFER, offer));
    CHECK(offer.mime_type == "audio/opus");
    CHECK(offer.sample_rate == 48000);
    CHECK(offer.channels == 1);

    pair.b->answer_call(true);
    REQUIRE(pair.pump_until([&] { return BothInCall(pair); }));
    CHECK(pair.events_a->count("call:in_call") == 1);
    CHECK(pair.events_b->count("call:in_call") == 1);
    CHECK(pair.audio_a->log->senders_running == 1);
    CHECK(pair.audio_b->log->receivers_running == 1);

    SECTION("Audio flows both ways") {
        REQUIRE(pair.audio_a->last_sender->emit({0x11, 0x22}));
        REQUIRE(pair.audio_b->last_sender->emit({0x33}));
        pair.pump(3);
        {
            std::lock_guard<std::mutex> lock(pair.audio_b->log->mutex);
            REQUIRE(pair.audio_b->log->played.size() == 1);
            CHECK(pair.audio_b->log->played[0] == std::vector<uint8_t>{0x11, 0x22});
        }
        CHECK(pair.audio_a->log->played_count() == 1);
        CHECK(pair.conn_a->count_sent(MessageType::CALL_PACKET) == 1);
    }

    SECTION("Muted sender emits nothing") {
        pair.a->mute_call(true);
        pair.pump(1);
        CHECK(pair.audio_a->log->muted);
        CHECK_FALSE(pair.audio_a->last_sender->emit({0x01}));
        pair.pump(2);
        CHECK(pair.audio_b->log->played_count() == 0);
    }

    SECTION("Local loopback skips the wire") {
        pair.a->loop_data({0x44});
        CHECK(pair.audio_a->log->played_count() == 1);
        CHECK(pair.conn_a->count_sent(MessageType::CALL_PACKET) == 0);
    }

    SECTION("Caller hangs up") {
        pair.a->hangup_call();
        REQUIRE(pair.pump_until([&] { return pair.b->call_status() == CallStatus::IDLE; }));
        CHECK(pair.a->call_status() == CallStatus::IDLE);
        CHECK(pair.events_a->count("call:hangup") == 1);
        CHECK(pair.events_b->count("call:hangup") == 1);
        CHECK(pair.audio_a->log->senders_running == 0);
        CHECK(pair.audio_b->log->receivers_running == 0);
        // The session itself carries on
        CHECK_FALSE(pair.a->is_finished());
        CHECK_FALSE(pair.b->is_finished());
    }

    SECTION("Link lost mid-call") {
        pair.conn_a->close();
        pair.pump(2);
        REQUIRE(pair.a->is_finished());
        REQUIRE(pair.b->is_finished());
        for (auto *events : {pair.events_a.get(), pair.events_b.get()}) {
            auto all = events->events();
            REQUIRE(all.size() >= 2);
            CHECK(all[all.size() - 2] == "call:hangup");
            CHECK(all.back() == "closed");
        }
    }
}

TEST_CASE("Call signaling - rejected call", "[network][handler][calls]") {
    HandlerPair pair;
    REQUIRE(pair.connect());

    pair.a->start_call();
    REQUIRE(pair.pump_until([&] { return pair.b->call_status() == CallStatus::RECEIVING; }));
    pair.b->answer_call(false);
    REQUIRE(pair.pump_until([&] { return pair.a->call_status() == CallStatus::IDLE; }));

    message::CallAnswerMessage answer;
    REQUIRE(pair.conn_b->last_sent(MessageType::CALL_ANSWER, answer));
    CHECK_FALSE(answer.ok);
    CHECK(pair.b->call_status() == CallStatus::IDLE);
    CHECK(pair.events_a->count("call:hangup") == 1);
    CHECK(pair.events_a->count("call:in_call") == 0);
    CHECK(pair.audio_a->log->senders_created == 0);
    CHECK(pair.audio_b->log->senders_created == 0);

    SECTION("A new call can follow") {
        pair.a->start_call();
        REQUIRE(pair.pump_until([&] { return pair.events_b->count("incoming_call") == 2; }));
    }
}

TEST_CASE("Call signaling - stray call messages", "[network][handler][calls]") {
    HandlerPair pair;
    REQUIRE(pair.connect());

    SECTION("Answer without an offer is dropped") {
        pair.conn_b->write(message::build_frame(message::CallAnswerMessage(true)));
        pair.pump(2);
        CHECK_FALSE(pair.a->is_finished());
        CHECK(pair.a->call_status() == CallStatus::IDLE);
        CHECK(pair.a->stats().malformed_messages.load() == 0);
    }

    SECTION("Hangup without a call is ignored") {
        pair.conn_b->write(message::build_frame(message::CallHangMessage()));
        pair.pump(2);
        CHECK_FALSE(pair.a->is_finished());
        CHECK(pair.events_a->count("call:hangup") == 0);
    }

    SECTION("Packets outside a call are discarded") {
        pair.conn_b->write(message::build_frame(MessageType::CALL_PACKET, {0x01}));
        pair.pump(2);
        CHECK_FALSE(pair.a->is_finished());
        CHECK(pair.audio_a->log->played_count() == 0);
    }

    SECTION("Second offer while ringing is ignored") {
        pair.a->start_call();
        REQUIRE(pair.pump_until([&] { return pair.b->call_status() == CallStatus::RECEIVING; }));
        pair.conn_a->write(message::build_frame(message::CallOfferMessage()));
        pair.pump(2);
        CHECK(pair.events_b->count("incoming_call") == 1);
    }

    SECTION("Audio before answer is not sent") {
        pair.a->start_call();
        REQUIRE(pair.pump_until([&] { return pair.b->call_status() == CallStatus::RECEIVING; }));
        CHECK(pair.a->send_data({0x01}));
        CHECK(pair.conn_a->count_sent(MessageType::CALL_PACKET) == 0);
    }
}
