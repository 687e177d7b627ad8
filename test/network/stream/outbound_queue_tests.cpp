// Tests for OutboundQueue - ordering and guid deduplication
#include <catch2/catch_test_macros.hpp>
#include "network/outbound_queue.hpp"
#include <thread>
#include <vector>

using namespace parley::network;

namespace {

OutgoingMessage Msg(uint64_t guid, std::vector<uint8_t> payload = {}) {
    OutgoingMessage msg;
    msg.guid = guid;
    msg.payload = std::move(payload);
    return msg;
}

} // namespace

TEST_CASE("OutboundQueue - FIFO order", "[network][queue]") {
    OutboundQueue queue;
    REQUIRE(queue.empty());

    REQUIRE(queue.enqueue(Msg(3, {'a'})));
    REQUIRE(queue.enqueue(Msg(1, {'b'})));
    REQUIRE(queue.enqueue(Msg(2, {'c'})));
    CHECK(queue.size() == 3);

    CHECK(queue.dequeue_one()->guid == 3);
    CHECK(queue.dequeue_one()->guid == 1);
    auto last = queue.dequeue_one();
    REQUIRE(last.has_value());
    CHECK(last->payload == std::vector<uint8_t>{'c'});
    CHECK_FALSE(queue.dequeue_one().has_value());
}

TEST_CASE("OutboundQueue - Deduplication", "[network][queue]") {
    OutboundQueue queue;

    SECTION("Duplicate while pending") {
        REQUIRE(queue.enqueue(Msg(7)));
        CHECK_FALSE(queue.enqueue(Msg(7)));
        CHECK(queue.size() == 1);
    }

    SECTION("Duplicate after it was sent") {
        REQUIRE(queue.enqueue(Msg(7)));
        REQUIRE(queue.dequeue_one().has_value());
        CHECK(queue.was_submitted(7));
        CHECK_FALSE(queue.enqueue(Msg(7)));
        CHECK(queue.empty());
    }

    SECTION("Unknown guid") {
        CHECK_FALSE(queue.was_submitted(99));
    }
}

TEST_CASE("OutboundQueue - Concurrent producers", "[network][queue][threading]") {
    OutboundQueue queue;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    std::vector<std::thread> producers;
    for (int t = 0; t < kThreads; ++t) {
        producers.emplace_back([&queue, t] {
            for (int i = 0; i < kPerThread; ++i) {
                // Every guid submitted twice from different threads
                queue.enqueue(Msg(static_cast<uint64_t>(i + (t / 2) * kPerThread)));
            }
        });
    }
    for (auto& p : producers) {
        p.join();
    }

    CHECK(queue.size() == static_cast<size_t>(kThreads / 2 * kPerThread));
}
