// Tests for TransportStream - buffered blocking reads over a Connection
#include <catch2/catch_test_macros.hpp>
#include "network/transport_stream.hpp"
#include "../infra/memory_connection.hpp"
#include <chrono>
#include <thread>

using namespace parley;
using namespace parley::network;
using parley::test::MemoryConnection;
using namespace std::chrono_literals;

namespace {

struct StreamFixture {
    StreamFixture(size_t buffer_size = 64) {
        auto pipe = MemoryConnection::CreatePair();
        local = pipe.first;
        remote = pipe.second;
        stream = std::make_unique<TransportStream>(local, 5ms, 1ms, buffer_size);
    }

    MemoryConnection::Ptr local;
    MemoryConnection::Ptr remote;
    std::unique_ptr<TransportStream> stream;
};

std::vector<uint8_t> Sequence(size_t n) {
    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = static_cast<uint8_t>(i);
    }
    return out;
}

} // namespace

TEST_CASE("TransportStream - Single byte reads", "[network][stream]") {
    StreamFixture f;
    f.remote->write({0x10, 0x20});

    CHECK(f.stream->read() == 0x10);
    CHECK(f.stream->read() == 0x20);

    f.remote->close();
    CHECK(f.stream->read() == -1);
    CHECK(f.stream->closed());
}

TEST_CASE("TransportStream - read_exact assembles chunks", "[network][stream]") {
    StreamFixture f;
    auto data = Sequence(40);

    SECTION("Chunks already buffered") {
        f.remote->write({data.begin(), data.begin() + 7});
        f.remote->write({data.begin() + 7, data.end()});
        CHECK(f.stream->read_exact(40) == data);
    }

    SECTION("Empty reads in between are retried") {
        std::thread writer([&] {
            f.remote->write({data.begin(), data.begin() + 3});
            std::this_thread::sleep_for(30ms);
            f.remote->write({data.begin() + 3, data.end()});
        });
        auto got = f.stream->read_exact(40);
        writer.join();
        CHECK(got == data);
    }

    SECTION("Request larger than the buffer") {
        auto big = Sequence(200);
        f.remote->write(big);
        CHECK(f.stream->read_exact(200) == big);
    }
}

TEST_CASE("TransportStream - End of stream", "[network][stream]") {
    StreamFixture f;

    SECTION("Close mid-read throws") {
        f.remote->write({1, 2, 3});
        f.remote->close();
        uint8_t out[8];
        CHECK_THROWS_AS(f.stream->read_exact(out, sizeof(out)), StreamClosedError);
    }

    SECTION("Buffered bytes are still readable after close") {
        f.remote->write({1, 2, 3});
        REQUIRE(f.stream->available() == 3);
        f.remote->close();
        CHECK(f.stream->read_exact(3) == std::vector<uint8_t>{1, 2, 3});
        CHECK(f.stream->read() == -1);
    }

    SECTION("Dead link ends the stream") {
        f.local->kill();
        CHECK(f.stream->read() == -1);
        CHECK(f.stream->closed());
    }

    SECTION("Interrupt ends a blocked read") {
        std::thread interrupter([&] {
            std::this_thread::sleep_for(20ms);
            f.stream->interrupt();
        });
        CHECK(f.stream->read() == -1);
        interrupter.join();
        CHECK(f.stream->interrupted());
    }
}

TEST_CASE("TransportStream - available()", "[network][stream]") {
    StreamFixture f;

    SECTION("Nothing pending") {
        CHECK(f.stream->available() == 0);
    }

    SECTION("Probe pulls pending bytes") {
        f.remote->write(Sequence(20));
        CHECK(f.stream->available() == 20);
        CHECK(f.stream->buffered() == 20);
    }

    SECTION("Does not probe when a header is already buffered") {
        f.remote->write(Sequence(protocol::MESSAGE_HEADER_SIZE));
        REQUIRE(f.stream->available() == protocol::MESSAGE_HEADER_SIZE);
        f.remote->write(Sequence(4));
        CHECK(f.stream->available() == protocol::MESSAGE_HEADER_SIZE);
    }

    SECTION("Reading consumes") {
        f.remote->write(Sequence(20));
        REQUIRE(f.stream->available() == 20);
        f.stream->read_exact(5);
        CHECK(f.stream->available() == 15);
    }
}

TEST_CASE("TransportStream - Non-blocking reads", "[network][stream]") {
    StreamFixture f(16);

    SECTION("Nothing pending returns at once") {
        std::vector<uint8_t> out(8);
        auto start = std::chrono::steady_clock::now();
        CHECK(f.stream->read_available(out.data(), out.size()) == 0);
        CHECK(f.stream->skip_available(8) == 0);
        CHECK(std::chrono::steady_clock::now() - start < 1s);
        CHECK_FALSE(f.stream->closed());
    }

    SECTION("Returns what is there, never more than asked") {
        f.remote->write(Sequence(10));
        std::vector<uint8_t> out(32);
        REQUIRE(f.stream->read_available(out.data(), 4) == 4);
        CHECK(out[3] == 3);
        REQUIRE(f.stream->read_available(out.data(), out.size()) == 6);
        CHECK(out[0] == 4);
        CHECK(out[5] == 9);
        CHECK(f.stream->read_available(out.data(), out.size()) == 0);
    }

    SECTION("Larger than the buffer arrives in pieces") {
        f.remote->write(Sequence(40));
        std::vector<uint8_t> out;
        std::vector<uint8_t> chunk(64);
        for (int i = 0; i < 10 && out.size() < 40; ++i) {
            size_t n = f.stream->read_available(chunk.data(), chunk.size());
            CHECK(n <= 16);
            out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
        }
        CHECK(out == Sequence(40));
    }

    SECTION("Skip drops bytes and keeps the rest readable") {
        f.remote->write(Sequence(12));
        REQUIRE(f.stream->skip_available(10) == 10);
        CHECK(f.stream->read() == 10);
    }

    SECTION("End of stream is observed") {
        f.remote->close();
        std::vector<uint8_t> out(4);
        CHECK(f.stream->read_available(out.data(), out.size()) == 0);
        CHECK(f.stream->closed());
    }
}
