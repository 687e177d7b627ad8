// Fuzz target for message payload deserialization
// Every message type must parse untrusted payloads without crashing

#include "network/message.hpp"
#include "network/protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace {

// Type codes the factory knows about
const uint32_t kTypes[] = {1, 2, 3, 4, 5, 6, 7, 20, 21, 22, 23, 30, 31, 1000, 32767};

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace parley::message;
    using namespace parley::protocol;

    if (size < 1) return 0;

    // First byte selects the message type
    uint32_t type = kTypes[data[0] % (sizeof(kTypes) / sizeof(kTypes[0]))];
    const uint8_t* payload = data + 1;
    size_t payload_size = size - 1;

    auto msg = create_message(type);
    if (!msg) __builtin_trap();

    if (!msg->deserialize(payload, payload_size)) return 0;

    auto serialized = msg->serialize();
    if (serialized.size() > MAX_PROTOCOL_MESSAGE_LENGTH) {
        // serialize() produced oversized message - BUG!
        __builtin_trap();
    }

    // Our own output must parse and re-serialize to the same bytes
    auto msg2 = create_message(type);
    if (!msg2->deserialize(serialized.data(), serialized.size())) {
        __builtin_trap();
    }
    if (msg2->serialize() != serialized) {
        __builtin_trap();
    }

    // Framing must carry the exact payload length
    auto frame = build_frame(*msg);
    MessageHeader header;
    if (!deserialize_header(frame.data(), frame.size(), header) ||
        header.length != serialized.size() || header.type != type) {
        __builtin_trap();
    }

    return 0;
}
