// Fuzz target for message header parsing
// The header is stream, type and length, all big-endian

#include "network/message.hpp"
#include "network/protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace parley::message;
    using namespace parley::protocol;

    MessageHeader header;
    bool success = deserialize_header(data, size, header);

    // CRITICAL: short input must be rejected, full input accepted
    if (success != (size >= MESSAGE_HEADER_SIZE)) {
        __builtin_trap();
    }
    if (!success) return 0;

    auto serialized = serialize_header(header);
    if (serialized.size() != MESSAGE_HEADER_SIZE) {
        // serialize_header() produced wrong size - BUG!
        __builtin_trap();
    }

    // Round trip must reproduce the input bytes exactly
    if (std::memcmp(serialized.data(), data, MESSAGE_HEADER_SIZE) != 0) {
        __builtin_trap();
    }

    // Unknown type codes produce no message, known ones do
    auto msg = create_message(header.type);
    if (msg && static_cast<uint32_t>(msg->type()) != header.type) {
        __builtin_trap();
    }

    return 0;
}
