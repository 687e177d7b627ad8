#pragma once

#include "version.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace parley {
namespace protocol {

// Protocol version - increment when the wire protocol changes
constexpr int32_t PROTOCOL_VERSION = 1;

// Default TCP listen port for the overlay
constexpr uint16_t DEFAULT_PORT = 5050;

// Message type codes (u32 on the wire)
enum class MessageType : uint32_t {
  // Handshake
  HELLO = 1,
  CHALLENGE = 2,
  CHALLENGE_ANSWER = 3,
  CHALLENGE2 = 4,
  CHALLENGE_ANSWER2 = 5,

  // Contact profile exchange
  INFO_REQUEST = 6,
  INFO_RESPONSE = 7,

  // Call signaling
  CALL_OFFER = 20,
  CALL_ANSWER = 21,
  CALL_HANG = 22,
  CALL_PACKET = 23,

  // Keep-alive
  PING = 30,
  PONG = 31,

  // User messages and their acknowledgment
  MESSAGE_TEXT = 1000,
  OK = 32767,
};

// Human-readable name for logging. Unknown codes render as "unknown(<n>)".
std::string message_type_name(uint32_t type);

bool is_known_message_type(uint32_t type);

// Content type carried inside MESSAGE_TEXT
namespace content {
constexpr int32_t TEXT = 0;
constexpr int32_t IMAGE = 1;
constexpr int32_t CALL_EVENT = 2;
constexpr int32_t FILE = 3;
constexpr int32_t REACTION = 10;
constexpr int32_t SYSTEM = 1000;

// Types whose wire payload embeds a file next to JSON metadata
inline bool has_attachment(int32_t type) { return type == IMAGE || type == FILE; }
} // namespace content

// Message header: stream (4), type (4), payload length (8), big-endian
constexpr size_t MESSAGE_HEADER_SIZE = 16;

// Overlay address in HELLO: 16-byte IP plus 2-byte port at most
constexpr uint32_t MAX_ADDRESS_LENGTH = 18;

// Identity sizes
constexpr size_t PUBLIC_KEY_SIZE = 32;
constexpr size_t SIGNATURE_SIZE = 64;
constexpr size_t CHALLENGE_SIZE = 32;

// ============================================================================
// LIMITS
// ============================================================================

// Largest payload we accept; anything bigger cannot be framed safely
constexpr uint64_t MAX_PROTOCOL_MESSAGE_LENGTH = 32 * 1024 * 1024;

// Largest payload accepted before the peer is verified. HELLO, CHALLENGE,
// ANSWER and OK are all far smaller.
constexpr uint64_t MAX_HANDSHAKE_MESSAGE_LENGTH = 4096;

// Largest length-prefixed field inside a payload
constexpr uint32_t MAX_FIELD_LENGTH = MAX_PROTOCOL_MESSAGE_LENGTH;

// Profile fields
constexpr size_t MAX_NICKNAME_LENGTH = 256;
constexpr size_t MAX_INFO_LENGTH = 4096;

// Transport read buffer
constexpr size_t STREAM_BUFFER_SIZE = 16 * 1024;

// Random name for received attachments
constexpr size_t ATTACHMENT_NAME_LENGTH = 16;

// ============================================================================
// TIMEOUTS AND INTERVALS (milliseconds)
// ============================================================================

constexpr int64_t IDLE_TIMEOUT_MS = 10 * 60 * 1000;  // no meaningful traffic
constexpr int64_t CALL_IDLE_TIMEOUT_MS = 3500;       // while a call is active
constexpr int64_t PING_INTERVAL_MS = 60 * 1000;
constexpr int64_t CALL_PING_INTERVAL_MS = 2000;
constexpr int64_t PING_TIMEOUT_MS = 5000;            // outstanding ping
constexpr int64_t HANDSHAKE_TIMEOUT_MS = 5000;       // until AUTH2_DONE

// Transport polling
constexpr int64_t READ_TIMEOUT_MS = 500;    // per refill attempt
constexpr int64_t PROBE_TIMEOUT_MS = 10;    // available() probe
constexpr int64_t WRITE_TIMEOUT_MS = 5000;

// Worker backoff: sleep BACKOFF_SLEEP_MS when idle for BACKOFF_AFTER_MS
constexpr int64_t BACKOFF_AFTER_MS = 1000;
constexpr int64_t BACKOFF_SLEEP_MS = 100;

// Outbound connection attempts
constexpr int CONNECTION_TRIES = 5;
constexpr int64_t CONNECTION_RETRY_PERIOD_MS = 1000;

// Message header structure (16 bytes)
struct MessageHeader {
  uint32_t stream;
  uint32_t type;
  uint64_t length;

  MessageHeader();
  MessageHeader(MessageType type, uint64_t len, uint32_t stream = 0);

  MessageType message_type() const { return static_cast<MessageType>(type); }
};

} // namespace protocol
} // namespace parley
