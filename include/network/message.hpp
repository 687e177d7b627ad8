#pragma once

#include "network/protocol.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley {
namespace message {

/**
 * Serialization buffer for building wire-format payloads
 *
 * All integers are big-endian. Variable-length fields ("blobs") are an i32
 * length followed by the raw bytes.
 */
class MessageSerializer {
public:
  MessageSerializer();

  void write_uint8(uint8_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_int32(int32_t value);
  void write_int64(int64_t value);
  void write_bool(bool value);

  // Length-prefixed fields
  void write_blob(const std::vector<uint8_t> &data);
  void write_string(const std::string &str);

  // Raw bytes, no prefix
  void write_bytes(const uint8_t *data, size_t len);
  void write_bytes(const std::vector<uint8_t> &data);

  const std::vector<uint8_t> &data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }
  size_t size() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * Deserialization cursor over a received payload
 *
 * Reads past the end (or a negative / oversized length prefix) set a sticky
 * error flag and return zero values; callers check has_error() once at the
 * end instead of after every field.
 */
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t *data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t> &data);

  uint8_t read_uint8();
  uint32_t read_uint32();
  uint64_t read_uint64();
  int32_t read_int32();
  int64_t read_int64();
  bool read_bool();

  std::vector<uint8_t> read_blob(size_t max_length = protocol::MAX_FIELD_LENGTH);
  std::string read_string(size_t max_length = protocol::MAX_FIELD_LENGTH);

  std::vector<uint8_t> read_bytes(size_t count);
  std::vector<uint8_t> read_remaining();

  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_; }

  // True when the payload was consumed exactly and without error
  bool finished() const { return !error_ && bytes_remaining() == 0; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t position_;
  bool error_;

  void check_available(size_t bytes);
};

/**
 * Base class for all message payloads
 */
class Message {
public:
  virtual ~Message() = default;

  virtual protocol::MessageType type() const = 0;

  virtual std::vector<uint8_t> serialize() const = 0;

  // Parse a complete payload. Returns false on truncation, bad lengths or
  // trailing bytes.
  virtual bool deserialize(const uint8_t *data, size_t size) = 0;
};

/**
 * HELLO - first message of an outbound session
 *
 * Carries the sender's key, the key it expects to reach, and optionally the
 * sender's overlay address so the receiver can call back later.
 */
class HelloMessage : public Message {
public:
  int32_t version;
  std::vector<uint8_t> public_key;
  std::vector<uint8_t> receiver;
  int32_t client_id;
  std::optional<std::vector<uint8_t>> address;

  HelloMessage();

  protocol::MessageType type() const override {
    return protocol::MessageType::HELLO;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * CHALLENGE / CHALLENGE2 - random bytes the peer must sign
 */
class ChallengeMessage : public Message {
public:
  std::vector<uint8_t> challenge;
  bool second;

  explicit ChallengeMessage(bool second_round = false)
      : second(second_round) {}
  ChallengeMessage(std::vector<uint8_t> bytes, bool second_round)
      : challenge(std::move(bytes)), second(second_round) {}

  protocol::MessageType type() const override {
    return second ? protocol::MessageType::CHALLENGE2
                  : protocol::MessageType::CHALLENGE;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * CHALLENGE_ANSWER / CHALLENGE_ANSWER2 - signature over a challenge
 */
class ChallengeAnswerMessage : public Message {
public:
  std::vector<uint8_t> signature;
  bool second;

  explicit ChallengeAnswerMessage(bool second_round = false)
      : second(second_round) {}
  ChallengeAnswerMessage(std::vector<uint8_t> sig, bool second_round)
      : signature(std::move(sig)), second(second_round) {}

  protocol::MessageType type() const override {
    return second ? protocol::MessageType::CHALLENGE_ANSWER2
                  : protocol::MessageType::CHALLENGE_ANSWER;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * INFO_REQUEST - "send your profile if it changed after since"
 */
class InfoRequestMessage : public Message {
public:
  int64_t since;

  InfoRequestMessage() : since(0) {}
  explicit InfoRequestMessage(int64_t t) : since(t) {}

  protocol::MessageType type() const override {
    return protocol::MessageType::INFO_REQUEST;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * INFO_RESPONSE - contact profile. Empty avatar means "no avatar".
 */
class InfoResponseMessage : public Message {
public:
  int64_t time;
  std::string nickname;
  std::string info;
  std::vector<uint8_t> avatar;

  InfoResponseMessage() : time(0) {}

  protocol::MessageType type() const override {
    return protocol::MessageType::INFO_RESPONSE;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * MESSAGE_TEXT - a user message of any content type
 */
class TextMessage : public Message {
public:
  uint64_t guid;
  uint64_t reply_to;
  int64_t send_time;
  int64_t edit_time;
  int32_t content_type;
  std::vector<uint8_t> data;

  TextMessage();

  protocol::MessageType type() const override {
    return protocol::MessageType::MESSAGE_TEXT;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * OK - acknowledgment. id 0 acknowledges a handshake step, any other id is
 * the guid of a delivered message.
 */
class OkMessage : public Message {
public:
  uint64_t id;

  OkMessage() : id(0) {}
  explicit OkMessage(uint64_t i) : id(i) {}

  protocol::MessageType type() const override {
    return protocol::MessageType::OK;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * CALL_OFFER - audio codec parameters proposed by the caller
 */
class CallOfferMessage : public Message {
public:
  std::string mime_type;
  int32_t sample_rate;
  int32_t channels;

  CallOfferMessage();

  protocol::MessageType type() const override {
    return protocol::MessageType::CALL_OFFER;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * CALL_ANSWER - callee accepts (ok) or rejects the offer
 */
class CallAnswerMessage : public Message {
public:
  bool ok;

  CallAnswerMessage() : ok(false) {}
  explicit CallAnswerMessage(bool accepted) : ok(accepted) {}

  protocol::MessageType type() const override {
    return protocol::MessageType::CALL_ANSWER;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * CALL_HANG - either side ends the call (empty payload)
 */
class CallHangMessage : public Message {
public:
  protocol::MessageType type() const override {
    return protocol::MessageType::CALL_HANG;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * CALL_PACKET - one encoded audio frame; the whole payload is the frame
 */
class CallPacketMessage : public Message {
public:
  std::vector<uint8_t> frame;

  CallPacketMessage() = default;
  explicit CallPacketMessage(std::vector<uint8_t> f) : frame(std::move(f)) {}

  protocol::MessageType type() const override {
    return protocol::MessageType::CALL_PACKET;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * PING message - Keep-alive check
 */
class PingMessage : public Message {
public:
  uint64_t nonce;

  PingMessage() : nonce(0) {}
  explicit PingMessage(uint64_t n) : nonce(n) {}

  protocol::MessageType type() const override {
    return protocol::MessageType::PING;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

/**
 * PONG message - Response to ping
 */
class PongMessage : public Message {
public:
  uint64_t nonce;

  PongMessage() : nonce(0) {}
  explicit PongMessage(uint64_t n) : nonce(n) {}

  protocol::MessageType type() const override {
    return protocol::MessageType::PONG;
  }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size) override;
};

// Serialize header to bytes
std::vector<uint8_t> serialize_header(const protocol::MessageHeader &header);

// Deserialize header from bytes (false if fewer than MESSAGE_HEADER_SIZE)
bool deserialize_header(const uint8_t *data, size_t size,
                        protocol::MessageHeader &header);

// Header + payload, ready to write
std::vector<uint8_t> build_frame(const Message &msg);
std::vector<uint8_t> build_frame(protocol::MessageType type,
                                 const std::vector<uint8_t> &payload);

// Factory: empty message for a type code, nullptr if the code is unknown
std::unique_ptr<Message> create_message(uint32_t type);

} // namespace message
} // namespace parley
