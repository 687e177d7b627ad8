#include "network/message.hpp"
#include "util/endian.hpp"
#include <cstring>

namespace parley {
namespace message {

// MessageSerializer implementation
MessageSerializer::MessageSerializer() { buffer_.reserve(64); }

void MessageSerializer::write_uint8(uint8_t value) { buffer_.push_back(value); }

void MessageSerializer::write_uint32(uint32_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 4);
  util::WriteBE32(buffer_.data() + pos, value);
}

void MessageSerializer::write_uint64(uint64_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 8);
  util::WriteBE64(buffer_.data() + pos, value);
}

void MessageSerializer::write_int32(int32_t value) {
  write_uint32(static_cast<uint32_t>(value));
}

void MessageSerializer::write_int64(int64_t value) {
  write_uint64(static_cast<uint64_t>(value));
}

void MessageSerializer::write_bool(bool value) { write_uint8(value ? 1 : 0); }

void MessageSerializer::write_blob(const std::vector<uint8_t> &data) {
  write_int32(static_cast<int32_t>(data.size()));
  write_bytes(data);
}

void MessageSerializer::write_string(const std::string &str) {
  write_int32(static_cast<int32_t>(str.size()));
  write_bytes(reinterpret_cast<const uint8_t *>(str.data()), str.size());
}

void MessageSerializer::write_bytes(const uint8_t *data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void MessageSerializer::write_bytes(const std::vector<uint8_t> &data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

// MessageDeserializer implementation
MessageDeserializer::MessageDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(size), position_(0), error_(false) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t> &data)
    : data_(data.data()), size_(data.size()), position_(0), error_(false) {}

void MessageDeserializer::check_available(size_t bytes) {
  if (bytes_remaining() < bytes) {
    error_ = true;
  }
}

uint8_t MessageDeserializer::read_uint8() {
  check_available(1);
  if (error_)
    return 0;
  return data_[position_++];
}

uint32_t MessageDeserializer::read_uint32() {
  check_available(4);
  if (error_)
    return 0;
  uint32_t value = util::ReadBE32(data_ + position_);
  position_ += 4;
  return value;
}

uint64_t MessageDeserializer::read_uint64() {
  check_available(8);
  if (error_)
    return 0;
  uint64_t value = util::ReadBE64(data_ + position_);
  position_ += 8;
  return value;
}

int32_t MessageDeserializer::read_int32() {
  return static_cast<int32_t>(read_uint32());
}

int64_t MessageDeserializer::read_int64() {
  return static_cast<int64_t>(read_uint64());
}

bool MessageDeserializer::read_bool() { return read_uint8() != 0; }

std::vector<uint8_t> MessageDeserializer::read_blob(size_t max_length) {
  int32_t len = read_int32();
  // Validate before allocating
  if (error_ || len < 0 || static_cast<size_t>(len) > max_length) {
    error_ = true;
    return {};
  }
  return read_bytes(static_cast<size_t>(len));
}

std::string MessageDeserializer::read_string(size_t max_length) {
  auto bytes = read_blob(max_length);
  return std::string(bytes.begin(), bytes.end());
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t count) {
  check_available(count);
  if (error_)
    return {};
  std::vector<uint8_t> result(data_ + position_, data_ + position_ + count);
  position_ += count;
  return result;
}

std::vector<uint8_t> MessageDeserializer::read_remaining() {
  return read_bytes(bytes_remaining());
}

// Header helpers
std::vector<uint8_t> serialize_header(const protocol::MessageHeader &header) {
  std::vector<uint8_t> buffer(protocol::MESSAGE_HEADER_SIZE);
  util::WriteBE32(buffer.data(), header.stream);
  util::WriteBE32(buffer.data() + 4, header.type);
  util::WriteBE64(buffer.data() + 8, header.length);
  return buffer;
}

bool deserialize_header(const uint8_t *data, size_t size,
                        protocol::MessageHeader &header) {
  if (size < protocol::MESSAGE_HEADER_SIZE) {
    return false;
  }
  header.stream = util::ReadBE32(data);
  header.type = util::ReadBE32(data + 4);
  header.length = util::ReadBE64(data + 8);
  return true;
}

std::vector<uint8_t> build_frame(protocol::MessageType type,
                                 const std::vector<uint8_t> &payload) {
  protocol::MessageHeader header(type, payload.size());
  std::vector<uint8_t> frame = serialize_header(header);
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

std::vector<uint8_t> build_frame(const Message &msg) {
  return build_frame(msg.type(), msg.serialize());
}

std::unique_ptr<Message> create_message(uint32_t type) {
  using protocol::MessageType;
  switch (static_cast<MessageType>(type)) {
  case MessageType::HELLO:
    return std::make_unique<HelloMessage>();
  case MessageType::CHALLENGE:
    return std::make_unique<ChallengeMessage>(false);
  case MessageType::CHALLENGE2:
    return std::make_unique<ChallengeMessage>(true);
  case MessageType::CHALLENGE_ANSWER:
    return std::make_unique<ChallengeAnswerMessage>(false);
  case MessageType::CHALLENGE_ANSWER2:
    return std::make_unique<ChallengeAnswerMessage>(true);
  case MessageType::INFO_REQUEST:
    return std::make_unique<InfoRequestMessage>();
  case MessageType::INFO_RESPONSE:
    return std::make_unique<InfoResponseMessage>();
  case MessageType::CALL_OFFER:
    return std::make_unique<CallOfferMessage>();
  case MessageType::CALL_ANSWER:
    return std::make_unique<CallAnswerMessage>();
  case MessageType::CALL_HANG:
    return std::make_unique<CallHangMessage>();
  case MessageType::CALL_PACKET:
    return std::make_unique<CallPacketMessage>();
  case MessageType::PING:
    return std::make_unique<PingMessage>();
  case MessageType::PONG:
    return std::make_unique<PongMessage>();
  case MessageType::MESSAGE_TEXT:
    return std::make_unique<TextMessage>();
  case MessageType::OK:
    return std::make_unique<OkMessage>();
  }
  return nullptr;
}

// Message implementations

// HelloMessage
HelloMessage::HelloMessage()
    : version(protocol::PROTOCOL_VERSION), client_id(0) {}

std::vector<uint8_t> HelloMessage::serialize() const {
  MessageSerializer s;
  s.write_int32(version);
  s.write_blob(public_key);
  s.write_blob(receiver);
  s.write_int32(client_id);
  if (address) {
    s.write_blob(*address);
  }
  return s.release();
}

bool HelloMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  version = d.read_int32();
  public_key = d.read_blob(protocol::PUBLIC_KEY_SIZE);
  receiver = d.read_blob(protocol::PUBLIC_KEY_SIZE);
  client_id = d.read_int32();
  address.reset();
  if (!d.has_error() && d.bytes_remaining() > 0) {
    address = d.read_blob(protocol::MAX_ADDRESS_LENGTH);
  }
  return d.finished();
}

// ChallengeMessage
std::vector<uint8_t> ChallengeMessage::serialize() const {
  MessageSerializer s;
  s.write_blob(challenge);
  return s.release();
}

bool ChallengeMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  challenge = d.read_blob(protocol::MAX_FIELD_LENGTH);
  return d.finished();
}

// ChallengeAnswerMessage
std::vector<uint8_t> ChallengeAnswerMessage::serialize() const {
  MessageSerializer s;
  s.write_blob(signature);
  return s.release();
}

bool ChallengeAnswerMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  signature = d.read_blob(protocol::MAX_FIELD_LENGTH);
  return d.finished();
}

// InfoRequestMessage
std::vector<uint8_t> InfoRequestMessage::serialize() const {
  MessageSerializer s;
  s.write_int64(since);
  return s.release();
}

bool InfoRequestMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  since = d.read_int64();
  return d.finished();
}

// InfoResponseMessage
std::vector<uint8_t> InfoResponseMessage::serialize() const {
  MessageSerializer s;
  s.write_int64(time);
  s.write_string(nickname);
  s.write_string(info);
  s.write_blob(avatar);
  return s.release();
}

bool InfoResponseMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  time = d.read_int64();
  nickname = d.read_string(protocol::MAX_NICKNAME_LENGTH);
  info = d.read_string(protocol::MAX_INFO_LENGTH);
  avatar = d.read_blob();
  return d.finished();
}

// TextMessage
TextMessage::TextMessage()
    : guid(0), reply_to(0), send_time(0), edit_time(0),
      content_type(protocol::content::TEXT) {}

std::vector<uint8_t> TextMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(guid);
  s.write_uint64(reply_to);
  s.write_int64(send_time);
  s.write_int64(edit_time);
  s.write_int32(content_type);
  s.write_blob(data);
  return s.release();
}

bool TextMessage::deserialize(const uint8_t *bytes, size_t size) {
  MessageDeserializer d(bytes, size);
  guid = d.read_uint64();
  reply_to = d.read_uint64();
  send_time = d.read_int64();
  edit_time = d.read_int64();
  content_type = d.read_int32();
  data = d.read_blob();
  return d.finished();
}

// OkMessage
std::vector<uint8_t> OkMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(id);
  return s.release();
}

bool OkMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  id = d.read_uint64();
  return d.finished();
}

// CallOfferMessage
CallOfferMessage::CallOfferMessage()
    : mime_type("audio/opus"), sample_rate(48000), channels(1) {}

std::vector<uint8_t> CallOfferMessage::serialize() const {
  MessageSerializer s;
  s.write_string(mime_type);
  s.write_int32(sample_rate);
  s.write_int32(channels);
  return s.release();
}

bool CallOfferMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  mime_type = d.read_string(256);
  sample_rate = d.read_int32();
  channels = d.read_int32();
  return d.finished();
}

// CallAnswerMessage
std::vector<uint8_t> CallAnswerMessage::serialize() const {
  MessageSerializer s;
  s.write_bool(ok);
  return s.release();
}

bool CallAnswerMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  ok = d.read_bool();
  return d.finished();
}

// CallHangMessage
std::vector<uint8_t> CallHangMessage::serialize() const { return {}; }

bool CallHangMessage::deserialize(const uint8_t *data, size_t size) {
  (void)data;
  return size == 0;
}

// CallPacketMessage
std::vector<uint8_t> CallPacketMessage::serialize() const { return frame; }

bool CallPacketMessage::deserialize(const uint8_t *data, size_t size) {
  frame.assign(data, data + size);
  return true;
}

// PingMessage
std::vector<uint8_t> PingMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.release();
}

bool PingMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  nonce = d.read_uint64();
  return d.finished();
}

// PongMessage
std::vector<uint8_t> PongMessage::serialize() const {
  MessageSerializer s;
  s.write_uint64(nonce);
  return s.release();
}

bool PongMessage::deserialize(const uint8_t *data, size_t size) {
  MessageDeserializer d(data, size);
  nonce = d.read_uint64();
  return d.finished();
}

} // namespace message
} // namespace parley
