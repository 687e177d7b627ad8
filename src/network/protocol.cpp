#include "network/protocol.hpp"

namespace parley {
namespace protocol {

MessageHeader::MessageHeader() : stream(0), type(0), length(0) {}

MessageHeader::MessageHeader(MessageType t, uint64_t len, uint32_t s)
    : stream(s), type(static_cast<uint32_t>(t)), length(len) {}

std::string message_type_name(uint32_t type) {
  switch (static_cast<MessageType>(type)) {
  case MessageType::HELLO:
    return "hello";
  case MessageType::CHALLENGE:
    return "challenge";
  case MessageType::CHALLENGE_ANSWER:
    return "challenge_answer";
  case MessageType::CHALLENGE2:
    return "challenge2";
  case MessageType::CHALLENGE_ANSWER2:
    return "challenge_answer2";
  case MessageType::INFO_REQUEST:
    return "info_request";
  case MessageType::INFO_RESPONSE:
    return "info_response";
  case MessageType::CALL_OFFER:
    return "call_offer";
  case MessageType::CALL_ANSWER:
    return "call_answer";
  case MessageType::CALL_HANG:
    return "call_hang";
  case MessageType::CALL_PACKET:
    return "call_packet";
  case MessageType::PING:
    return "ping";
  case MessageType::PONG:
    return "pong";
  case MessageType::MESSAGE_TEXT:
    return "message";
  case MessageType::OK:
    return "ok";
  }
  return "unknown(" + std::to_string(type) + ")";
}

bool is_known_message_type(uint32_t type) {
  return message_type_name(type).rfind("unknown", 0) != 0;
}

} // namespace protocol
} // namespace parley
