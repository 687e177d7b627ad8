#include "network/handshake.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace parley {
namespace network {

std::string handshake_state_name(HandshakeState state) {
  switch (state) {
  case HandshakeState::CREATED:
    return "created";
  case HandshakeState::CONNECTED_IN:
    return "connected_in";
  case HandshakeState::CONNECTED_OUT:
    return "connected_out";
  case HandshakeState::HELLO_SENT:
    return "hello_sent";
  case HandshakeState::CHALLENGE_SENT:
    return "challenge_sent";
  case HandshakeState::CHALLENGE_ANSWERED:
    return "challenge_answered";
  case HandshakeState::AUTH_DONE:
    return "auth_done";
  case HandshakeState::CHALLENGE2_SENT:
    return "challenge2_sent";
  case HandshakeState::CHALLENGE2_ANSWERED:
    return "challenge2_answered";
  case HandshakeState::AUTH2_DONE:
    return "auth2_done";
  }
  return "unknown";
}

HandshakeStateMachine::HandshakeStateMachine(
    std::shared_ptr<const crypto::KeyPair> identity, bool outbound,
    int32_t client_id, std::optional<std::vector<uint8_t>> own_address)
    : identity_(std::move(identity)), client_id_(client_id),
      own_address_(std::move(own_address)),
      state_(outbound ? HandshakeState::CONNECTED_OUT
                      : HandshakeState::CONNECTED_IN) {}

void HandshakeStateMachine::transition(HandshakeState next) {
  LOG_AUTH_DEBUG("handshake {} -> {}", handshake_state_name(state_),
                 handshake_state_name(next));
  state_ = next;
}

bool HandshakeStateMachine::set_peer(const std::vector<uint8_t> &peer) {
  if (peer_) {
    return false;
  }
  peer_ = peer;
  return true;
}

HandshakeStep HandshakeStateMachine::start() {
  if (state_ != HandshakeState::CONNECTED_OUT) {
    return HandshakeStep::Fail("hello from state " +
                               handshake_state_name(state_));
  }
  if (!peer_) {
    return HandshakeStep::Fail("outbound session without peer key");
  }

  auto hello = std::make_unique<message::HelloMessage>();
  hello->public_key = identity_->public_key();
  hello->receiver = *peer_;
  hello->client_id = client_id_;
  hello->address = own_address_;

  HandshakeStep step;
  step.reply = std::move(hello);
  transition(HandshakeState::HELLO_SENT);
  return step;
}

HandshakeStep
HandshakeStateMachine::on_hello(const message::HelloMessage &hello) {
  if ((state_ != HandshakeState::CONNECTED_IN &&
       state_ != HandshakeState::CREATED) ||
      peer_) {
    return HandshakeStep::Fail("unexpected hello in state " +
                               handshake_state_name(state_));
  }
  if (hello.receiver != identity_->public_key()) {
    return HandshakeStep::Fail("hello addressed to " +
                               util::HexStr(hello.receiver));
  }
  if (hello.public_key.size() != protocol::PUBLIC_KEY_SIZE) {
    return HandshakeStep::Fail("hello with malformed sender key");
  }
  if (hello.version != protocol::PROTOCOL_VERSION) {
    LOG_AUTH_WARN("peer speaks protocol version {}, we speak {}",
                  hello.version, protocol::PROTOCOL_VERSION);
  }

  peer_ = hello.public_key;
  peer_client_id_ = hello.client_id;
  our_challenge_ = crypto::RandomBytes(protocol::CHALLENGE_SIZE);

  HandshakeStep step;
  step.reply = std::make_unique<message::ChallengeMessage>(our_challenge_, false);
  transition(HandshakeState::CHALLENGE_SENT);
  return step;
}

HandshakeStep
HandshakeStateMachine::on_challenge(const message::ChallengeMessage &challenge) {
  // CHALLENGE only reaches an initiator that sent HELLO; CHALLENGE2 only an
  // acceptor that already verified the initiator. Signing in any other
  // state would let a peer skip its own proof.
  HandshakeState expected = challenge.second ? HandshakeState::AUTH_DONE
                                             : HandshakeState::HELLO_SENT;
  if (state_ != expected) {
    return HandshakeStep::Fail(protocol::message_type_name(static_cast<uint32_t>(
                                   challenge.type())) +
                               " in state " + handshake_state_name(state_));
  }
  if (challenge.challenge.size() != protocol::CHALLENGE_SIZE) {
    return HandshakeStep::Fail("challenge of " +
                               std::to_string(challenge.challenge.size()) +
                               " bytes");
  }

  HandshakeStep step;
  step.reply = std::make_unique<message::ChallengeAnswerMessage>(
      identity_->Sign(challenge.challenge), challenge.second);
  transition(challenge.second ? HandshakeState::CHALLENGE2_ANSWERED
                              : HandshakeState::CHALLENGE_ANSWERED);
  return step;
}

HandshakeStep
HandshakeStateMachine::on_answer(const message::ChallengeAnswerMessage &answer) {
  HandshakeState expected = answer.second ? HandshakeState::CHALLENGE2_SENT
                                          : HandshakeState::CHALLENGE_SENT;
  if (state_ != expected || !peer_) {
    return HandshakeStep::Fail(protocol::message_type_name(static_cast<uint32_t>(
                                   answer.type())) +
                               " in state " + handshake_state_name(state_));
  }
  if (!crypto::Verify(*peer_, our_challenge_, answer.signature)) {
    return HandshakeStep::Fail("signature verification failed for " +
                               util::HexStr(*peer_));
  }
  our_challenge_.clear();

  HandshakeStep step;
  step.reply = std::make_unique<message::OkMessage>(0);
  step.peer_authenticated = true;
  transition(answer.second ? HandshakeState::AUTH2_DONE
                           : HandshakeState::AUTH_DONE);
  return step;
}

HandshakeStep HandshakeStateMachine::on_ok() {
  HandshakeStep step;
  switch (state_) {
  case HandshakeState::CHALLENGE_ANSWERED:
    our_challenge_ = crypto::RandomBytes(protocol::CHALLENGE_SIZE);
    step.reply =
        std::make_unique<message::ChallengeMessage>(our_challenge_, true);
    transition(HandshakeState::CHALLENGE2_SENT);
    return step;
  case HandshakeState::CHALLENGE2_ANSWERED:
    transition(HandshakeState::AUTH2_DONE);
    return step;
  case HandshakeState::AUTH2_DONE:
    // Stray acknowledgment after the handshake; nothing to do
    return step;
  default:
    return HandshakeStep::Fail("handshake ok in state " +
                               handshake_state_name(state_));
  }
}

} // namespace network
} // namespace parley
