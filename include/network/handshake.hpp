#pragma once

#include "crypto/ed25519.hpp"
#include "network/message.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley {
namespace network {

enum class HandshakeState {
  CREATED,
  CONNECTED_IN,        // accepted, waiting for HELLO
  CONNECTED_OUT,       // dialed, HELLO not yet sent
  HELLO_SENT,
  CHALLENGE_SENT,      // we challenged the initiator
  CHALLENGE_ANSWERED,  // we answered the first challenge
  AUTH_DONE,           // initiator proved its key to us
  CHALLENGE2_SENT,     // we challenged the acceptor back
  CHALLENGE2_ANSWERED, // we answered the reverse challenge
  AUTH2_DONE,          // both directions verified
};

std::string handshake_state_name(HandshakeState state);

// What the handler must do after feeding a message to the state machine
struct HandshakeStep {
  bool ok{true};                             // false: abort the session
  std::string error;                         // reason when !ok
  std::unique_ptr<message::Message> reply;   // send this, if set
  bool peer_authenticated{false};            // notify on_client_connected

  static HandshakeStep Fail(std::string why) {
    HandshakeStep step;
    step.ok = false;
    step.error = std::move(why);
    return step;
  }
};

/**
 * HandshakeStateMachine - mutual challenge-response authentication
 *
 *   initiator (A)                 acceptor (B)
 *   HELLO(pkA, pkB)          -->
 *                            <--  CHALLENGE(cB)
 *   CHALLENGE_ANSWER(sig cB) -->  verify, AUTH_DONE
 *                            <--  OK(0)
 *   CHALLENGE2(cA)           -->
 *                            <--  CHALLENGE_ANSWER2(sig cA)
 *   verify, AUTH2_DONE
 *   OK(0)                    -->  AUTH2_DONE
 *
 * No I/O: every input returns a HandshakeStep telling the caller what to
 * send and whether to continue. Verification failures and messages that
 * arrive in a state with no transition for them are fatal.
 */
class HandshakeStateMachine {
public:
  HandshakeStateMachine(std::shared_ptr<const crypto::KeyPair> identity,
                        bool outbound, int32_t client_id,
                        std::optional<std::vector<uint8_t>> own_address =
                            std::nullopt);

  HandshakeState state() const { return state_; }
  bool authenticated() const { return state_ == HandshakeState::AUTH2_DONE; }

  // Initiator only, before start(). False if a peer is already set.
  bool set_peer(const std::vector<uint8_t> &peer);
  const std::optional<std::vector<uint8_t>> &peer() const { return peer_; }

  // CONNECTED_OUT -> HELLO_SENT. Fails if no peer key was set.
  HandshakeStep start();

  HandshakeStep on_hello(const message::HelloMessage &hello);
  HandshakeStep on_challenge(const message::ChallengeMessage &challenge);
  HandshakeStep on_answer(const message::ChallengeAnswerMessage &answer);
  HandshakeStep on_ok();

  // Client id the peer announced in HELLO
  int32_t peer_client_id() const { return peer_client_id_; }

private:
  void transition(HandshakeState next);

  std::shared_ptr<const crypto::KeyPair> identity_;
  int32_t client_id_;
  std::optional<std::vector<uint8_t>> own_address_;
  HandshakeState state_;
  std::optional<std::vector<uint8_t>> peer_;
  std::vector<uint8_t> our_challenge_;
  int32_t peer_client_id_{0};
};

} // namespace network
} // namespace parley
