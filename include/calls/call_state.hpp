#pragma once

#include "calls/audio.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace parley {
namespace message {
class Message;
class CallOfferMessage;
} // namespace message

namespace calls {

enum class CallStatus {
  IDLE,      // no call
  CALL,      // local start requested, offer not yet sent
  CALLING,   // offer sent, waiting for answer
  RECEIVING, // offer received, waiting for local decision
  ANSWER,    // local accept requested, answer not yet sent
  REJECT,    // local reject requested, answer not yet sent
  IN_CALL,   // audio flowing
  HANGUP,    // call ended (reported to listeners, then IDLE)
};

std::string call_status_name(CallStatus status);

// States that count as "a call is going on" for timeouts and teardown
bool is_call_active(CallStatus status);

/**
 * CallSignalState - per-connection call lifecycle
 *
 * Caller:  IDLE -> CALL -> CALLING -> IN_CALL -> IDLE
 * Callee:  IDLE -> RECEIVING -> ANSWER/REJECT -> IN_CALL/IDLE
 * Either side may hang up from any active state.
 *
 * Application threads only post commands (start/answer/hangup/mute); the
 * connection worker drains them in tick() and is the only thread that
 * changes state, sends signaling or touches the audio pair. Listener
 * notifications go out for CALLING, IN_CALL and HANGUP; an incoming offer
 * is reported separately through Hooks::on_incoming.
 */
class CallSignalState {
public:
  struct Hooks {
    // Write a signaling message to the peer. False if the link is dead.
    std::function<bool(const message::Message &)> send;
    // Sink for encoded audio frames (wraps them into CALL_PACKET)
    PacketSink send_packet;
    std::function<void(CallStatus)> on_status;
    std::function<void()> on_incoming;
  };

  CallSignalState(std::shared_ptr<AudioFactory> audio, CallParams params,
                  Hooks hooks);
  ~CallSignalState();

  CallSignalState(const CallSignalState &) = delete;
  CallSignalState &operator=(const CallSignalState &) = delete;

  // Thread-safe command posting
  void post_start();
  void post_answer(bool accept);
  void post_hangup();
  void post_mute(bool mute);

  // Worker side: apply pending commands, then send whatever the current
  // state owes the peer. Returns false if a send failed.
  bool tick();

  // Worker side: inbound signaling
  void on_offer(const message::CallOfferMessage &offer);
  bool on_answer(bool ok);
  void on_hangup();
  void on_packet(std::vector<uint8_t> frame);

  // Feed a frame to our own receiver (local echo / testing)
  void loop_packet(std::vector<uint8_t> frame);

  // Worker side, on session end: stop audio and report HANGUP if a call
  // was active. Returns whether it was.
  bool shutdown();

  CallStatus status() const { return status_.load(); }
  bool active() const { return is_call_active(status_.load()); }
  bool has_audio() const;
  const CallParams &params() const { return params_; }

private:
  enum class CommandType { START, ANSWER, HANGUP, MUTE };
  struct Command {
    CommandType type;
    bool flag;
  };

  void post(Command cmd);
  bool apply(const Command &cmd);
  void set_status(CallStatus status, bool notify);
  void start_audio();
  void stop_audio();
  void end_call(const char *why);

  std::shared_ptr<AudioFactory> audio_factory_;
  CallParams params_;
  CallParams local_params_;
  Hooks hooks_;

  std::atomic<CallStatus> status_{CallStatus::IDLE};
  bool muted_{false};

  std::mutex commands_mutex_;
  std::deque<Command> commands_;

  // Guards the audio pair (loop_packet may come from another thread)
  mutable std::mutex audio_mutex_;
  std::unique_ptr<AudioSender> sender_;
  std::unique_ptr<AudioReceiver> receiver_;
};

} // namespace calls
} // namespace parley
