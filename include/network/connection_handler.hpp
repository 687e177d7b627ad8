#pragma once

#include "calls/call_state.hpp"
#include "crypto/ed25519.hpp"
#include "network/events.hpp"
#include "network/handshake.hpp"
#include "network/message.hpp"
#include "network/outbound_queue.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include "network/transport_stream.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace parley {
namespace network {

class ConnectionHandler;
using ConnectionHandlerPtr = std::shared_ptr<ConnectionHandler>;

// Why a session ended (logged; listeners only see on_connection_closed)
enum class DisconnectReason {
  NONE,
  CANCELLED,
  TRANSPORT_CLOSED,
  AUTHENTICATION_FAILED,
  PROTOCOL_VIOLATION,
  HANDSHAKE_TIMEOUT,
  IDLE_TIMEOUT,
  PING_TIMEOUT,
};

std::string disconnect_reason_name(DisconnectReason reason);

// Session counters. Atomic: written by the worker, read by anyone.
struct SessionStats {
  std::atomic<uint64_t> messages_sent{0};
  std::atomic<uint64_t> messages_received{0};
  std::atomic<uint64_t> bytes_sent{0};
  std::atomic<uint64_t> bytes_received{0};
  std::atomic<uint64_t> malformed_messages{0};
  std::atomic<std::chrono::milliseconds> ping_time_ms{
      std::chrono::milliseconds{-1}}; // -1 means not measured yet
};

/**
 * ConnectionHandler - one authenticated peer session
 *
 * Owns the connection and runs the dispatch loop on its own thread. Every
 * tick does, in order:
 *
 *   1. the action the handshake state owes (HELLO when dialing; once
 *      authenticated: the one-time INFO_REQUEST, at most one queued user
 *      message, then call signaling)
 *   2. at most one inbound message. The payload is collected from what
 *      has already arrived, over as many ticks as it takes, so a stalled
 *      sender never blocks the timeout checks
 *   3. idle / ping / handshake timeout checks and the periodic ping
 *
 * Between ticks the worker sleeps briefly when the session has been quiet
 * for a while; cancel() wakes it. When the loop ends the connection is
 * closed, any call torn down (listeners see HANGUP first), then the
 * listener gets on_connection_closed exactly once.
 *
 * Application-facing methods are thread-safe. Writes are serialized by a
 * mutex so the audio sender may call send_data() from its own thread.
 */
class ConnectionHandler : public std::enable_shared_from_this<ConnectionHandler> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  struct Config {
    std::chrono::milliseconds idle_timeout;
    std::chrono::milliseconds call_idle_timeout;
    std::chrono::milliseconds ping_interval;
    std::chrono::milliseconds call_ping_interval;
    std::chrono::milliseconds ping_timeout;
    std::chrono::milliseconds handshake_timeout;
    std::chrono::milliseconds read_timeout;
    std::chrono::milliseconds probe_timeout;
    std::chrono::milliseconds write_timeout;
    std::chrono::milliseconds backoff_after;
    std::chrono::milliseconds backoff_sleep;

    int32_t client_id;
    // Overlay address advertised in HELLO (outbound only)
    std::optional<std::vector<uint8_t>> own_address;
    calls::CallParams call_params;

    Config();
  };

  static ConnectionHandlerPtr
  create_outbound(std::shared_ptr<const crypto::KeyPair> identity,
                  ConnectionPtr connection, const PeerKey &peer,
                  std::shared_ptr<EventListener> listener,
                  std::shared_ptr<InfoProvider> info,
                  std::shared_ptr<calls::AudioFactory> audio,
                  Config config = Config());

  static ConnectionHandlerPtr
  create_inbound(std::shared_ptr<const crypto::KeyPair> identity,
                 ConnectionPtr connection,
                 std::shared_ptr<EventListener> listener,
                 std::shared_ptr<InfoProvider> info,
                 std::shared_ptr<calls::AudioFactory> audio,
                 Config config = Config());

  ConnectionHandler(PrivateTag, std::shared_ptr<const crypto::KeyPair> identity,
                    ConnectionPtr connection, bool outbound,
                    std::shared_ptr<EventListener> listener,
                    std::shared_ptr<InfoProvider> info,
                    std::shared_ptr<calls::AudioFactory> audio, Config config);
  ~ConnectionHandler();

  ConnectionHandler(const ConnectionHandler &) = delete;
  ConnectionHandler &operator=(const ConnectionHandler &) = delete;

  // Spawn the worker. on_exit runs on the worker after the session ended.
  // Single use: a second call is ignored.
  void start(std::function<void()> on_exit = nullptr);

  // Ask the worker to stop; returns immediately
  void cancel();

  // Wait for the worker (no-op when called from the worker itself)
  void join();

  // Run the loop on the calling thread until the session ends
  void run();

  // One loop iteration. Returns false once the session must end; the
  // caller then calls finish().
  bool tick();

  // Close everything and notify listeners. Idempotent.
  void finish();

  // Preset the expected peer identity (initiator, before start()). False if
  // already known.
  bool set_peer_public_key(const PeerKey &peer);

  // Queue a user message. Returns false for guid 0 (the handshake OK) or an
  // already submitted guid.
  bool send_message(uint64_t guid, uint64_t reply_to, int64_t send_time,
                    int64_t edit_time, int32_t type,
                    std::vector<uint8_t> payload);

  // Write one audio frame as CALL_PACKET (audio sender thread)
  bool send_data(const std::vector<uint8_t> &frame);

  // Feed one frame straight into our own receiver
  void loop_data(std::vector<uint8_t> frame);

  // Call controls, applied by the worker on its next tick
  void start_call();
  void answer_call(bool accept);
  void hangup_call();
  void mute_call(bool mute);

  HandshakeState status() const { return state_.load(); }
  calls::CallStatus call_status() const { return call_.status(); }
  bool is_authenticated() const { return status() == HandshakeState::AUTH2_DONE; }
  // True from the moment the peer proved its key (on_client_connected)
  bool is_peer_verified() const { return peer_verified_.load(); }
  bool is_finished() const { return finished_.load(); }
  bool is_outbound() const { return outbound_; }
  std::optional<PeerKey> peer_public_key() const;
  std::string address() const;
  DisconnectReason disconnect_reason() const { return reason_.load(); }
  const SessionStats &stats() const { return stats_; }
  size_t pending_messages() const { return queue_.size(); }

private:
  enum class Activity {
    NONE,       // nothing readable yet
    MEANINGFUL, // resets the idle timer
    KEEPALIVE,  // ping/pong
    FAILED,     // dropped, logged
    FATAL,      // ends the session
  };

  bool do_state_action();
  bool send_queued_message();
  Activity process_one_message();
  // Pull what has arrived of the current payload. True once complete.
  bool receive_payload();
  Activity dispatch(const protocol::MessageHeader &header,
                    const std::vector<uint8_t> &payload);
  Activity handle_handshake_step(HandshakeStep step);
  Activity handle_hello(const message::HelloMessage &hello);
  void apply_announced_address();
  Activity handle_ok(const message::OkMessage &ok);
  Activity handle_text(const message::TextMessage &msg);
  Activity handle_info_request(const message::InfoRequestMessage &req);
  Activity handle_info_response(const message::InfoResponseMessage &resp);
  Activity handle_ping(const message::PingMessage &ping);
  Activity handle_pong(const message::PongMessage &pong);
  bool check_timeouts(std::chrono::steady_clock::time_point now);

  bool write_message(const message::Message &msg);
  bool write_frame(const std::vector<uint8_t> &frame);

  void set_reason(DisconnectReason reason, const std::string &detail);
  void sync_state();
  void on_authenticated(std::chrono::steady_clock::time_point now);
  std::chrono::milliseconds current_ping_interval() const;
  std::chrono::milliseconds current_idle_timeout() const;
  PeerKey peer_or_empty() const;
  void idle_sleep();

  const Config config_;
  const bool outbound_;
  std::shared_ptr<const crypto::KeyPair> identity_;
  ConnectionPtr connection_;
  std::shared_ptr<EventListener> listener_;
  std::shared_ptr<InfoProvider> info_;

  TransportStream stream_;
  HandshakeStateMachine handshake_;
  OutboundQueue queue_;
  calls::CallSignalState call_;

  std::atomic<HandshakeState> state_;
  std::atomic<DisconnectReason> reason_{DisconnectReason::NONE};
  SessionStats stats_;

  mutable std::mutex identity_mutex_;
  std::optional<PeerKey> peer_;
  std::string address_;
  // From HELLO; becomes address_ when the peer is verified
  std::optional<std::string> announced_address_;

  std::mutex write_mutex_;

  // Timers (worker only)
  std::chrono::steady_clock::time_point created_time_;
  std::chrono::steady_clock::time_point last_active_time_;
  std::chrono::steady_clock::time_point last_ping_time_;
  std::chrono::steady_clock::time_point last_pong_time_;
  std::optional<uint64_t> ping_nonce_;
  bool info_requested_{false};

  // Message being received, possibly over several ticks (worker only)
  std::optional<protocol::MessageHeader> inbound_header_;
  std::vector<uint8_t> inbound_payload_;
  uint64_t inbound_received_{0};

  std::atomic<bool> peer_verified_{false};
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> finished_{false};
  std::atomic<bool> started_{false};
  std::mutex join_mutex_;
  std::mutex sleep_mutex_;
  std::condition_variable sleep_cv_;
  std::thread worker_;
};

} // namespace network
} // namespace parley
