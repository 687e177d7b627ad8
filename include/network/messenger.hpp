#pragma once

#include "calls/audio.hpp"
#include "crypto/ed25519.hpp"
#include "network/connection_handler.hpp"
#include "network/events.hpp"
#include "network/outbound_queue.hpp"
#include "network/transport.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace parley {
namespace network {

/**
 * Messenger - owns every peer session of this node
 *
 * Registry keys are the hex public key of the peer. An inbound session is
 * keyed by its overlay address until the peer has proven its key, then
 * re-keyed. Application-facing calls are routed by public key; messages for
 * a contact that is not connected wait in a pending list that is flushed
 * into the session once it authenticates.
 *
 * All events reach the application listener serialized behind one lock.
 */
class Messenger {
public:
  struct Config {
    int connection_tries;
    std::chrono::milliseconds retry_period; // attempt n waits n * period
    std::chrono::milliseconds accept_timeout;
    ConnectionHandler::Config handler;

    Config();
  };

  Messenger(std::shared_ptr<const crypto::KeyPair> identity,
            std::shared_ptr<Overlay> overlay,
            std::shared_ptr<EventListener> listener,
            std::shared_ptr<InfoProvider> info,
            std::shared_ptr<calls::AudioFactory> audio,
            Config config = Config());
  ~Messenger();

  Messenger(const Messenger &) = delete;
  Messenger &operator=(const Messenger &) = delete;

  // Start the accept loop
  void start();

  // Cancel every session and wait for all workers
  void stop();

  /**
   * Dial a contact in the background, trying each address up to
   * connection_tries times. Returns false if a dial to this contact is
   * already in progress. When the contact is already connected, only
   * flushes its pending messages.
   */
  bool connect_contact(const PeerKey &peer, std::vector<std::string> addresses);

  /**
   * Hand to the contact's session once the contact has proven its key, or
   * hold until then. Returns false for guid 0, which is reserved for the
   * handshake OK, and for a guid the session already saw.
   */
  bool send_message(const PeerKey &peer, uint64_t guid, uint64_t reply_to,
                    int64_t send_time, int64_t edit_time, int32_t type,
                    std::vector<uint8_t> payload);

  // Call controls. False if the contact has no session.
  bool start_call(const PeerKey &peer);
  bool answer_call(const PeerKey &peer, bool accept);
  bool hangup_call(const PeerKey &peer);
  bool mute_call(const PeerKey &peer, bool mute);

  bool is_connected(const PeerKey &peer) const;
  bool is_connecting(const PeerKey &peer) const;
  std::vector<PeerKey> connected_peers() const;
  size_t session_count() const { return handlers_.Size(); }
  size_t pending_count(const PeerKey &peer) const;

  // Session for a contact (tests, diagnostics)
  ConnectionHandlerPtr session(const PeerKey &peer) const;

private:
  // Handler-facing listener: keeps the registry current, then forwards
  class Events;
  friend class Events;

  void accept_loop();
  void dial(PeerKey peer, std::vector<std::string> addresses);
  void launch(const std::string &key, ConnectionHandlerPtr handler);
  void on_session_exit(const ConnectionHandlerPtr &handler);
  void flush_pending(const PeerKey &peer);
  void fail_pending(const PeerKey &peer);
  bool interruptible_sleep(std::chrono::milliseconds duration);

  void handle_connected(const PeerKey &peer, const std::string &address);
  void handle_address_changed(const std::string &old_address,
                              const std::string &new_address);

  const Config config_;
  std::shared_ptr<const crypto::KeyPair> identity_;
  std::shared_ptr<Overlay> overlay_;
  std::shared_ptr<EventListener> listener_; // serialized application listener
  std::shared_ptr<Events> events_;
  std::shared_ptr<InfoProvider> info_;
  std::shared_ptr<calls::AudioFactory> audio_;

  util::ThreadSafeMap<std::string, ConnectionHandlerPtr> handlers_;

  // Sessions displaced by a newer one for the same peer; still running
  std::mutex retired_mutex_;
  std::vector<ConnectionHandlerPtr> retired_;

  mutable std::mutex pending_mutex_;
  std::map<std::string, std::vector<OutgoingMessage>> pending_;

  mutable std::mutex connecting_mutex_;
  std::set<std::string> connecting_;

  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::thread accept_thread_;
  std::mutex dialers_mutex_;
  std::vector<std::thread> dialers_;

  // Workers whose on_exit has not finished yet
  std::mutex workers_mutex_;
  std::condition_variable workers_cv_;
  size_t live_workers_{0};
};

} // namespace network
} // namespace parley
