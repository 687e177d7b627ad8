#include "network/messenger.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>

namespace parley {
namespace network {

class Messenger::Events : public EventListener {
public:
  explicit Events(Messenger &owner) : owner_(owner) {}

  void on_client_connected(const PeerKey &peer, const std::string &address,
                           int32_t client_id) override {
    owner_.handle_connected(peer, address);
    owner_.listener_->on_client_connected(peer, address, client_id);
    owner_.flush_pending(peer);
  }

  void on_client_ip_changed(const std::string &old_address,
                            const std::string &new_address) override {
    owner_.handle_address_changed(old_address, new_address);
    owner_.listener_->on_client_ip_changed(old_address, new_address);
  }

  void on_message_received(const PeerKey &peer, uint64_t guid,
                           uint64_t reply_to, int64_t send_time,
                           int64_t edit_time, int32_t type,
                           const std::vector<uint8_t> &payload) override {
    owner_.listener_->on_message_received(peer, guid, reply_to, send_time,
                                          edit_time, type, payload);
  }

  void on_message_delivered(const PeerKey &peer, uint64_t guid,
                            bool delivered) override {
    owner_.listener_->on_message_delivered(peer, guid, delivered);
  }

  // Registry cleanup happens in on_session_exit, which knows the handler
  void on_connection_closed(const PeerKey &peer,
                            const std::string &address) override {
    owner_.listener_->on_connection_closed(peer, address);
  }

  void on_incoming_call(const PeerKey &peer, bool video) override {
    owner_.listener_->on_incoming_call(peer, video);
  }

  void on_call_status_changed(calls::CallStatus status,
                              const PeerKey &peer) override {
    owner_.listener_->on_call_status_changed(status, peer);
  }

private:
  Messenger &owner_;
};

Messenger::Config::Config()
    : connection_tries(protocol::CONNECTION_TRIES),
      retry_period(protocol::CONNECTION_RETRY_PERIOD_MS),
      accept_timeout(1000) {}

Messenger::Messenger(std::shared_ptr<const crypto::KeyPair> identity,
                     std::shared_ptr<Overlay> overlay,
                     std::shared_ptr<EventListener> listener,
                     std::shared_ptr<InfoProvider> info,
                     std::shared_ptr<calls::AudioFactory> audio, Config config)
    : config_(std::move(config)), identity_(std::move(identity)),
      overlay_(std::move(overlay)),
      listener_(std::make_shared<SerializedEventListener>(std::move(listener))),
      events_(std::make_shared<Events>(*this)), info_(std::move(info)),
      audio_(std::move(audio)) {}

Messenger::~Messenger() { stop(); }

void Messenger::start() {
  if (running_.exchange(true)) {
    return;
  }
  accept_thread_ = std::thread([this]() { accept_loop(); });
  LOG_NET_INFO("messenger started, identity {}",
               util::HexStr(identity_->public_key()));
}

void Messenger::stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (!running_.exchange(false) && !accept_thread_.joinable()) {
      return;
    }
  }
  stop_cv_.notify_all();
  LOG_NET_INFO("messenger stopping");

  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  std::vector<std::thread> dialers;
  {
    std::lock_guard<std::mutex> lock(dialers_mutex_);
    dialers.swap(dialers_);
  }
  for (auto &t : dialers) {
    if (t.joinable()) {
      t.join();
    }
  }

  // No new sessions can appear now; end the existing ones
  for (const auto &[key, handler] : handlers_.GetAll()) {
    handler->cancel();
  }
  {
    std::lock_guard<std::mutex> lock(retired_mutex_);
    for (const auto &handler : retired_) {
      handler->cancel();
    }
  }

  {
    std::unique_lock<std::mutex> lock(workers_mutex_);
    workers_cv_.wait(lock, [this] { return live_workers_ == 0; });
  }

  handlers_.Clear();
  {
    std::lock_guard<std::mutex> lock(retired_mutex_);
    retired_.clear();
  }
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.clear();
  }
  {
    std::lock_guard<std::mutex> lock(connecting_mutex_);
    connecting_.clear();
  }
}

bool Messenger::interruptible_sleep(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, duration, [this] { return !running_.load(); });
}

// ============================================================================
// Sessions
// ============================================================================

void Messenger::accept_loop() {
  while (running_.load()) {
    ConnectionPtr conn = overlay_->accept(config_.accept_timeout);
    if (!conn) {
      continue;
    }
    if (!running_.load()) {
      conn->close();
      break;
    }

    auto handler = ConnectionHandler::create_inbound(
        identity_, conn, events_, info_, audio_, config_.handler);
    LOG_NET_DEBUG("inbound session from {}", conn->remote_address());
    launch(handler->address(), handler);
  }
}

void Messenger::launch(const std::string &key, ConnectionHandlerPtr handler) {
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    ++live_workers_;
  }
  if (auto displaced = handlers_.Take(key)) {
    LOG_NET_DEBUG("session {} replaces an older one", key);
    (*displaced)->cancel();
    std::lock_guard<std::mutex> lock(retired_mutex_);
    retired_.push_back(*displaced);
  }
  handlers_.Insert(key, handler);

  std::weak_ptr<ConnectionHandler> weak = handler;
  handler->start([this, weak]() {
    if (auto self = weak.lock()) {
      on_session_exit(self);
    }
    std::lock_guard<std::mutex> lock(workers_mutex_);
    --live_workers_;
    workers_cv_.notify_all();
  });
}

void Messenger::on_session_exit(const ConnectionHandlerPtr &handler) {
  // The handler may have been re-keyed; remove it wherever it ended up
  for (const auto &[key, value] : handlers_.GetAll()) {
    if (value == handler) {
      handlers_.EraseIf(key, handler);
    }
  }
  std::lock_guard<std::mutex> lock(retired_mutex_);
  retired_.erase(std::remove(retired_.begin(), retired_.end(), handler),
                 retired_.end());
}

void Messenger::handle_connected(const PeerKey &peer,
                                 const std::string &address) {
  std::string key = util::HexStr(peer);

  // Inbound sessions are keyed by address until their peer is verified. Find
  // the one that just proved this key; a session merely claiming it does not
  // count.
  ConnectionHandlerPtr current;
  for (const auto &[k, handler] : handlers_.GetAll()) {
    if (k != key && handler->is_peer_verified() &&
        handler->peer_public_key() == peer && handlers_.EraseIf(k, handler)) {
      current = handler;
      break;
    }
  }

  if (current) {
    if (auto displaced = handlers_.Take(key)) {
      if (*displaced != current) {
        LOG_NET_INFO("peer {} reconnected from {}, dropping previous session",
                     key, address);
        (*displaced)->cancel();
        std::lock_guard<std::mutex> lock(retired_mutex_);
        retired_.push_back(*displaced);
      }
    }
    handlers_.Insert(key, current);
  }

  std::lock_guard<std::mutex> lock(connecting_mutex_);
  connecting_.erase(key);
}

void Messenger::handle_address_changed(const std::string &old_address,
                                       const std::string &new_address) {
  if (!handlers_.Rekey(old_address, new_address)) {
    LOG_NET_DEBUG("session {} keeps its key, {} is taken", old_address,
                  new_address);
  }
}

// ============================================================================
// Dialing
// ============================================================================

bool Messenger::connect_contact(const PeerKey &peer,
                                std::vector<std::string> addresses) {
  std::string key = util::HexStr(peer);
  if (handlers_.Contains(key)) {
    flush_pending(peer);
    return true;
  }
  {
    std::lock_guard<std::mutex> lock(connecting_mutex_);
    if (!connecting_.insert(key).second) {
      LOG_NET_DEBUG("already connecting to {}", key);
      return false;
    }
  }

  std::lock_guard<std::mutex> lock(dialers_mutex_);
  dialers_.emplace_back(
      [this, peer, addresses = std::move(addresses)]() mutable {
        dial(std::move(peer), std::move(addresses));
      });
  return true;
}

void Messenger::dial(PeerKey peer, std::vector<std::string> addresses) {
  std::string key = util::HexStr(peer);

  // Keep the given order, drop repeats
  std::vector<std::string> unique;
  for (auto &a : addresses) {
    if (std::find(unique.begin(), unique.end(), a) == unique.end()) {
      unique.push_back(std::move(a));
    }
  }

  LOG_NET_INFO("connecting to {} via {} address(es)", key, unique.size());
  for (const auto &address : unique) {
    for (int attempt = 1; attempt <= config_.connection_tries; ++attempt) {
      if (!running_.load()) {
        return;
      }
      LOG_NET_DEBUG("connection attempt {} to {} at {}", attempt, key, address);
      ConnectionPtr conn = overlay_->connect(address);
      if (conn) {
        if (!running_.load()) {
          conn->close();
          return;
        }
        ConnectionHandler::Config handler_config = config_.handler;
        auto own = overlay_->local_address();
        if (!own.empty()) {
          handler_config.own_address = own;
        }
        auto handler = ConnectionHandler::create_outbound(
            identity_, conn, peer, events_, info_, audio_, handler_config);
        launch(key, handler);
        std::lock_guard<std::mutex> lock(connecting_mutex_);
        connecting_.erase(key);
        return;
      }
      if (!interruptible_sleep(config_.retry_period * attempt)) {
        return;
      }
    }
    LOG_NET_WARN("cannot connect to {} at {}", key, address);
  }

  LOG_NET_WARN("giving up on {}", key);
  {
    std::lock_guard<std::mutex> lock(connecting_mutex_);
    connecting_.erase(key);
  }
  fail_pending(peer);
}

// ============================================================================
// Routing
// ============================================================================

bool Messenger::send_message(const PeerKey &peer, uint64_t guid,
                             uint64_t reply_to, int64_t send_time,
                             int64_t edit_time, int32_t type,
                             std::vector<uint8_t> payload) {
  if (guid == 0) {
    LOG_NET_WARN("message guid 0 is reserved, not sending");
    return false;
  }
  std::string key = util::HexStr(peer);

  // Held under pending_mutex_ so a session verified meanwhile still flushes
  // what we park here
  std::lock_guard<std::mutex> lock(pending_mutex_);
  auto handler = handlers_.Get(key);
  if (handler && !(*handler)->is_finished() &&
      (*handler)->is_peer_verified() &&
      (*handler)->peer_public_key() == peer) {
    return (*handler)->send_message(guid, reply_to, send_time, edit_time, type,
                                    std::move(payload));
  }

  OutgoingMessage msg;
  msg.guid = guid;
  msg.reply_to = reply_to;
  msg.send_time = send_time;
  msg.edit_time = edit_time;
  msg.content_type = type;
  msg.payload = std::move(payload);

  auto &list = pending_[key];
  for (const auto &queued : list) {
    if (queued.guid == guid) {
      return false;
    }
  }
  list.push_back(std::move(msg));
  LOG_NET_DEBUG("message {} held until {} connects", guid, key);
  return true;
}

void Messenger::flush_pending(const PeerKey &peer) {
  std::string key = util::HexStr(peer);
  std::lock_guard<std::mutex> lock(pending_mutex_);
  auto it = pending_.find(key);
  if (it == pending_.end()) {
    return;
  }

  // Until the peer is verified the messages stay here; on_client_connected
  // flushes again
  auto handler = handlers_.Get(key);
  if (!handler || !(*handler)->is_peer_verified() ||
      (*handler)->peer_public_key() != peer) {
    return;
  }

  std::vector<OutgoingMessage> list = std::move(it->second);
  pending_.erase(it);
  LOG_NET_DEBUG("flushing {} pending message(s) to {}", list.size(), key);
  for (auto &msg : list) {
    (*handler)->send_message(msg.guid, msg.reply_to, msg.send_time,
                             msg.edit_time, msg.content_type,
                             std::move(msg.payload));
  }
}

void Messenger::fail_pending(const PeerKey &peer) {
  std::vector<OutgoingMessage> list;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(util::HexStr(peer));
    if (it == pending_.end()) {
      return;
    }
    list = std::move(it->second);
    pending_.erase(it);
  }
  for (const auto &msg : list) {
    listener_->on_message_delivered(peer, msg.guid, false);
  }
}

ConnectionHandlerPtr Messenger::session(const PeerKey &peer) const {
  auto handler = handlers_.Get(util::HexStr(peer));
  return handler ? *handler : nullptr;
}

bool Messenger::start_call(const PeerKey &peer) {
  return handlers_.Read(util::HexStr(peer),
                        [](const ConnectionHandlerPtr &h) { h->start_call(); });
}

bool Messenger::answer_call(const PeerKey &peer, bool accept) {
  return handlers_.Read(util::HexStr(peer), [accept](const ConnectionHandlerPtr &h) {
    h->answer_call(accept);
  });
}

bool Messenger::hangup_call(const PeerKey &peer) {
  return handlers_.Read(util::HexStr(peer),
                        [](const ConnectionHandlerPtr &h) { h->hangup_call(); });
}

bool Messenger::mute_call(const PeerKey &peer, bool mute) {
  return handlers_.Read(util::HexStr(peer), [mute](const ConnectionHandlerPtr &h) {
    h->mute_call(mute);
  });
}

bool Messenger::is_connected(const PeerKey &peer) const {
  auto handler = handlers_.Get(util::HexStr(peer));
  return handler && (*handler)->is_authenticated();
}

bool Messenger::is_connecting(const PeerKey &peer) const {
  std::lock_guard<std::mutex> lock(connecting_mutex_);
  return connecting_.count(util::HexStr(peer)) > 0;
}

std::vector<PeerKey> Messenger::connected_peers() const {
  std::vector<PeerKey> peers;
  for (const auto &[key, handler] : handlers_.GetAll()) {
    if (handler->is_authenticated()) {
      if (auto peer = handler->peer_public_key()) {
        peers.push_back(*peer);
      }
    }
  }
  return peers;
}

size_t Messenger::pending_count(const PeerKey &peer) const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  auto it = pending_.find(util::HexStr(peer));
  return it == pending_.end() ? 0 : it->second.size();
}

} // namespace network
} // namespace parley
