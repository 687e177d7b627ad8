#include "network/connection_handler.hpp"
#include "network/attachments.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <random>

namespace parley {
namespace network {

using std::chrono::milliseconds;

// Ping jitter: thread_local so concurrent workers never share generator state
static milliseconds random_jitter(milliseconds interval) {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  int64_t bound = interval.count() / 10;
  if (bound <= 0) {
    return milliseconds(0);
  }
  std::uniform_int_distribution<int64_t> dis(0, bound - 1);
  return milliseconds(dis(gen));
}

// Payload reads per tick; a peer trickling bytes cannot hold the tick open
static constexpr int MAX_PAYLOAD_READS_PER_TICK = 64;

static bool is_handshake_type(uint32_t type) {
  using protocol::MessageType;
  switch (static_cast<MessageType>(type)) {
  case MessageType::HELLO:
  case MessageType::CHALLENGE:
  case MessageType::CHALLENGE_ANSWER:
  case MessageType::CHALLENGE2:
  case MessageType::CHALLENGE_ANSWER2:
  case MessageType::OK:
    return true;
  default:
    return false;
  }
}

std::string disconnect_reason_name(DisconnectReason reason) {
  switch (reason) {
  case DisconnectReason::NONE:
    return "none";
  case DisconnectReason::CANCELLED:
    return "cancelled";
  case DisconnectReason::TRANSPORT_CLOSED:
    return "transport closed";
  case DisconnectReason::AUTHENTICATION_FAILED:
    return "authentication failed";
  case DisconnectReason::PROTOCOL_VIOLATION:
    return "protocol violation";
  case DisconnectReason::HANDSHAKE_TIMEOUT:
    return "handshake timeout";
  case DisconnectReason::IDLE_TIMEOUT:
    return "idle timeout";
  case DisconnectReason::PING_TIMEOUT:
    return "ping timeout";
  }
  return "unknown";
}

ConnectionHandler::Config::Config()
    : idle_timeout(protocol::IDLE_TIMEOUT_MS),
      call_idle_timeout(protocol::CALL_IDLE_TIMEOUT_MS),
      ping_interval(protocol::PING_INTERVAL_MS),
      call_ping_interval(protocol::CALL_PING_INTERVAL_MS),
      ping_timeout(protocol::PING_TIMEOUT_MS),
      handshake_timeout(protocol::HANDSHAKE_TIMEOUT_MS),
      read_timeout(protocol::READ_TIMEOUT_MS),
      probe_timeout(protocol::PROBE_TIMEOUT_MS),
      write_timeout(protocol::WRITE_TIMEOUT_MS),
      backoff_after(protocol::BACKOFF_AFTER_MS),
      backoff_sleep(protocol::BACKOFF_SLEEP_MS), client_id(0) {}

ConnectionHandler::ConnectionHandler(
    PrivateTag, std::shared_ptr<const crypto::KeyPair> identity,
    ConnectionPtr connection, bool outbound,
    std::shared_ptr<EventListener> listener, std::shared_ptr<InfoProvider> info,
    std::shared_ptr<calls::AudioFactory> audio, Config config)
    : config_(std::move(config)), outbound_(outbound), identity_(identity),
      connection_(connection), listener_(std::move(listener)),
      info_(std::move(info)),
      stream_(connection, config_.read_timeout, config_.probe_timeout),
      handshake_(identity, outbound, config_.client_id,
                 outbound ? config_.own_address : std::nullopt),
      call_(std::move(audio), config_.call_params,
            calls::CallSignalState::Hooks{
                [this](const message::Message &msg) {
                  return write_message(msg);
                },
                [this](const std::vector<uint8_t> &frame) {
                  return send_data(frame);
                },
                [this](calls::CallStatus status) {
                  listener_->on_call_status_changed(status, peer_or_empty());
                },
                [this]() {
                  listener_->on_incoming_call(peer_or_empty(), false);
                }}),
      state_(handshake_.state()) {
  auto now = util::GetSteadyTime();
  created_time_ = now;
  last_active_time_ = now;
  last_ping_time_ = now;
  last_pong_time_ = now;
  // Until HELLO tells us better, the overlay address of the link
  address_ = util::HexStr(connection_->public_key());
}

ConnectionHandler::~ConnectionHandler() {
  // The worker may hold the last reference; it cannot join itself
  if (worker_.joinable()) {
    if (worker_.get_id() == std::this_thread::get_id()) {
      worker_.detach();
    } else {
      cancel();
      worker_.join();
    }
  }
}

ConnectionHandlerPtr ConnectionHandler::create_outbound(
    std::shared_ptr<const crypto::KeyPair> identity, ConnectionPtr connection,
    const PeerKey &peer, std::shared_ptr<EventListener> listener,
    std::shared_ptr<InfoProvider> info,
    std::shared_ptr<calls::AudioFactory> audio, Config config) {
  auto handler = std::make_shared<ConnectionHandler>(
      PrivateTag{}, std::move(identity), std::move(connection), true,
      std::move(listener), std::move(info), std::move(audio),
      std::move(config));
  handler->set_peer_public_key(peer);
  return handler;
}

ConnectionHandlerPtr ConnectionHandler::create_inbound(
    std::shared_ptr<const crypto::KeyPair> identity, ConnectionPtr connection,
    std::shared_ptr<EventListener> listener, std::shared_ptr<InfoProvider> info,
    std::shared_ptr<calls::AudioFactory> audio, Config config) {
  return std::make_shared<ConnectionHandler>(
      PrivateTag{}, std::move(identity), std::move(connection), false,
      std::move(listener), std::move(info), std::move(audio),
      std::move(config));
}

// ============================================================================
// Lifecycle
// ============================================================================

void ConnectionHandler::start(std::function<void()> on_exit) {
  if (started_.exchange(true)) {
    LOG_NET_WARN("connection handler for {} already started", address());
    return;
  }
  auto self = shared_from_this();
  worker_ = std::thread([self, on_exit = std::move(on_exit)]() {
    self->run();
    if (on_exit) {
      on_exit();
    }
  });
}

void ConnectionHandler::cancel() {
  cancelled_.store(true);
  stream_.interrupt();
  std::lock_guard<std::mutex> lock(sleep_mutex_);
  sleep_cv_.notify_all();
}

void ConnectionHandler::join() {
  std::lock_guard<std::mutex> lock(join_mutex_);
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

void ConnectionHandler::run() {
  LOG_NET_DEBUG("{} session with {} started",
                outbound_ ? "outbound" : "inbound", connection_->remote_address());
  while (tick()) {
    idle_sleep();
  }
  finish();
}

void ConnectionHandler::idle_sleep() {
  if (inbound_header_ ||
      util::GetSteadyTime() - last_active_time_ <= config_.backoff_after) {
    return;
  }
  std::unique_lock<std::mutex> lock(sleep_mutex_);
  sleep_cv_.wait_for(lock, config_.backoff_sleep,
                     [this] { return cancelled_.load(); });
}

bool ConnectionHandler::tick() {
  if (finished_.load()) {
    return false;
  }
  if (cancelled_.load()) {
    set_reason(DisconnectReason::CANCELLED, "cancelled");
    return false;
  }

  try {
    if (!do_state_action()) {
      return false;
    }

    Activity activity = process_one_message();
    if (activity == Activity::FATAL) {
      return false;
    }
    if (activity == Activity::MEANINGFUL) {
      last_active_time_ = util::GetSteadyTime();
    }

    return check_timeouts(util::GetSteadyTime());
  } catch (const StreamClosedError &e) {
    set_reason(cancelled_.load() ? DisconnectReason::CANCELLED
                                 : DisconnectReason::TRANSPORT_CLOSED,
               e.what());
  } catch (const TransportError &e) {
    set_reason(DisconnectReason::TRANSPORT_CLOSED, e.what());
  } catch (const crypto::CryptoError &e) {
    set_reason(DisconnectReason::AUTHENTICATION_FAILED, e.what());
  }
  return false;
}

void ConnectionHandler::finish() {
  if (finished_.exchange(true)) {
    return;
  }
  stream_.interrupt();
  connection_->close();

  if (reason_.load() == DisconnectReason::NONE) {
    set_reason(cancelled_.load() ? DisconnectReason::CANCELLED
                                 : DisconnectReason::TRANSPORT_CLOSED,
               "session ended");
  }

  // Listeners learn about the dropped call before the dropped connection
  call_.shutdown();

  auto peer = peer_public_key();
  LOG_NET_INFO("session with {} ({}) closed: {}",
               peer ? util::HexStr(*peer) : std::string("unknown peer"),
               address(), disconnect_reason_name(reason_.load()));
  if (peer) {
    listener_->on_connection_closed(*peer, address());
  }
}

void ConnectionHandler::set_reason(DisconnectReason reason,
                                   const std::string &detail) {
  DisconnectReason expected = DisconnectReason::NONE;
  if (reason_.compare_exchange_strong(expected, reason)) {
    LOG_NET_DEBUG("ending session with {}: {} ({})", address(),
                  disconnect_reason_name(reason), detail);
  }
}

// ============================================================================
// Application API
// ============================================================================

bool ConnectionHandler::set_peer_public_key(const PeerKey &peer) {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  if (peer_) {
    return false;
  }
  if (!handshake_.set_peer(peer)) {
    return false;
  }
  peer_ = peer;
  return true;
}

std::optional<PeerKey> ConnectionHandler::peer_public_key() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return peer_;
}

PeerKey ConnectionHandler::peer_or_empty() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return peer_ ? *peer_ : PeerKey{};
}

std::string ConnectionHandler::address() const {
  std::lock_guard<std::mutex> lock(identity_mutex_);
  return address_;
}

bool ConnectionHandler::send_message(uint64_t guid, uint64_t reply_to,
                                     int64_t send_time, int64_t edit_time,
                                     int32_t type,
                                     std::vector<uint8_t> payload) {
  if (guid == 0) {
    LOG_NET_WARN("message guid 0 is reserved, not queued");
    return false;
  }
  OutgoingMessage msg;
  msg.guid = guid;
  msg.reply_to = reply_to;
  msg.send_time = send_time;
  msg.edit_time = edit_time;
  msg.content_type = type;
  msg.payload = std::move(payload);
  if (!queue_.enqueue(std::move(msg))) {
    LOG_NET_DEBUG("message {} already submitted, ignoring", guid);
    return false;
  }
  return true;
}

bool ConnectionHandler::send_data(const std::vector<uint8_t> &frame) {
  if (finished_.load() || !is_authenticated()) {
    return false;
  }
  // Frames produced while the call is still being set up or torn down are
  // simply not sent
  if (call_.status() != calls::CallStatus::IN_CALL) {
    return true;
  }
  return write_frame(
      message::build_frame(protocol::MessageType::CALL_PACKET, frame));
}

void ConnectionHandler::loop_data(std::vector<uint8_t> frame) {
  call_.loop_packet(std::move(frame));
}

void ConnectionHandler::start_call() { call_.post_start(); }

void ConnectionHandler::answer_call(bool accept) { call_.post_answer(accept); }

void ConnectionHandler::hangup_call() { call_.post_hangup(); }

void ConnectionHandler::mute_call(bool mute) { call_.post_mute(mute); }

// ============================================================================
// Outbound
// ============================================================================

bool ConnectionHandler::write_frame(const std::vector<uint8_t> &frame) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!connection_->is_alive()) {
    return false;
  }
  if (!connection_->write_with_timeout(frame, config_.write_timeout)) {
    LOG_NET_DEBUG("write of {} bytes to {} failed", frame.size(),
                  connection_->remote_address());
    return false;
  }
  stats_.bytes_sent.fetch_add(frame.size(), std::memory_order_relaxed);
  return true;
}

bool ConnectionHandler::write_message(const message::Message &msg) {
  LOG_NET_TRACE("sending {} to {}",
                protocol::message_type_name(static_cast<uint32_t>(msg.type())),
                connection_->remote_address());
  return write_frame(message::build_frame(msg));
}

bool ConnectionHandler::do_state_action() {
  switch (handshake_.state()) {
  case HandshakeState::CONNECTED_OUT:
    return handle_handshake_step(handshake_.start()) != Activity::FATAL;

  case HandshakeState::AUTH2_DONE: {
    if (!info_requested_) {
      info_requested_ = true;
      message::InfoRequestMessage request;
      request.since = info_ ? info_->get_contact_update_time(peer_or_empty()) : 0;
      if (!write_message(request)) {
        set_reason(DisconnectReason::TRANSPORT_CLOSED, "info request not sent");
        return false;
      }
    }
    if (!send_queued_message()) {
      return false;
    }
    if (!call_.tick()) {
      set_reason(DisconnectReason::TRANSPORT_CLOSED,
                 "call signaling not sent");
      return false;
    }
    return true;
  }

  default:
    return true;
  }
}

bool ConnectionHandler::send_queued_message() {
  auto next = queue_.dequeue_one();
  if (!next) {
    return true;
  }

  message::TextMessage msg;
  msg.guid = next->guid;
  msg.reply_to = next->reply_to;
  msg.send_time = next->send_time;
  msg.edit_time = next->edit_time;
  msg.content_type = next->content_type;

  if (protocol::content::has_attachment(next->content_type)) {
    std::string files_dir = info_ ? info_->get_files_directory() : std::string();
    auto packed = pack_attachment(next->payload, files_dir);
    if (!packed) {
      LOG_NET_WARN("message {} dropped: attachment could not be packed",
                   next->guid);
      listener_->on_message_delivered(peer_or_empty(), next->guid, false);
      return true;
    }
    msg.data = std::move(*packed);
  } else {
    msg.data = std::move(next->payload);
  }

  if (!write_message(msg)) {
    set_reason(DisconnectReason::TRANSPORT_CLOSED, "message write failed");
    return false;
  }
  stats_.messages_sent.fetch_add(1, std::memory_order_relaxed);
  last_active_time_ = util::GetSteadyTime();
  LOG_NET_DEBUG("message {} sent ({} bytes)", msg.guid, msg.data.size());
  return true;
}

// ============================================================================
// Inbound
// ============================================================================

ConnectionHandler::Activity ConnectionHandler::process_one_message() {
  if (!inbound_header_) {
    if (stream_.available() < protocol::MESSAGE_HEADER_SIZE) {
      if (stream_.closed() || !connection_->is_alive()) {
        set_reason(DisconnectReason::TRANSPORT_CLOSED, "peer went away");
        return Activity::FATAL;
      }
      return Activity::NONE;
    }

    auto raw_header = stream_.read_exact(protocol::MESSAGE_HEADER_SIZE);
    protocol::MessageHeader header;
    message::deserialize_header(raw_header.data(), raw_header.size(), header);
    stats_.bytes_received.fetch_add(protocol::MESSAGE_HEADER_SIZE,
                                    std::memory_order_relaxed);

    if (header.length > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
      set_reason(DisconnectReason::PROTOCOL_VIOLATION,
                 "message length " + std::to_string(header.length));
      return Activity::FATAL;
    }

    // An unverified peer gets no more than a handshake message's worth
    if (!is_authenticated()) {
      if (!is_handshake_type(header.type)) {
        set_reason(DisconnectReason::PROTOCOL_VIOLATION,
                   protocol::message_type_name(header.type) +
                       " before authentication");
        return Activity::FATAL;
      }
      if (header.length > protocol::MAX_HANDSHAKE_MESSAGE_LENGTH) {
        set_reason(DisconnectReason::PROTOCOL_VIOLATION,
                   "handshake message length " + std::to_string(header.length));
        return Activity::FATAL;
      }
    }

    inbound_header_ = header;
    inbound_received_ = 0;
    inbound_payload_.clear();
  }

  if (!receive_payload()) {
    if (stream_.closed() || !connection_->is_alive()) {
      set_reason(DisconnectReason::TRANSPORT_CLOSED,
                 "peer went away mid-message");
      return Activity::FATAL;
    }
    return Activity::NONE;
  }

  protocol::MessageHeader header = *inbound_header_;
  std::vector<uint8_t> payload = std::move(inbound_payload_);
  inbound_header_.reset();
  inbound_payload_.clear();
  stats_.bytes_received.fetch_add(header.length, std::memory_order_relaxed);

  if (!protocol::is_known_message_type(header.type)) {
    LOG_NET_DEBUG("skipped {} bytes of unknown message type {}", header.length,
                  header.type);
    return Activity::FAILED;
  }
  return dispatch(header, payload);
}

bool ConnectionHandler::receive_payload() {
  const uint64_t length = inbound_header_->length;
  const bool keep = protocol::is_known_message_type(inbound_header_->type);

  for (int reads = 0;
       reads < MAX_PAYLOAD_READS_PER_TICK && inbound_received_ < length;
       ++reads) {
    size_t want = static_cast<size_t>(std::min<uint64_t>(
        length - inbound_received_, protocol::STREAM_BUFFER_SIZE));
    size_t got = 0;
    if (keep) {
      size_t offset = inbound_payload_.size();
      inbound_payload_.resize(offset + want);
      got = stream_.read_available(inbound_payload_.data() + offset, want);
      inbound_payload_.resize(offset + got);
    } else {
      got = stream_.skip_available(want);
    }
    if (got == 0) {
      break;
    }
    inbound_received_ += got;
  }
  return inbound_received_ == length;
}

ConnectionHandler::Activity
ConnectionHandler::dispatch(const protocol::MessageHeader &header,
                            const std::vector<uint8_t> &payload) {
  using protocol::MessageType;

  const std::string name = protocol::message_type_name(header.type);
  auto msg = message::create_message(header.type);
  if (!msg) {
    return Activity::FAILED;
  }

  MessageType type = header.message_type();
  bool handshake_message = is_handshake_type(header.type);

  if (!msg->deserialize(payload.data(), payload.size())) {
    stats_.malformed_messages.fetch_add(1, std::memory_order_relaxed);
    if (handshake_message) {
      set_reason(DisconnectReason::PROTOCOL_VIOLATION, "malformed " + name);
      return Activity::FATAL;
    }
    LOG_NET_WARN("dropping malformed {} from {}", name, address());
    return Activity::FAILED;
  }

  LOG_NET_TRACE("received {} ({} bytes) from {}", name, payload.size(),
                address());

  switch (type) {
  case MessageType::HELLO:
    return handle_hello(static_cast<const message::HelloMessage &>(*msg));
  case MessageType::CHALLENGE:
  case MessageType::CHALLENGE2:
    return handle_handshake_step(handshake_.on_challenge(
        static_cast<const message::ChallengeMessage &>(*msg)));
  case MessageType::CHALLENGE_ANSWER:
  case MessageType::CHALLENGE_ANSWER2:
    return handle_handshake_step(handshake_.on_answer(
        static_cast<const message::ChallengeAnswerMessage &>(*msg)));
  case MessageType::OK:
    return handle_ok(static_cast<const message::OkMessage &>(*msg));
  case MessageType::MESSAGE_TEXT:
    return handle_text(static_cast<const message::TextMessage &>(*msg));
  case MessageType::INFO_REQUEST:
    return handle_info_request(
        static_cast<const message::InfoRequestMessage &>(*msg));
  case MessageType::INFO_RESPONSE:
    return handle_info_response(
        static_cast<const message::InfoResponseMessage &>(*msg));
  case MessageType::CALL_OFFER:
    call_.on_offer(static_cast<const message::CallOfferMessage &>(*msg));
    return Activity::MEANINGFUL;
  case MessageType::CALL_ANSWER:
    return call_.on_answer(
               static_cast<const message::CallAnswerMessage &>(*msg).ok)
               ? Activity::MEANINGFUL
               : Activity::FAILED;
  case MessageType::CALL_HANG:
    call_.on_hangup();
    return Activity::MEANINGFUL;
  case MessageType::CALL_PACKET:
    call_.on_packet(
        std::move(static_cast<message::CallPacketMessage &>(*msg).frame));
    return Activity::MEANINGFUL;
  case MessageType::PING:
    return handle_ping(static_cast<const message::PingMessage &>(*msg));
  case MessageType::PONG:
    return handle_pong(static_cast<const message::PongMessage &>(*msg));
  }
  return Activity::FAILED;
}

ConnectionHandler::Activity
ConnectionHandler::handle_handshake_step(HandshakeStep step) {
  if (!step.ok) {
    LOG_AUTH_WARN("handshake with {} failed: {}", address(), step.error);
    set_reason(DisconnectReason::AUTHENTICATION_FAILED, step.error);
    return Activity::FATAL;
  }
  if (step.reply && !write_message(*step.reply)) {
    set_reason(DisconnectReason::TRANSPORT_CLOSED, "handshake write failed");
    return Activity::FATAL;
  }
  sync_state();
  if (step.peer_authenticated) {
    apply_announced_address();
    peer_verified_.store(true);
    LOG_AUTH_INFO("peer {} authenticated at {}", util::HexStr(peer_or_empty()),
                  address());
    listener_->on_client_connected(peer_or_empty(), address(),
                                   handshake_.peer_client_id());
  }
  return Activity::MEANINGFUL;
}

ConnectionHandler::Activity
ConnectionHandler::handle_hello(const message::HelloMessage &hello) {
  HandshakeStep step = handshake_.on_hello(hello);
  if (step.ok) {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    peer_ = handshake_.peer();
    // Only trusted once the sender has proven the key it claims
    if (hello.address) {
      announced_address_ = util::HexStr(*hello.address);
    }
  }
  return handle_handshake_step(std::move(step));
}

void ConnectionHandler::apply_announced_address() {
  std::string old_address;
  std::string new_address;
  {
    std::lock_guard<std::mutex> lock(identity_mutex_);
    if (!announced_address_ || *announced_address_ == address_) {
      return;
    }
    old_address = address_;
    new_address = *announced_address_;
    address_ = new_address;
    announced_address_.reset();
  }
  LOG_NET_INFO("peer announced address {} (was {})", new_address, old_address);
  listener_->on_client_ip_changed(old_address, new_address);
}

ConnectionHandler::Activity
ConnectionHandler::handle_ok(const message::OkMessage &ok) {
  if (ok.id == 0) {
    return handle_handshake_step(handshake_.on_ok());
  }
  if (!is_authenticated()) {
    set_reason(DisconnectReason::PROTOCOL_VIOLATION,
               "delivery receipt before authentication");
    return Activity::FATAL;
  }
  if (!queue_.was_submitted(ok.id)) {
    LOG_NET_WARN("receipt for unknown message {} from {}", ok.id, address());
    return Activity::FAILED;
  }
  LOG_NET_DEBUG("message {} delivered", ok.id);
  listener_->on_message_delivered(peer_or_empty(), ok.id, true);
  return Activity::MEANINGFUL;
}

ConnectionHandler::Activity
ConnectionHandler::handle_text(const message::TextMessage &msg) {
  std::vector<uint8_t> data;
  if (protocol::content::has_attachment(msg.content_type)) {
    std::string files_dir = info_ ? info_->get_files_directory() : std::string();
    data = unpack_attachment(msg.content_type, msg.data, files_dir);
  } else {
    data = msg.data;
  }

  stats_.messages_received.fetch_add(1, std::memory_order_relaxed);
  listener_->on_message_received(peer_or_empty(), msg.guid, msg.reply_to,
                                 msg.send_time, msg.edit_time,
                                 msg.content_type, data);

  if (!write_message(message::OkMessage(msg.guid))) {
    set_reason(DisconnectReason::TRANSPORT_CLOSED, "receipt write failed");
    return Activity::FATAL;
  }
  return Activity::MEANINGFUL;
}

ConnectionHandler::Activity
ConnectionHandler::handle_info_request(const message::InfoRequestMessage &req) {
  if (!info_) {
    return Activity::MEANINGFUL;
  }
  auto mine = info_->get_my_info(req.since);
  if (!mine) {
    LOG_NET_DEBUG("profile unchanged since {}, not sending", req.since);
    return Activity::MEANINGFUL;
  }

  message::InfoResponseMessage response;
  response.time = mine->time;
  response.nickname = mine->nickname;
  response.info = mine->info;
  response.avatar = mine->avatar;
  if (!write_message(response)) {
    set_reason(DisconnectReason::TRANSPORT_CLOSED, "info response not sent");
    return Activity::FATAL;
  }
  return Activity::MEANINGFUL;
}

ConnectionHandler::Activity ConnectionHandler::handle_info_response(
    const message::InfoResponseMessage &resp) {
  if (resp.nickname.size() > protocol::MAX_NICKNAME_LENGTH ||
      resp.info.size() > protocol::MAX_INFO_LENGTH) {
    LOG_NET_WARN("oversized profile from {} ignored", address());
    return Activity::FAILED;
  }
  if (info_) {
    ContactInfo contact;
    contact.time = resp.time;
    contact.nickname = resp.nickname;
    contact.info = resp.info;
    contact.avatar = resp.avatar;
    info_->update_contact_info(peer_or_empty(), contact);
  }
  return Activity::MEANINGFUL;
}

ConnectionHandler::Activity
ConnectionHandler::handle_ping(const message::PingMessage &ping) {
  if (!write_message(message::PongMessage(ping.nonce))) {
    set_reason(DisconnectReason::TRANSPORT_CLOSED, "pong write failed");
    return Activity::FATAL;
  }
  return Activity::KEEPALIVE;
}

ConnectionHandler::Activity
ConnectionHandler::handle_pong(const message::PongMessage &pong) {
  if (!ping_nonce_ || *ping_nonce_ != pong.nonce) {
    LOG_NET_DEBUG("unsolicited pong from {}", address());
    return Activity::FAILED;
  }
  ping_nonce_.reset();
  last_pong_time_ = util::GetSteadyTime();
  stats_.ping_time_ms.store(std::chrono::duration_cast<milliseconds>(
      last_pong_time_ - last_ping_time_));
  return Activity::KEEPALIVE;
}

// ============================================================================
// Timers
// ============================================================================

void ConnectionHandler::sync_state() {
  HandshakeState now_state = handshake_.state();
  HandshakeState before = state_.exchange(now_state);
  if (before != HandshakeState::AUTH2_DONE &&
      now_state == HandshakeState::AUTH2_DONE) {
    on_authenticated(util::GetSteadyTime());
  }
}

void ConnectionHandler::on_authenticated(
    std::chrono::steady_clock::time_point now) {
  last_ping_time_ = now;
  last_active_time_ = now;
  LOG_AUTH_INFO("session with {} mutually authenticated",
                util::HexStr(peer_or_empty()));
}

milliseconds ConnectionHandler::current_ping_interval() const {
  return call_.active() ? config_.call_ping_interval : config_.ping_interval;
}

milliseconds ConnectionHandler::current_idle_timeout() const {
  return call_.active() ? config_.call_idle_timeout : config_.idle_timeout;
}

bool ConnectionHandler::check_timeouts(
    std::chrono::steady_clock::time_point now) {
  if (!is_authenticated()) {
    if (now - created_time_ >= config_.handshake_timeout) {
      set_reason(DisconnectReason::HANDSHAKE_TIMEOUT,
                 "still " + handshake_state_name(status()));
      return false;
    }
    return true;
  }

  if (now - last_active_time_ >= current_idle_timeout()) {
    set_reason(DisconnectReason::IDLE_TIMEOUT,
               call_.active() ? "silent during call" : "no traffic");
    return false;
  }

  if (ping_nonce_) {
    if (now - last_ping_time_ >= config_.ping_timeout) {
      set_reason(DisconnectReason::PING_TIMEOUT, "no pong");
      return false;
    }
    return true;
  }

  milliseconds interval = current_ping_interval();
  if (now - last_ping_time_ >= interval - random_jitter(interval)) {
    uint64_t nonce = crypto::RandomUint64();
    if (!write_message(message::PingMessage(nonce))) {
      set_reason(DisconnectReason::TRANSPORT_CLOSED, "ping write failed");
      return false;
    }
    ping_nonce_ = nonce;
    last_ping_time_ = now;
  }
  return true;
}

} // namespace network
} // namespace parley
