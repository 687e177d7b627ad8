#include "network/events.hpp"

namespace parley {
namespace network {

// Recursive: a listener may legitimately call back into handler APIs that
// end up notifying again on the same thread (e.g. hangup from
// on_incoming_call).

void SerializedEventListener::on_client_connected(const PeerKey &peer,
                                                  const std::string &address,
                                                  int32_t client_id) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  inner_->on_client_connected(peer, address, client_id);
}

void SerializedEventListener::on_client_ip_changed(
    const std::string &old_address, const std::string &new_address) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  inner_->on_client_ip_changed(old_address, new_address);
}

void SerializedEventListener::on_message_received(
    const PeerKey &peer, uint64_t guid, uint64_t reply_to, int64_t send_time,
    int64_t edit_time, int32_t type, const std::vector<uint8_t> &payload) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  inner_->on_message_received(peer, guid, reply_to, send_time, edit_time, type,
                              payload);
}

void SerializedEventListener::on_message_delivered(const PeerKey &peer,
                                                   uint64_t guid,
                                                   bool delivered) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  inner_->on_message_delivered(peer, guid, delivered);
}

void SerializedEventListener::on_connection_closed(const PeerKey &peer,
                                                   const std::string &address) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  inner_->on_connection_closed(peer, address);
}

void SerializedEventListener::on_incoming_call(const PeerKey &peer,
                                               bool video) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  inner_->on_incoming_call(peer, video);
}

void SerializedEventListener::on_call_status_changed(calls::CallStatus status,
                                                     const PeerKey &peer) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  inner_->on_call_status_changed(status, peer);
}

} // namespace network
} // namespace parley
