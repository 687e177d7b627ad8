#pragma once

#include "calls/call_state.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace parley {
namespace network {

// Raw Ed25519 public key of a peer
using PeerKey = std::vector<uint8_t>;

// A contact's profile as exchanged by INFO_RESPONSE
struct ContactInfo {
  int64_t time{0}; // last change, unix millis
  std::string nickname;
  std::string info;
  std::vector<uint8_t> avatar; // empty = no avatar
};

// Business-level notifications from connection handlers.
// Implementations may be shared by many handlers; wrap them in
// SerializedEventListener unless they do their own locking.
class EventListener {
public:
  virtual ~EventListener() = default;

  virtual void on_client_connected(const PeerKey &peer,
                                   const std::string &address,
                                   int32_t client_id) = 0;
  virtual void on_client_ip_changed(const std::string &old_address,
                                    const std::string &new_address) = 0;
  virtual void on_message_received(const PeerKey &peer, uint64_t guid,
                                   uint64_t reply_to, int64_t send_time,
                                   int64_t edit_time, int32_t type,
                                   const std::vector<uint8_t> &payload) = 0;
  virtual void on_message_delivered(const PeerKey &peer, uint64_t guid,
                                    bool delivered) = 0;
  virtual void on_connection_closed(const PeerKey &peer,
                                    const std::string &address) = 0;
  virtual void on_incoming_call(const PeerKey &peer, bool video) = 0;
  virtual void on_call_status_changed(calls::CallStatus status,
                                      const PeerKey &peer) = 0;
};

// Local identity metadata and contact storage
class InfoProvider {
public:
  virtual ~InfoProvider() = default;

  // Directory for received attachments
  virtual std::string get_files_directory() = 0;

  // When we last stored this contact's profile (0 = never)
  virtual int64_t get_contact_update_time(const PeerKey &peer) = 0;

  // Our profile, if it changed after since
  virtual std::optional<ContactInfo> get_my_info(int64_t since) = 0;

  virtual void update_contact_info(const PeerKey &peer,
                                   const ContactInfo &info) = 0;
};

/**
 * Forwards every callback to an inner listener under one mutex, so
 * listener code never runs concurrently for two connections.
 */
class SerializedEventListener : public EventListener {
public:
  explicit SerializedEventListener(std::shared_ptr<EventListener> inner)
      : inner_(std::move(inner)) {}

  void on_client_connected(const PeerKey &peer, const std::string &address,
                           int32_t client_id) override;
  void on_client_ip_changed(const std::string &old_address,
                            const std::string &new_address) override;
  void on_message_received(const PeerKey &peer, uint64_t guid,
                           uint64_t reply_to, int64_t send_time,
                           int64_t edit_time, int32_t type,
                           const std::vector<uint8_t> &payload) override;
  void on_message_delivered(const PeerKey &peer, uint64_t guid,
                            bool delivered) override;
  void on_connection_closed(const PeerKey &peer,
                            const std::string &address) override;
  void on_incoming_call(const PeerKey &peer, bool video) override;
  void on_call_status_changed(calls::CallStatus status,
                              const PeerKey &peer) override;

private:
  std::recursive_mutex mutex_;
  std::shared_ptr<EventListener> inner_;
};

} // namespace network
} // namespace parley
