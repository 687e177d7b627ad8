#pragma once

#include "network/events.hpp"
#include "util/string_parsing.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace parley {
namespace test {

/**
 * RecordingListener - keeps every event for later assertions
 *
 * events() gives the callbacks in arrival order as short strings
 * ("connected", "closed", "call:hangup", ...) for ordering checks.
 */
class RecordingListener : public network::EventListener {
public:
  struct Connected {
    network::PeerKey peer;
    std::string address;
    int32_t client_id;
  };
  struct Received {
    network::PeerKey peer;
    uint64_t guid;
    uint64_t reply_to;
    int64_t send_time;
    int64_t edit_time;
    int32_t type;
    std::vector<uint8_t> payload;
  };
  struct Delivered {
    network::PeerKey peer;
    uint64_t guid;
    bool delivered;
  };

  void on_client_connected(const network::PeerKey &peer,
                           const std::string &address,
                           int32_t client_id) override {
    record("connected", [&] { connected.push_back({peer, address, client_id}); });
  }

  void on_client_ip_changed(const std::string &old_address,
                            const std::string &new_address) override {
    record("ip_changed",
           [&] { ip_changes.emplace_back(old_address, new_address); });
  }

  void on_message_received(const network::PeerKey &peer, uint64_t guid,
                           uint64_t reply_to, int64_t send_time,
                           int64_t edit_time, int32_t type,
                           const std::vector<uint8_t> &payload) override {
    record("received", [&] {
      received.push_back(
          {peer, guid, reply_to, send_time, edit_time, type, payload});
    });
  }

  void on_message_delivered(const network::PeerKey &peer, uint64_t guid,
                            bool delivered_flag) override {
    record(delivered_flag ? "delivered" : "undelivered",
           [&] { delivered.push_back({peer, guid, delivered_flag}); });
  }

  void on_connection_closed(const network::PeerKey &peer,
                            const std::string &address) override {
    record("closed", [&] { closed.emplace_back(peer, address); });
  }

  void on_incoming_call(const network::PeerKey &peer, bool video) override {
    record("incoming_call", [&] { incoming_calls.push_back(peer); });
  }

  void on_call_status_changed(calls::CallStatus status,
                              const network::PeerKey &peer) override {
    record("call:" + calls::call_status_name(status),
           [&] { call_statuses.push_back(status); });
  }

  // Snapshot accessors (thread-safe)
  std::vector<std::string> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  size_t count(const std::string &event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto &e : events_) {
      if (e == event) {
        n++;
      }
    }
    return n;
  }

  // Run fn with the listener locked (read the public vectors safely)
  template <typename Fn> auto locked(Fn fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fn();
  }

  // Wait until event was seen at least n times
  bool wait_for(const std::string &event, size_t n = 1,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
      size_t seen = 0;
      for (const auto &e : events_) {
        if (e == event) {
          seen++;
        }
      }
      return seen >= n;
    });
  }

  std::vector<Connected> connected;
  std::vector<std::pair<std::string, std::string>> ip_changes;
  std::vector<Received> received;
  std::vector<Delivered> delivered;
  std::vector<std::pair<network::PeerKey, std::string>> closed;
  std::vector<network::PeerKey> incoming_calls;
  std::vector<calls::CallStatus> call_statuses;

private:
  template <typename Fn> void record(const std::string &name, Fn fn) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      fn();
      events_.push_back(name);
    }
    cv_.notify_all();
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> events_;
};

/**
 * MemoryInfoProvider - InfoProvider over plain maps
 */
class MemoryInfoProvider : public network::InfoProvider {
public:
  explicit MemoryInfoProvider(std::string files_dir = "")
      : files_dir_(std::move(files_dir)) {}

  std::string get_files_directory() override { return files_dir_; }

  int64_t get_contact_update_time(const network::PeerKey &peer) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = updated_.find(util::HexStr(peer));
    return it == updated_.end() ? 0 : it->second;
  }

  std::optional<network::ContactInfo> get_my_info(int64_t since) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!mine_ || mine_->time <= since) {
      return std::nullopt;
    }
    return mine_;
  }

  void update_contact_info(const network::PeerKey &peer,
                           const network::ContactInfo &info) override {
    std::lock_guard<std::mutex> lock(mutex_);
    contacts_[util::HexStr(peer)] = info;
    updated_[util::HexStr(peer)] = info.time;
  }

  void set_my_info(network::ContactInfo info) {
    std::lock_guard<std::mutex> lock(mutex_);
    mine_ = std::move(info);
  }

  void set_update_time(const network::PeerKey &peer, int64_t time) {
    std::lock_guard<std::mutex> lock(mutex_);
    updated_[util::HexStr(peer)] = time;
  }

  std::optional<network::ContactInfo> contact(const network::PeerKey &peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contacts_.find(util::HexStr(peer));
    if (it == contacts_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

private:
  std::mutex mutex_;
  std::string files_dir_;
  std::optional<network::ContactInfo> mine_;
  std::map<std::string, network::ContactInfo> contacts_;
  std::map<std::string, int64_t> updated_;
};

} // namespace test
} // namespace parley
