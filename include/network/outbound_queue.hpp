#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

namespace parley {
namespace network {

// A user message waiting to be written to the peer
struct OutgoingMessage {
  uint64_t guid{0};
  uint64_t reply_to{0};
  int64_t send_time{0};
  int64_t edit_time{0};
  int32_t content_type{0};
  std::vector<uint8_t> payload;
};

/**
 * OutboundQueue - ordered, deduplicated buffer of pending user messages
 *
 * Producers are application threads; the single consumer is the
 * connection's worker. A guid is accepted at most once for the lifetime of
 * the queue, so retrying a submission never produces a second copy on the
 * wire, even after the first one was already sent.
 */
class OutboundQueue {
public:
  OutboundQueue() = default;

  OutboundQueue(const OutboundQueue &) = delete;
  OutboundQueue &operator=(const OutboundQueue &) = delete;

  // Append unless the guid was seen before. Returns true if queued.
  bool enqueue(OutgoingMessage msg);

  // Pop the oldest message, if any
  std::optional<OutgoingMessage> dequeue_one();

  // Whether this guid was ever accepted by enqueue()
  bool was_submitted(uint64_t guid) const;

  size_t size() const;
  bool empty() const;

private:
  mutable std::mutex mutex_;
  std::deque<OutgoingMessage> queue_;
  std::unordered_set<uint64_t> guids_;
};

} // namespace network
} // namespace parley
