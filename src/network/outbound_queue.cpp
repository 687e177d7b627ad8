#include "network/outbound_queue.hpp"

namespace parley {
namespace network {

bool OutboundQueue::enqueue(OutgoingMessage msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!guids_.insert(msg.guid).second) {
    return false;
  }
  queue_.push_back(std::move(msg));
  return true;
}

std::optional<OutgoingMessage> OutboundQueue::dequeue_one() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  OutgoingMessage msg = std::move(queue_.front());
  queue_.pop_front();
  return msg;
}

bool OutboundQueue::was_submitted(uint64_t guid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return guids_.count(guid) > 0;
}

size_t OutboundQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool OutboundQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

} // namespace network
} // namespace parley
