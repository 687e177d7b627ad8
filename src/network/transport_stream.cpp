#include "network/transport_stream.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cstring>

namespace parley {
namespace network {

TransportStream::TransportStream(ConnectionPtr connection,
                                 std::chrono::milliseconds refill_timeout,
                                 std::chrono::milliseconds probe_timeout,
                                 size_t buffer_size)
    : connection_(std::move(connection)), refill_timeout_(refill_timeout),
      probe_timeout_(probe_timeout), buffer_(buffer_size) {}

void TransportStream::compact() {
  if (pos_ == end_) {
    pos_ = end_ = 0;
    return;
  }
  if (pos_ > 0) {
    std::memmove(buffer_.data(), buffer_.data() + pos_, end_ - pos_);
    end_ -= pos_;
    pos_ = 0;
  }
}

int64_t TransportStream::read_into_buffer(std::chrono::milliseconds timeout) {
  compact();
  if (end_ == buffer_.size()) {
    return 0;
  }
  int64_t n = connection_->read_with_timeout(buffer_.data() + end_,
                                             buffer_.size() - end_, timeout);
  if (n < 0) {
    closed_ = true;
    return n;
  }
  end_ += static_cast<size_t>(n);
  return n;
}

bool TransportStream::fill_buffer() {
  while (!closed_) {
    if (interrupted_.load()) {
      LOG_NET_TRACE("stream read interrupted, remote={}",
                    connection_->remote_address());
      return false;
    }
    if (!connection_->is_alive()) {
      closed_ = true;
      return false;
    }
    int64_t n = read_into_buffer(refill_timeout_);
    if (n > 0) {
      return true;
    }
    // n == 0: timed out, try again
  }
  return false;
}

int TransportStream::read() {
  if (pos_ == end_ && !fill_buffer()) {
    return -1;
  }
  return buffer_[pos_++];
}

int64_t TransportStream::read(uint8_t *out, size_t len) {
  if (len == 0) {
    return 0;
  }
  if (pos_ == end_ && !fill_buffer()) {
    return -1;
  }
  size_t n = std::min(len, end_ - pos_);
  std::memcpy(out, buffer_.data() + pos_, n);
  pos_ += n;
  return static_cast<int64_t>(n);
}

void TransportStream::read_exact(uint8_t *out, size_t len) {
  size_t done = 0;
  while (done < len) {
    int64_t n = read(out + done, len - done);
    if (n < 0) {
      throw StreamClosedError("stream ended after " + std::to_string(done) +
                              " of " + std::to_string(len) + " bytes");
    }
    done += static_cast<size_t>(n);
  }
}

std::vector<uint8_t> TransportStream::read_exact(size_t len) {
  std::vector<uint8_t> out(len);
  read_exact(out.data(), len);
  return out;
}

bool TransportStream::probe() {
  if (buffered() == 0 && !closed_ && !interrupted_.load()) {
    if (connection_->is_alive()) {
      read_into_buffer(probe_timeout_);
    } else {
      closed_ = true;
    }
  }
  return buffered() > 0;
}

size_t TransportStream::read_available(uint8_t *out, size_t len) {
  if (len == 0 || !probe()) {
    return 0;
  }
  size_t n = std::min(len, buffered());
  std::memcpy(out, buffer_.data() + pos_, n);
  pos_ += n;
  return n;
}

size_t TransportStream::skip_available(uint64_t len) {
  if (len == 0 || !probe()) {
    return 0;
  }
  size_t n = static_cast<size_t>(
      std::min<uint64_t>(len, static_cast<uint64_t>(buffered())));
  pos_ += n;
  return n;
}

size_t TransportStream::available() {
  if (buffered() < protocol::MESSAGE_HEADER_SIZE && !closed_ &&
      !interrupted_.load()) {
    if (connection_->is_alive()) {
      read_into_buffer(probe_timeout_);
    } else {
      closed_ = true;
    }
  }
  return buffered();
}

} // namespace network
} // namespace parley
