#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace parley {
namespace network {

// The stream ended (peer closed, transport dead, or reader interrupted)
// while a read still needed bytes.
class StreamClosedError : public std::runtime_error {
public:
  explicit StreamClosedError(const std::string &what)
      : std::runtime_error(what) {}
};

/**
 * TransportStream - buffered reader over a Connection
 *
 * The overlay hands out data in arbitrary chunks and reports "nothing yet"
 * as a zero-length read. This class turns that into plain blocking reads:
 *
 * - read()/read_exact() refill the buffer with bounded reads and retry
 *   timeouts transparently, assembling requests that span several refills
 * - a negative read, is_alive()==false or interrupt() ends the stream
 * - available(), read_available() and skip_available() never block for
 *   longer than one probe read
 *
 * Only the owning handler thread reads. interrupt() may be called from any
 * thread.
 */
class TransportStream {
public:
  explicit TransportStream(
      ConnectionPtr connection,
      std::chrono::milliseconds refill_timeout =
          std::chrono::milliseconds(protocol::READ_TIMEOUT_MS),
      std::chrono::milliseconds probe_timeout =
          std::chrono::milliseconds(protocol::PROBE_TIMEOUT_MS),
      size_t buffer_size = protocol::STREAM_BUFFER_SIZE);

  TransportStream(const TransportStream &) = delete;
  TransportStream &operator=(const TransportStream &) = delete;

  // Next byte, or -1 once the stream has ended
  int read();

  // Between 1 and len bytes, or -1 once the stream has ended
  int64_t read(uint8_t *out, size_t len);

  // Exactly len bytes. Throws StreamClosedError if the stream ends first.
  void read_exact(uint8_t *out, size_t len);
  std::vector<uint8_t> read_exact(size_t len);

  // Up to len bytes that can be had without blocking: whatever is buffered,
  // else the result of one probe read. 0 when nothing has arrived yet.
  size_t read_available(uint8_t *out, size_t len);

  // Same as read_available() but drops the bytes
  size_t skip_available(uint64_t len);

  // Bytes readable without blocking. Tops up the buffer with one probe read
  // when it holds less than a message header.
  size_t available();

  // Ask blocked reads to give up at their next retry
  void interrupt() { interrupted_.store(true); }
  bool interrupted() const { return interrupted_.load(); }

  // True once a read observed the end of the stream
  bool closed() const { return closed_; }

  size_t buffered() const { return end_ - pos_; }

private:
  // Refill an empty buffer, retrying timeouts. False at end of stream.
  bool fill_buffer();

  // Single read of up to the free space. Returns the read result.
  int64_t read_into_buffer(std::chrono::milliseconds timeout);

  // Move unread bytes to the front so the tail has room
  void compact();

  // One probe read when the buffer is empty. False if nothing is buffered.
  bool probe();

  ConnectionPtr connection_;
  std::chrono::milliseconds refill_timeout_;
  std::chrono::milliseconds probe_timeout_;
  std::vector<uint8_t> buffer_;
  size_t pos_{0};
  size_t end_{0};
  bool closed_{false};
  std::atomic<bool> interrupted_{false};
};

} // namespace network
} // namespace parley
