#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace parley {
namespace network {

// Abstract overlay transport
// Lets the protocol handler run over different implementations:
// - TcpConnection/TcpOverlay: TCP sockets via boost::asio
// - MemoryConnection: in-process pipe pair for testing (in test/)

class Connection;
class Overlay;
using ConnectionPtr = std::shared_ptr<Connection>;

// Raised by transports on I/O failures that are not a clean close
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string &what) : std::runtime_error(what) {}
};

// Connection - one point-to-point byte stream of the overlay
//
// All calls are blocking but bounded. A connection is used by exactly one
// handler thread for reads; writes may come from any thread.
class Connection {
public:
  virtual ~Connection() = default;

  // Overlay address of the remote end (opaque bytes)
  virtual std::vector<uint8_t> public_key() const = 0;

  // Human-readable remote endpoint for logs
  virtual std::string remote_address() const = 0;

  // Write all bytes. Returns false if the connection is closed or the write
  // failed; the connection is unusable afterwards.
  virtual bool write(const std::vector<uint8_t> &data) = 0;

  // As write(), but gives up after timeout
  virtual bool write_with_timeout(const std::vector<uint8_t> &data,
                                  std::chrono::milliseconds timeout) = 0;

  // Read up to len bytes into buffer, waiting at most timeout.
  // Returns:
  //   >0  bytes read
  //    0  nothing arrived within the timeout
  //   <0  the stream is closed
  virtual int64_t read_with_timeout(uint8_t *buffer, size_t len,
                                    std::chrono::milliseconds timeout) = 0;

  virtual bool is_alive() const = 0;

  virtual void close() = 0;
};

// Overlay - factory for connections
class Overlay {
public:
  virtual ~Overlay() = default;

  // Our own overlay address
  virtual std::vector<uint8_t> local_address() const = 0;

  // Open a connection to a hex-encoded or "host:port" address.
  // Returns nullptr on failure.
  virtual ConnectionPtr connect(const std::string &address) = 0;

  // Wait up to timeout for an inbound connection. nullptr on timeout.
  virtual ConnectionPtr accept(std::chrono::milliseconds timeout) = 0;

  virtual void stop() = 0;
};

} // namespace network
} // namespace parley
