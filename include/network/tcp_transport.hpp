#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility>  // must precede boost/asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace parley {
namespace network {

/**
 * TcpConnection - TCP socket implementation of Connection
 *
 * The socket lives on the overlay's io_context. A read loop on the strand
 * moves received bytes into an inbox that read_with_timeout() drains from
 * the handler thread; reading pauses while the inbox is over its limit.
 * Writes are queued on the strand and the caller waits for completion.
 */
class TcpConnection : public Connection,
                      public std::enable_shared_from_this<TcpConnection> {
public:
  // Connect, waiting at most timeout. nullptr on failure.
  static std::shared_ptr<TcpConnection>
  create_outbound(boost::asio::io_context &io_context, const std::string &ip,
                  uint16_t port, std::chrono::milliseconds timeout);

  // Wrap an accepted socket
  static std::shared_ptr<TcpConnection>
  create_inbound(boost::asio::io_context &io_context,
                 boost::asio::ip::tcp::socket socket);

  ~TcpConnection() override;

  TcpConnection(const TcpConnection &) = delete;
  TcpConnection &operator=(const TcpConnection &) = delete;

  // Begin the read loop. Called by the factories.
  void start();

  std::vector<uint8_t> public_key() const override;
  std::string remote_address() const override;
  bool write(const std::vector<uint8_t> &data) override;
  bool write_with_timeout(const std::vector<uint8_t> &data,
                          std::chrono::milliseconds timeout) override;
  int64_t read_with_timeout(uint8_t *buffer, size_t len,
                            std::chrono::milliseconds timeout) override;
  bool is_alive() const override { return open_.load(); }
  void close() override;

  uint16_t remote_port() const { return remote_port_; }
  bool is_inbound() const { return is_inbound_; }

private:
  TcpConnection(boost::asio::io_context &io_context, bool is_inbound);

  struct PendingWrite {
    std::shared_ptr<std::vector<uint8_t>> data;
    std::shared_ptr<std::promise<bool>> done;
  };

  // Strand-serialized internals
  void start_read_impl();
  void do_write_impl();
  void close_impl();

  void mark_closed();
  void capture_remote_endpoint();

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  bool is_inbound_;

  // Send queue (strand only)
  std::deque<PendingWrite> send_queue_;
  bool writing_{false};

  // Inbox filled by the read loop, drained by read_with_timeout()
  std::mutex inbox_mutex_;
  std::condition_variable inbox_cv_;
  std::deque<uint8_t> inbox_;
  bool read_paused_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 64 * 1024;
  static constexpr size_t INBOX_LIMIT = 1024 * 1024;

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

/**
 * TcpOverlay - boost::asio implementation of Overlay
 *
 * Owns the io_context and its threads, the listening socket, and a queue of
 * accepted connections that accept() hands out.
 */
class TcpOverlay : public Overlay {
public:
  struct Config {
    uint16_t listen_port;
    // Address announced to peers in HELLO
    std::string advertise_ip;
    std::chrono::milliseconds connect_timeout;
    size_t io_threads;

    Config();
  };

  explicit TcpOverlay(Config config = Config());
  ~TcpOverlay() override;

  TcpOverlay(const TcpOverlay &) = delete;
  TcpOverlay &operator=(const TcpOverlay &) = delete;

  // Start io threads and open the listening socket. False if the port
  // cannot be bound.
  bool start();

  std::vector<uint8_t> local_address() const override;
  ConnectionPtr connect(const std::string &address) override;
  ConnectionPtr accept(std::chrono::milliseconds timeout) override;
  void stop() override;

  // Bound port (0 if not listening)
  uint16_t listening_port() const { return listening_port_.load(); }

private:
  bool listen(uint16_t port);
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     boost::asio::ip::tcp::socket socket);

  Config config_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::atomic<uint16_t> listening_port_{0};

  std::mutex accepted_mutex_;
  std::condition_variable accepted_cv_;
  std::deque<ConnectionPtr> accepted_;
};

} // namespace network
} // namespace parley
