// Copyright (c) 2025 The Unicity Foundation
// TCP overlay implementation using boost::asio sockets

#include "network/tcp_transport.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include <algorithm>

namespace parley {
namespace network {

// ============================================================================
// TcpConnection
// ============================================================================

std::shared_ptr<TcpConnection>
TcpConnection::create_outbound(boost::asio::io_context &io_context,
                               const std::string &ip, uint16_t port,
                               std::chrono::milliseconds timeout) {
  auto conn = std::shared_ptr<TcpConnection>(new TcpConnection(io_context, false));
  conn->remote_addr_ = ip;
  conn->remote_port_ = port;

  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(ip, ec);
  if (ec) {
    LOG_NET_TRACE("not a numeric address: {}", ip);
    return nullptr;
  }
  boost::asio::ip::tcp::endpoint endpoint(address, port);

  auto connected = std::make_shared<std::promise<boost::system::error_code>>();
  auto result = connected->get_future();
  boost::asio::post(conn->strand_, [conn, endpoint, connected]() {
    conn->socket_.async_connect(
        endpoint, boost::asio::bind_executor(
                      conn->strand_,
                      [connected](const boost::system::error_code &ec) {
                        connected->set_value(ec);
                      }));
  });

  if (result.wait_for(timeout) != std::future_status::ready) {
    LOG_NET_WARN("connect timeout to {}:{} after {} ms", ip, port,
                 timeout.count());
    // Cancel on the strand; the pending handler completes with
    // operation_aborted and releases its promise
    boost::asio::post(conn->strand_, [conn]() {
      boost::system::error_code ignored;
      conn->socket_.close(ignored);
    });
    return nullptr;
  }
  auto connect_ec = result.get();
  if (connect_ec) {
    LOG_NET_TRACE("failed to connect to {}:{}: {}", ip, port,
                  connect_ec.message());
    return nullptr;
  }

  conn->open_ = true;
  boost::system::error_code opt_ec;
  conn->socket_.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  conn->socket_.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);
  conn->capture_remote_endpoint();

  LOG_NET_TRACE("connected to {}:{}", conn->remote_addr_, conn->remote_port_);
  conn->start();
  return conn;
}

std::shared_ptr<TcpConnection>
TcpConnection::create_inbound(boost::asio::io_context &io_context,
                              boost::asio::ip::tcp::socket socket) {
  auto conn = std::shared_ptr<TcpConnection>(new TcpConnection(io_context, true));
  conn->socket_ = std::move(socket);
  conn->open_ = true;
  conn->capture_remote_endpoint();
  conn->start();
  return conn;
}

TcpConnection::TcpConnection(boost::asio::io_context &io_context,
                             bool is_inbound)
    : io_context_(io_context), socket_(io_context),
      strand_(io_context.get_executor()), is_inbound_(is_inbound) {}

TcpConnection::~TcpConnection() {
  // No logging: the logger may already be gone during shutdown
}

void TcpConnection::capture_remote_endpoint() {
  boost::system::error_code ec;
  auto ep = socket_.remote_endpoint(ec);
  if (ec) {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
    return;
  }
  auto normalized = util::ValidateAndNormalizeIP(ep.address().to_string());
  remote_addr_ = normalized ? *normalized : ep.address().to_string();
  remote_port_ = ep.port();
}

void TcpConnection::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void TcpConnection::start_read_impl() {
  if (!open_)
    return;

  auto buf = std::make_shared<std::vector<uint8_t>>(RECV_BUFFER_SIZE);
  socket_.async_read_some(
      boost::asio::buffer(*buf),
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this(),
                    buf](const boost::system::error_code &ec, size_t n) {
            if (!open_) {
              return;
            }
            if (ec) {
              if (ec != boost::asio::error::eof &&
                  ec != boost::asio::error::operation_aborted) {
                LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_,
                              remote_port_, ec.message());
              }
              close_impl();
              return;
            }

            bool pause = false;
            {
              std::lock_guard<std::mutex> lock(inbox_mutex_);
              inbox_.insert(inbox_.end(), buf->begin(), buf->begin() + n);
              if (inbox_.size() >= INBOX_LIMIT) {
                read_paused_ = true;
                pause = true;
              }
            }
            inbox_cv_.notify_all();

            // Resumed by read_with_timeout() once the reader catches up
            if (!pause) {
              start_read_impl();
            }
          }));
}

int64_t TcpConnection::read_with_timeout(uint8_t *buffer, size_t len,
                                         std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(inbox_mutex_);
  inbox_cv_.wait_for(lock, timeout,
                     [this] { return !inbox_.empty() || !open_.load(); });

  if (inbox_.empty()) {
    return open_.load() ? 0 : -1;
  }

  size_t n = std::min(len, inbox_.size());
  std::copy(inbox_.begin(), inbox_.begin() + n, buffer);
  inbox_.erase(inbox_.begin(), inbox_.begin() + n);

  if (read_paused_ && inbox_.size() < INBOX_LIMIT / 2) {
    read_paused_ = false;
    boost::asio::post(strand_,
                      [self = shared_from_this()]() { self->start_read_impl(); });
  }
  return static_cast<int64_t>(n);
}

bool TcpConnection::write(const std::vector<uint8_t> &data) {
  return write_with_timeout(
      data, std::chrono::milliseconds(protocol::WRITE_TIMEOUT_MS));
}

bool TcpConnection::write_with_timeout(const std::vector<uint8_t> &data,
                                       std::chrono::milliseconds timeout) {
  if (!open_)
    return false;

  // Copy before posting: the caller's buffer may be gone by the time the
  // strand runs the write
  PendingWrite pending{std::make_shared<std::vector<uint8_t>>(data),
                       std::make_shared<std::promise<bool>>()};
  auto result = pending.done->get_future();

  boost::asio::dispatch(strand_, [this, self = shared_from_this(), pending]() {
    if (!open_) {
      pending.done->set_value(false);
      return;
    }
    send_queue_.push_back(pending);
    if (!writing_) {
      writing_ = true;
      do_write_impl();
    }
  });

  if (result.wait_for(timeout) != std::future_status::ready) {
    LOG_NET_WARN("write of {} bytes to {}:{} timed out, closing", data.size(),
                 remote_addr_, remote_port_);
    close();
    return false;
  }
  return result.get();
}

void TcpConnection::do_write_impl() {
  if (!open_ || send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto front = send_queue_.front();
  boost::asio::async_write(
      socket_, boost::asio::buffer(*front.data),
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this(),
                    front](const boost::system::error_code &ec, size_t) {
            if (!open_) {
              // close_impl() already failed the queue
              return;
            }
            send_queue_.pop_front();
            if (ec) {
              LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_,
                            remote_port_, ec.message());
              front.done->set_value(false);
              close_impl();
              return;
            }
            front.done->set_value(true);
            do_write_impl();
          }));
}

void TcpConnection::close() {
  mark_closed();
  boost::asio::dispatch(strand_,
                        [self = shared_from_this()]() { self->close_impl(); });
}

void TcpConnection::mark_closed() {
  {
    std::lock_guard<std::mutex> lock(inbox_mutex_);
    open_.store(false);
  }
  inbox_cv_.notify_all();
}

void TcpConnection::close_impl() {
  mark_closed();

  // Cancelling forces pending handlers to complete with operation_aborted;
  // each holds a shared_ptr, so the object outlives them
  if (socket_.is_open()) {
    boost::system::error_code ignored;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  // Writers waiting on the queue learn that nothing more will be sent
  while (!send_queue_.empty()) {
    send_queue_.front().done->set_value(false);
    send_queue_.pop_front();
  }
  writing_ = false;
}

std::vector<uint8_t> TcpConnection::public_key() const {
  auto encoded = util::EncodeOverlayAddress(remote_addr_, remote_port_);
  return encoded ? *encoded : std::vector<uint8_t>{};
}

std::string TcpConnection::remote_address() const {
  if (remote_addr_.find(':') != std::string::npos) {
    return "[" + remote_addr_ + "]:" + std::to_string(remote_port_);
  }
  return remote_addr_ + ":" + std::to_string(remote_port_);
}

// ============================================================================
// TcpOverlay
// ============================================================================

TcpOverlay::Config::Config()
    : listen_port(protocol::DEFAULT_PORT), advertise_ip("127.0.0.1"),
      connect_timeout(std::chrono::seconds(10)), io_threads(1) {}

TcpOverlay::TcpOverlay(Config config)
    : config_(std::move(config)),
      io_context_(std::make_unique<boost::asio::io_context>()) {}

TcpOverlay::~TcpOverlay() { stop(); }

bool TcpOverlay::start() {
  if (running_.exchange(true)) {
    return true;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < std::max<size_t>(1, config_.io_threads); i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
  return listen(config_.listen_port);
}

bool TcpOverlay::listen(uint16_t port) {
  try {
    using tcp = boost::asio::ip::tcp;
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);

    // Dual-stack if possible, IPv4-only otherwise
    try {
      acceptor_->open(tcp::v6());
      acceptor_->set_option(boost::asio::ip::v6_only(false));
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v6(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    } catch (const std::exception &) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_->open(tcp::v4());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(tcp::endpoint(tcp::v4(), port));
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    }

    // Actual port (handles ephemeral port 0)
    boost::system::error_code ec;
    auto ep = acceptor_->local_endpoint(ec);
    listening_port_ = ec ? 0 : ep.port();

    LOG_NET_INFO("listening on port {}", listening_port_.load());
    boost::asio::post(*io_context_, [this]() { start_accept(); });
    return true;

  } catch (const std::exception &e) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, e.what());
    if (acceptor_) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      acceptor_.reset();
    }
    return false;
  }
}

void TcpOverlay::start_accept() {
  if (!acceptor_)
    return;
  acceptor_->async_accept([this](const boost::system::error_code &ec,
                                 boost::asio::ip::tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void TcpOverlay::handle_accept(const boost::system::error_code &ec,
                               boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  boost::system::error_code opt_ec;
  socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

  auto conn = TcpConnection::create_inbound(*io_context_, std::move(socket));
  LOG_NET_DEBUG("connection from {} accepted", conn->remote_address());
  {
    std::lock_guard<std::mutex> lock(accepted_mutex_);
    accepted_.push_back(conn);
  }
  accepted_cv_.notify_one();

  start_accept();
}

ConnectionPtr TcpOverlay::accept(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(accepted_mutex_);
  accepted_cv_.wait_for(lock, timeout, [this] {
    return !accepted_.empty() || !running_.load();
  });
  if (accepted_.empty()) {
    return nullptr;
  }
  auto conn = accepted_.front();
  accepted_.pop_front();
  return conn;
}

ConnectionPtr TcpOverlay::connect(const std::string &address) {
  if (!running_) {
    return nullptr;
  }
  auto endpoint = util::ParseOverlayAddress(address);
  if (!endpoint) {
    LOG_NET_WARN("cannot parse overlay address '{}'", address);
    return nullptr;
  }
  return TcpConnection::create_outbound(*io_context_, endpoint->first,
                                        endpoint->second,
                                        config_.connect_timeout);
}

std::vector<uint8_t> TcpOverlay::local_address() const {
  auto encoded =
      util::EncodeOverlayAddress(config_.advertise_ip, listening_port_.load());
  return encoded ? *encoded : std::vector<uint8_t>{};
}

void TcpOverlay::stop() {
  running_.store(false);
  accepted_cv_.notify_all();

  work_guard_.reset();
  if (io_context_) {
    io_context_->stop();
  }
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // No io thread is left to race with
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  listening_port_ = 0;

  std::lock_guard<std::mutex> lock(accepted_mutex_);
  accepted_.clear();
  // io_context_ itself lives until ~TcpOverlay(): connections may still
  // reference it
}

} // namespace network
} // namespace parley
