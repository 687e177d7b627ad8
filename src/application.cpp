#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <thread>
#include <unistd.h> // For write(), read(), STDOUT_FILENO (async-signal-safe)

namespace parley {
namespace app {

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_INFO("Initializing Parley...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_identity()) {
    LOG_ERROR("Failed to initialize identity");
    return false;
  }

  // Print startup banner (std::cout for immediate visibility)
  std::cout << GetStartupBanner(util::HexStr(identity_->public_key()))
            << std::flush;

  if (!init_store()) {
    LOG_ERROR("Failed to load contacts");
    return false;
  }

  if (!init_network()) {
    LOG_ERROR("Failed to initialize network");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting Parley...");

  setup_signal_handlers();

  if (!overlay_->start()) {
    LOG_ERROR("Failed to listen on port {}", config_.listen_port);
    return false;
  }

  messenger_->start();
  running_ = true;

  connect_known_contacts();

  LOG_INFO("Parley started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("Listening on port: {}", overlay_->listening_port());
  LOG_INFO("Overlay address: {}", util::HexStr(overlay_->local_address()));

  if (config_.console) {
    console_thread_ =
        std::make_unique<std::thread>(&Application::console_loop, this);
    std::cout << "Type /help for commands" << std::endl;
  } else {
    LOG_INFO("Press Ctrl+C to stop");
  }

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

void Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down Parley...");

  running_ = false;
  shutdown_requested_ = true;

  // Console polls shutdown_requested_ between reads
  if (console_thread_ && console_thread_->joinable()) {
    if (console_thread_->get_id() != std::this_thread::get_id()) {
      console_thread_->join();
    } else {
      console_thread_->detach();
    }
    console_thread_.reset();
  }

  // Sessions first: their closed callbacks still reach the store
  if (messenger_) {
    LOG_INFO("Stopping messenger...");
    messenger_->stop();
  }

  if (overlay_) {
    LOG_INFO("Stopping overlay...");
    overlay_->stop();
  }

  LOG_INFO("Releasing data directory lock...");
  datadir_lock_.reset();

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // Lock the data directory to prevent multiple instances
  datadir_lock_ = std::make_unique<util::DirectoryLock>(config_.datadir, ".lock");

  if (datadir_lock_->result() == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory {}: {}",
              config_.datadir.string(), datadir_lock_->reason());
    return false;
  }

  if (datadir_lock_->result() == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "Parley is probably already running.",
              config_.datadir.string());
    return false;
  }

  LOG_DEBUG("Successfully locked data directory");
  return true;
}

bool Application::init_identity() {
  auto key_path = config_.datadir / "identity.pem";
  try {
    identity_ = std::make_shared<crypto::KeyPair>(
        crypto::KeyPair::LoadOrCreate(key_path));
  } catch (const crypto::CryptoError &e) {
    LOG_ERROR("Identity key {}: {}", key_path.string(), e.what());
    return false;
  }
  LOG_INFO("Identity: {}", util::HexStr(identity_->public_key()));
  return true;
}

bool Application::init_store() {
  store_ = std::make_shared<ProfileStore>(config_.datadir);
  if (!store_->Load()) {
    return false;
  }

  if (!config_.nickname.empty()) {
    auto mine = store_->GetMyInfo();
    if (!store_->SetMyInfo(config_.nickname, mine.info)) {
      LOG_ERROR("Invalid nickname");
      return false;
    }
  }

  listener_ = std::make_shared<ConsoleListener>(std::cout, store_);
  return true;
}

bool Application::init_network() {
  LOG_INFO("Initializing network...");

  network::TcpOverlay::Config overlay_config;
  overlay_config.listen_port = config_.listen_port;
  overlay_config.advertise_ip = config_.advertise_ip;
  overlay_ = std::make_shared<network::TcpOverlay>(overlay_config);

  // No sound device in the daemon: calls carry silence
  audio_ = std::make_shared<calls::SilentAudioFactory>();

  messenger_ = std::make_unique<network::Messenger>(
      identity_, overlay_, listener_, store_, audio_);
  return true;
}

void Application::connect_known_contacts() {
  for (const auto &[hex, address] : config_.connect) {
    auto peer = util::ParseHex(hex);
    if (!peer || peer->size() != protocol::PUBLIC_KEY_SIZE) {
      LOG_WARN("Ignoring --connect with invalid key {}", hex);
      continue;
    }
    messenger_->connect_contact(*peer, {address});
  }

  for (const auto &[hex, contact] : store_->GetContacts()) {
    if (contact.addresses.empty()) {
      continue;
    }
    auto peer = util::ParseHex(hex);
    if (peer && !messenger_->is_connecting(*peer)) {
      messenger_->connect_contact(*peer, contact.addresses);
    }
  }
}

std::optional<network::PeerKey>
Application::resolve_peer(const std::string &target) const {
  std::string prefix = target;
  for (auto &c : prefix) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (prefix.size() == protocol::PUBLIC_KEY_SIZE * 2) {
    return util::ParseHex(prefix);
  }

  std::optional<network::PeerKey> found;
  auto consider = [&](const network::PeerKey &peer) {
    if (util::HexStr(peer).compare(0, prefix.size(), prefix) != 0) {
      return true;
    }
    if (found && *found != peer) {
      return false; // ambiguous
    }
    found = peer;
    return true;
  };

  for (const auto &[hex, contact] : store_->GetContacts()) {
    auto peer = util::ParseHex(hex);
    if (peer && !consider(*peer)) {
      return std::nullopt;
    }
  }
  for (const auto &peer : messenger_->connected_peers()) {
    if (!consider(peer)) {
      return std::nullopt;
    }
  }
  return found;
}

void Application::execute(const ConsoleCommand &cmd, std::ostream &out) {
  using Kind = ConsoleCommand::Kind;

  switch (cmd.kind) {
  case Kind::HELP:
    out << ConsoleHelp() << std::endl;
    return;
  case Kind::QUIT:
    request_shutdown();
    return;
  case Kind::NICK: {
    auto mine = store_->GetMyInfo();
    if (!store_->SetMyInfo(cmd.argument, mine.info)) {
      out << "Nickname too long" << std::endl;
    }
    return;
  }
  case Kind::PEERS: {
    auto peers = messenger_->connected_peers();
    out << peers.size() << " connected" << std::endl;
    for (const auto &peer : peers) {
      auto session = messenger_->session(peer);
      out << "  " << util::HexStr(peer);
      if (session) {
        auto rtt = session->stats().ping_time_ms.load();
        out << (session->is_outbound() ? "  out" : "  in");
        if (rtt.count() >= 0) {
          out << "  ping " << rtt.count() << "ms";
        }
      }
      out << std::endl;
    }
    return;
  }
  case Kind::CONTACTS: {
    for (const auto &[hex, contact] : store_->GetContacts()) {
      out << "  " << hex;
      if (!contact.info.nickname.empty()) {
        out << "  " << contact.info.nickname;
      }
      if (!contact.addresses.empty()) {
        out << "  " << contact.addresses.front();
      }
      out << std::endl;
    }
    return;
  }
  default:
    break;
  }

  // Everything else targets a contact
  std::optional<network::PeerKey> peer;
  if (cmd.kind == Kind::CONNECT) {
    peer = util::ParseHex(cmd.target);
    if (!peer || peer->size() != protocol::PUBLIC_KEY_SIZE) {
      out << "/connect needs the full 64-character public key" << std::endl;
      return;
    }
  } else {
    peer = resolve_peer(cmd.target);
    if (!peer) {
      out << "No unique contact matches " << cmd.target << std::endl;
      return;
    }
  }

  bool ok = true;
  switch (cmd.kind) {
  case Kind::CONNECT:
    if (!messenger_->connect_contact(*peer, {cmd.argument})) {
      out << "Already connecting" << std::endl;
    }
    return;
  case Kind::MSG: {
    std::vector<uint8_t> payload(cmd.argument.begin(), cmd.argument.end());
    uint64_t guid = 0;
    while (guid == 0) {
      guid = crypto::RandomUint64();
    }
    ok = messenger_->send_message(*peer, guid, 0, util::GetTimeMillis(), 0,
                                  protocol::content::TEXT, std::move(payload));
    if (ok && !messenger_->is_connected(*peer)) {
      out << "Queued until connected" << std::endl;
    }
    break;
  }
  case Kind::CALL:
    ok = messenger_->start_call(*peer);
    break;
  case Kind::ANSWER:
    ok = messenger_->answer_call(*peer, true);
    break;
  case Kind::REJECT:
    ok = messenger_->answer_call(*peer, false);
    break;
  case Kind::HANGUP:
    ok = messenger_->hangup_call(*peer);
    break;
  case Kind::MUTE:
    ok = messenger_->mute_call(*peer, cmd.argument == "on");
    break;
  default:
    break;
  }

  if (!ok) {
    out << "Not connected to " << util::HexStr(*peer).substr(0, 12)
        << std::endl;
  }
}

void Application::console_loop() {
  std::string pending;
  char buffer[1024];

  while (!shutdown_requested_) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int ready = poll(&pfd, 1, 200);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG_APP_ERROR("Console: poll failed: {}", std::strerror(errno));
      return;
    }
    if (ready == 0) {
      continue;
    }

    ssize_t n = read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n <= 0) {
      // EOF: keep running headless until a signal arrives
      LOG_APP_INFO("Console: stdin closed");
      return;
    }
    pending.append(buffer, static_cast<size_t>(n));

    size_t newline;
    while ((newline = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);

      std::string error;
      auto cmd = ParseConsoleCommand(line, error);
      if (!cmd) {
        if (!error.empty()) {
          std::cout << error << std::endl;
        }
        continue;
      }
      execute(*cmd, std::cout);
    }
  }
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // A peer closing mid-write must not kill the daemon
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace parley
