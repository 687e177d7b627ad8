#pragma once

#include "calls/audio.hpp"
#include "console.hpp"
#include "crypto/ed25519.hpp"
#include "network/messenger.hpp"
#include "network/protocol.hpp"
#include "network/tcp_transport.hpp"
#include "profile_store.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace parley {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory
  std::filesystem::path datadir;

  // Overlay
  uint16_t listen_port = protocol::DEFAULT_PORT;
  std::string advertise_ip = "127.0.0.1";

  // Profile nickname; empty keeps the stored one
  std::string nickname;

  // Contacts to dial at startup: (pubkey hex, address)
  std::vector<std::pair<std::string, std::string>> connect;

  // Read commands from stdin
  bool console = true;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Application - wires identity, contact store, overlay and messenger.
// Handles signals and runs the console.
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Run one console command. Output goes to out.
  void execute(const ConsoleCommand &cmd, std::ostream &out);

  // Full key, or the unique known contact/peer whose hex key starts with
  // target
  std::optional<network::PeerKey> resolve_peer(const std::string &target) const;

  network::Messenger &messenger() { return *messenger_; }
  ProfileStore &profile_store() { return *store_; }
  const crypto::KeyPair &identity() const { return *identity_; }

  bool is_running() const { return running_; }
  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order)
  std::unique_ptr<util::DirectoryLock> datadir_lock_;
  std::shared_ptr<const crypto::KeyPair> identity_;
  std::shared_ptr<ProfileStore> store_;
  std::shared_ptr<ConsoleListener> listener_;
  std::shared_ptr<calls::AudioFactory> audio_;
  std::shared_ptr<network::TcpOverlay> overlay_;
  std::unique_ptr<network::Messenger> messenger_;

  std::unique_ptr<std::thread> console_thread_;

  // Initialization steps
  bool init_datadir();
  bool init_identity();
  bool init_store();
  bool init_network();

  void connect_known_contacts();
  void console_loop();

  // Shutdown
  void shutdown();

  // Signal handling
  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace parley
