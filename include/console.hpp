#pragma once

#include "network/events.hpp"
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace parley {
namespace app {

class ProfileStore;

// One line typed at the daemon console
struct ConsoleCommand {
  enum class Kind {
    CONNECT, // /connect <pubkey> <address>
    MSG,     // /msg <pubkey> <text>
    CALL,    // /call <pubkey>
    ANSWER,  // /answer <pubkey>
    REJECT,  // /reject <pubkey>
    HANGUP,  // /hangup <pubkey>
    MUTE,    // /mute <pubkey> on|off
    NICK,    // /nick <name>
    PEERS,   // /peers
    CONTACTS,
    HELP,
    QUIT,
  };

  Kind kind;
  std::string target;   // pubkey hex or prefix
  std::string argument; // address, text, nickname, on/off
};

/**
 * Parse a console line. On failure returns nullopt and sets error to a
 * usage hint. Empty lines fail with an empty error.
 */
std::optional<ConsoleCommand> ParseConsoleCommand(const std::string &line,
                                                  std::string &error);

// Usage text for /help
std::string ConsoleHelp();

/**
 * ConsoleListener - prints session events to the console
 *
 * Also remembers the address each contact connected from, so the daemon
 * can dial it again after a restart.
 */
class ConsoleListener : public network::EventListener {
public:
  ConsoleListener(std::ostream &out, std::shared_ptr<ProfileStore> store);

  void on_client_connected(const network::PeerKey &peer,
                           const std::string &address,
                           int32_t client_id) override;
  void on_client_ip_changed(const std::string &old_address,
                            const std::string &new_address) override;
  void on_message_received(const network::PeerKey &peer, uint64_t guid,
                           uint64_t reply_to, int64_t send_time,
                           int64_t edit_time, int32_t type,
                           const std::vector<uint8_t> &payload) override;
  void on_message_delivered(const network::PeerKey &peer, uint64_t guid,
                            bool delivered) override;
  void on_connection_closed(const network::PeerKey &peer,
                            const std::string &address) override;
  void on_incoming_call(const network::PeerKey &peer, bool video) override;
  void on_call_status_changed(calls::CallStatus status,
                              const network::PeerKey &peer) override;

private:
  // Nickname if known, else shortened key
  std::string display_name(const network::PeerKey &peer) const;
  void print(const std::string &line);

  std::mutex out_mutex_;
  std::ostream &out_;
  std::shared_ptr<ProfileStore> store_;
};

} // namespace app
} // namespace parley
