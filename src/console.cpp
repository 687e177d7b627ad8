#include "console.hpp"
#include "network/protocol.hpp"
#include "profile_store.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <ostream>
#include <sstream>

namespace parley {
namespace app {

namespace {

using Kind = ConsoleCommand::Kind;

struct CommandSpec {
  Kind kind;
  bool needs_target;
  bool needs_argument;
  const char *usage;
};

const std::map<std::string, CommandSpec> &Commands() {
  static const std::map<std::string, CommandSpec> commands = {
      {"/connect", {Kind::CONNECT, true, true, "/connect <pubkey> <host:port>"}},
      {"/msg", {Kind::MSG, true, true, "/msg <pubkey> <text>"}},
      {"/call", {Kind::CALL, true, false, "/call <pubkey>"}},
      {"/answer", {Kind::ANSWER, true, false, "/answer <pubkey>"}},
      {"/reject", {Kind::REJECT, true, false, "/reject <pubkey>"}},
      {"/hangup", {Kind::HANGUP, true, false, "/hangup <pubkey>"}},
      {"/mute", {Kind::MUTE, true, true, "/mute <pubkey> on|off"}},
      {"/nick", {Kind::NICK, false, true, "/nick <name>"}},
      {"/peers", {Kind::PEERS, false, false, "/peers"}},
      {"/contacts", {Kind::CONTACTS, false, false, "/contacts"}},
      {"/help", {Kind::HELP, false, false, "/help"}},
      {"/quit", {Kind::QUIT, false, false, "/quit"}},
  };
  return commands;
}

// Split off the first whitespace-delimited word
std::pair<std::string, std::string> SplitWord(const std::string &str) {
  std::string trimmed = util::Trim(str);
  size_t space = trimmed.find_first_of(" \t");
  if (space == std::string::npos) {
    return {trimmed, std::string()};
  }
  return {trimmed.substr(0, space), util::Trim(trimmed.substr(space + 1))};
}

std::string ShortKey(const network::PeerKey &peer) {
  return util::HexStr(peer).substr(0, 12);
}

} // namespace

std::optional<ConsoleCommand> ParseConsoleCommand(const std::string &line,
                                                  std::string &error) {
  error.clear();
  auto [name, rest] = SplitWord(line);
  if (name.empty()) {
    return std::nullopt;
  }

  auto it = Commands().find(name);
  if (it == Commands().end()) {
    error = "Unknown command " + name + ", try /help";
    return std::nullopt;
  }
  const CommandSpec &spec = it->second;

  ConsoleCommand cmd;
  cmd.kind = spec.kind;

  if (spec.needs_target) {
    auto [target, argument] = SplitWord(rest);
    if (target.empty() || !util::IsValidHex(target)) {
      error = std::string("Usage: ") + spec.usage;
      return std::nullopt;
    }
    cmd.target = target;
    rest = argument;
  }

  if (spec.needs_argument) {
    if (rest.empty()) {
      error = std::string("Usage: ") + spec.usage;
      return std::nullopt;
    }
    if (spec.kind == Kind::MUTE && rest != "on" && rest != "off") {
      error = std::string("Usage: ") + spec.usage;
      return std::nullopt;
    }
    cmd.argument = rest;
  } else if (!rest.empty()) {
    error = std::string("Usage: ") + spec.usage;
    return std::nullopt;
  }

  return cmd;
}

std::string ConsoleHelp() {
  std::ostringstream out;
  out << "Commands:\n";
  for (const auto &[name, spec] : Commands()) {
    out << "  " << spec.usage << "\n";
  }
  out << "A <pubkey> may be shortened to any unique prefix of a known contact.";
  return out.str();
}

ConsoleListener::ConsoleListener(std::ostream &out,
                                 std::shared_ptr<ProfileStore> store)
    : out_(out), store_(std::move(store)) {}

std::string ConsoleListener::display_name(const network::PeerKey &peer) const {
  if (store_) {
    auto contact = store_->GetContact(peer);
    if (contact && !contact->info.nickname.empty()) {
      return contact->info.nickname + " (" + ShortKey(peer) + ")";
    }
  }
  return ShortKey(peer);
}

void ConsoleListener::print(const std::string &line) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << line << std::endl;
}

void ConsoleListener::on_client_connected(const network::PeerKey &peer,
                                          const std::string &address,
                                          int32_t client_id) {
  if (store_) {
    store_->RememberAddress(peer, address);
  }
  print("* connected: " + display_name(peer) + " (client " +
        std::to_string(client_id) + ")");
}

void ConsoleListener::on_client_ip_changed(const std::string &old_address,
                                           const std::string &new_address) {
  LOG_APP_INFO("Peer address changed {} -> {}", old_address, new_address);
}

void ConsoleListener::on_message_received(const network::PeerKey &peer,
                                          uint64_t guid, uint64_t reply_to,
                                          int64_t send_time, int64_t edit_time,
                                          int32_t type,
                                          const std::vector<uint8_t> &payload) {
  std::string when = util::FormatTime(send_time / 1000);
  std::string body;

  switch (type) {
  case protocol::content::TEXT:
    body = std::string(payload.begin(), payload.end());
    break;
  case protocol::content::IMAGE:
  case protocol::content::FILE: {
    // Attachments arrive as JSON metadata; the file is already saved
    auto meta = nlohmann::json::parse(payload.begin(), payload.end(), nullptr,
                                      false);
    if (meta.is_discarded() || !meta.is_object()) {
      body = "[attachment]";
    } else {
      std::string name = meta.value("name", std::string());
      std::string text = meta.value("text", std::string());
      body = "[" + std::string(type == protocol::content::IMAGE ? "image"
                                                                : "file") +
             (name.empty() ? "" : " " + name) + "]" +
             (text.empty() ? "" : " " + text);
    }
    break;
  }
  default:
    body = "[type " + std::to_string(type) + ", " +
           std::to_string(payload.size()) + " bytes]";
    break;
  }

  if (edit_time != 0) {
    body += " (edited)";
  }
  if (reply_to != 0) {
    body = "(reply) " + body;
  }

  LOG_APP_INFO("Message {} from {}", guid, ShortKey(peer));
  print("[" + when + "] <" + display_name(peer) + "> " + body);
}

void ConsoleListener::on_message_delivered(const network::PeerKey &peer,
                                           uint64_t guid, bool delivered) {
  if (delivered) {
    LOG_APP_INFO("Message {} delivered to {}", guid, ShortKey(peer));
  } else {
    print("* message " + std::to_string(guid) + " to " + display_name(peer) +
          " was not delivered");
  }
}

void ConsoleListener::on_connection_closed(const network::PeerKey &peer,
                                           const std::string &address) {
  print("* disconnected: " + display_name(peer));
}

void ConsoleListener::on_incoming_call(const network::PeerKey &peer,
                                       bool video) {
  print("* incoming " + std::string(video ? "video " : "") + "call from " +
        display_name(peer) + ", /answer " + ShortKey(peer) + " or /reject " +
        ShortKey(peer));
}

void ConsoleListener::on_call_status_changed(calls::CallStatus status,
                                             const network::PeerKey &peer) {
  print("* call with " + display_name(peer) + ": " +
        calls::call_status_name(status));
}

} // namespace app
} // namespace parley
