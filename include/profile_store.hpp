#pragma once

#include "network/events.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace parley {
namespace app {

/**
 * ProfileStore - JSON-backed InfoProvider for the daemon
 *
 * Files in the data directory:
 *   profile.json   our nickname, info text, avatar (hex) and change time
 *   contacts.json  per contact (keyed by hex public key): the last profile
 *                  received and the overlay addresses it was seen at
 *   files/         received attachments
 *
 * Every mutation is written through with atomic_write_file().
 */
class ProfileStore : public network::InfoProvider {
public:
  struct Contact {
    network::ContactInfo info;
    int64_t updated{0}; // when we stored info, unix millis
    std::vector<std::string> addresses;
  };

  explicit ProfileStore(const std::filesystem::path &datadir);

  // Read both files. A missing file is a first run, not an error.
  bool Load();

  // Change our profile; bumps its time so peers re-request it
  bool SetMyInfo(const std::string &nickname, const std::string &info);

  // Record the address a contact was reached at, most recent first
  bool RememberAddress(const network::PeerKey &peer, const std::string &address);

  std::optional<Contact> GetContact(const network::PeerKey &peer) const;
  std::map<std::string, Contact> GetContacts() const;
  network::ContactInfo GetMyInfo() const;

  // InfoProvider
  std::string get_files_directory() override;
  int64_t get_contact_update_time(const network::PeerKey &peer) override;
  std::optional<network::ContactInfo> get_my_info(int64_t since) override;
  void update_contact_info(const network::PeerKey &peer,
                           const network::ContactInfo &info) override;

  // Addresses kept per contact
  static constexpr size_t MAX_ADDRESSES = 4;

private:
  bool SaveProfileInternal();
  bool SaveContactsInternal();

  const std::filesystem::path datadir_;
  const std::filesystem::path profile_path_;
  const std::filesystem::path contacts_path_;
  const std::filesystem::path files_dir_;

  mutable std::mutex mutex_;
  network::ContactInfo my_info_;
  std::map<std::string, Contact> contacts_; // hex pubkey -> contact
};

} // namespace app
} // namespace parley
