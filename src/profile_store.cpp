#include "profile_store.hpp"
#include "network/protocol.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

namespace parley {
namespace app {

using json = nlohmann::json;

namespace {

json InfoToJson(const network::ContactInfo &info) {
  return {{"time", info.time},
          {"nickname", info.nickname},
          {"info", info.info},
          {"avatar", util::HexStr(info.avatar)}};
}

network::ContactInfo InfoFromJson(const json &j) {
  network::ContactInfo info;
  info.time = j.value("time", int64_t(0));
  info.nickname = j.value("nickname", std::string());
  info.info = j.value("info", std::string());
  auto avatar = util::ParseHex(j.value("avatar", std::string()));
  if (avatar) {
    info.avatar = std::move(*avatar);
  }
  return info;
}

} // namespace

ProfileStore::ProfileStore(const std::filesystem::path &datadir)
    : datadir_(datadir), profile_path_(datadir / "profile.json"),
      contacts_path_(datadir / "contacts.json"), files_dir_(datadir / "files") {}

bool ProfileStore::Load() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!util::ensure_directory(files_dir_)) {
    LOG_APP_ERROR("ProfileStore: cannot create {}", files_dir_.string());
    return false;
  }

  std::ifstream profile_file(profile_path_);
  if (profile_file.is_open()) {
    try {
      json j;
      profile_file >> j;
      my_info_ = InfoFromJson(j);
    } catch (const std::exception &e) {
      LOG_APP_ERROR("ProfileStore: failed to parse {}: {}",
                    profile_path_.string(), e.what());
      return false;
    }
  }

  std::ifstream contacts_file(contacts_path_);
  if (!contacts_file.is_open()) {
    LOG_DEBUG("ProfileStore: no contacts at {}", contacts_path_.string());
    return true; // first run
  }

  try {
    json j;
    contacts_file >> j;

    size_t skipped = 0;
    for (const auto &[key, entry] : j.items()) {
      auto raw = util::ParseHex(key);
      if (!raw || raw->size() != protocol::PUBLIC_KEY_SIZE) {
        skipped++;
        continue;
      }
      Contact contact;
      if (entry.contains("profile")) {
        contact.info = InfoFromJson(entry["profile"]);
      }
      contact.updated = entry.value("updated", int64_t(0));
      contact.addresses =
          entry.value("addresses", std::vector<std::string>{});
      contacts_[util::HexStr(*raw)] = std::move(contact);
    }

    LOG_DEBUG("ProfileStore: loaded {} contacts (skipped {})", contacts_.size(),
              skipped);
    return true;
  } catch (const std::exception &e) {
    LOG_APP_ERROR("ProfileStore: failed to parse {}: {}",
                  contacts_path_.string(), e.what());
    return false;
  }
}

bool ProfileStore::SetMyInfo(const std::string &nickname,
                             const std::string &info) {
  if (nickname.size() > protocol::MAX_NICKNAME_LENGTH ||
      info.size() > protocol::MAX_INFO_LENGTH) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (my_info_.nickname == nickname && my_info_.info == info) {
    return true;
  }
  my_info_.nickname = nickname;
  my_info_.info = info;
  my_info_.time = util::GetTimeMillis();
  return SaveProfileInternal();
}

bool ProfileStore::RememberAddress(const network::PeerKey &peer,
                                   const std::string &address) {
  if (address.empty()) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto &addresses = contacts_[util::HexStr(peer)].addresses;

  if (!addresses.empty() && addresses.front() == address) {
    return true;
  }
  addresses.erase(std::remove(addresses.begin(), addresses.end(), address),
                  addresses.end());
  addresses.insert(addresses.begin(), address);
  if (addresses.size() > MAX_ADDRESSES) {
    addresses.resize(MAX_ADDRESSES);
  }
  return SaveContactsInternal();
}

std::optional<ProfileStore::Contact>
ProfileStore::GetContact(const network::PeerKey &peer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = contacts_.find(util::HexStr(peer));
  if (it == contacts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::map<std::string, ProfileStore::Contact> ProfileStore::GetContacts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return contacts_;
}

network::ContactInfo ProfileStore::GetMyInfo() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return my_info_;
}

std::string ProfileStore::get_files_directory() { return files_dir_.string(); }

int64_t ProfileStore::get_contact_update_time(const network::PeerKey &peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = contacts_.find(util::HexStr(peer));
  return it == contacts_.end() ? 0 : it->second.updated;
}

std::optional<network::ContactInfo> ProfileStore::get_my_info(int64_t since) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (my_info_.time <= since) {
    return std::nullopt;
  }
  return my_info_;
}

void ProfileStore::update_contact_info(const network::PeerKey &peer,
                                       const network::ContactInfo &info) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &contact = contacts_[util::HexStr(peer)];
  contact.info = info;
  contact.updated = util::GetTimeMillis();
  if (!SaveContactsInternal()) {
    LOG_APP_WARN("ProfileStore: profile of {} kept in memory only",
                 util::HexStr(peer));
  }
}

bool ProfileStore::SaveProfileInternal() {
  try {
    std::string data = InfoToJson(my_info_).dump(2);
    if (!util::atomic_write_file(profile_path_, data, 0600)) {
      LOG_APP_ERROR("ProfileStore: failed to save {}", profile_path_.string());
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    // dump() throws on invalid UTF-8
    LOG_APP_ERROR("ProfileStore: failed to save {}: {}",
                  profile_path_.string(), e.what());
    return false;
  }
}

bool ProfileStore::SaveContactsInternal() {
  try {
    json j = json::object();
    for (const auto &[key, contact] : contacts_) {
      j[key] = {{"profile", InfoToJson(contact.info)},
                {"updated", contact.updated},
                {"addresses", contact.addresses}};
    }

    std::string data = j.dump(2);
    if (!util::atomic_write_file(contacts_path_, data, 0600)) {
      LOG_APP_ERROR("ProfileStore: failed to save {}", contacts_path_.string());
      return false;
    }
    LOG_DEBUG("ProfileStore: saved {} contacts", contacts_.size());
    return true;
  } catch (const std::exception &e) {
    LOG_APP_ERROR("ProfileStore: failed to save {}: {}",
                  contacts_path_.string(), e.what());
    return false;
  }
}

} // namespace app
} // namespace parley
