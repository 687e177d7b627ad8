#include "network/attachments.hpp"
#include "network/protocol.hpp"
#include "util/endian.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <cctype>
#include <nlohmann/json.hpp>

namespace parley {
namespace network {

using json = nlohmann::json;

namespace {

std::vector<uint8_t> CorruptedPlaceholder() {
  json j = {{"text", CORRUPTED_ATTACHMENT_TEXT}, {"name", ""}};
  std::string s = j.dump();
  return std::vector<uint8_t>(s.begin(), s.end());
}

bool StartsWith(const std::vector<uint8_t> &data, size_t offset,
                std::initializer_list<uint8_t> magic) {
  if (data.size() < offset + magic.size()) {
    return false;
  }
  size_t i = offset;
  for (uint8_t b : magic) {
    if (data[i++] != b) {
      return false;
    }
  }
  return true;
}

// Extension of originalName, restricted to a short alphanumeric suffix
std::string FileExtension(const json &meta) {
  if (!meta.contains("originalName") || !meta["originalName"].is_string()) {
    return "";
  }
  std::string ext =
      std::filesystem::path(meta["originalName"].get<std::string>())
          .extension()
          .string();
  if (ext.size() < 2 || ext.size() > 10) {
    return "";
  }
  for (size_t i = 1; i < ext.size(); ++i) {
    if (!std::isalnum(static_cast<unsigned char>(ext[i]))) {
      return "";
    }
  }
  return ext;
}

} // namespace

std::string image_extension(const std::vector<uint8_t> &data, size_t offset) {
  if (StartsWith(data, offset, {0xFF, 0xD8, 0xFF}))
    return ".jpg";
  if (StartsWith(data, offset, {0x89, 'P', 'N', 'G'}))
    return ".png";
  if (StartsWith(data, offset, {'G', 'I', 'F', '8'}))
    return ".gif";
  if (StartsWith(data, offset, {'R', 'I', 'F', 'F'}) &&
      StartsWith(data, offset + 8, {'W', 'E', 'B', 'P'}))
    return ".webp";
  return "";
}

std::optional<std::vector<uint8_t>>
pack_attachment(const std::vector<uint8_t> &metadata,
                const std::filesystem::path &files_dir) {
  // An empty path would resolve against the working directory
  if (files_dir.empty()) {
    LOG_NET_WARN("no files directory configured, attachment not sent");
    return std::nullopt;
  }

  json meta = json::parse(metadata.begin(), metadata.end(), nullptr, false);
  if (meta.is_discarded() || !meta.is_object() || !meta.contains("name") ||
      !meta["name"].is_string()) {
    LOG_NET_WARN("attachment metadata is not valid JSON with a name");
    return std::nullopt;
  }

  // Only plain names: never read outside the files directory
  std::filesystem::path name(meta["name"].get<std::string>());
  if (name.empty() || name.has_parent_path() || name == "." || name == "..") {
    LOG_NET_WARN("attachment name rejected: {}", name.string());
    return std::nullopt;
  }

  auto path = files_dir / name;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    LOG_NET_WARN("attachment file missing: {}", path.string());
    return std::nullopt;
  }
  auto file = util::read_file(path, protocol::MAX_PROTOCOL_MESSAGE_LENGTH);
  if (file.empty()) {
    LOG_NET_WARN("attachment file unreadable or too large: {}", path.string());
    return std::nullopt;
  }

  std::vector<uint8_t> wire(4);
  util::WriteBE32(wire.data(), static_cast<uint32_t>(metadata.size()));
  wire.insert(wire.end(), metadata.begin(), metadata.end());
  wire.insert(wire.end(), file.begin(), file.end());
  return wire;
}

std::vector<uint8_t> unpack_attachment(int32_t content_type,
                                       const std::vector<uint8_t> &wire,
                                       const std::filesystem::path &files_dir) {
  if (files_dir.empty()) {
    LOG_NET_WARN("no files directory configured, attachment discarded");
    return CorruptedPlaceholder();
  }
  if (wire.size() < 4) {
    LOG_NET_WARN("attachment too short ({} bytes)", wire.size());
    return CorruptedPlaceholder();
  }
  uint32_t json_size = util::ReadBE32(wire.data());
  if (json_size > wire.size() - 4) {
    LOG_NET_WARN("attachment JSON size {} exceeds payload", json_size);
    return CorruptedPlaceholder();
  }

  auto json_begin = wire.begin() + 4;
  auto json_end = json_begin + json_size;
  json meta = json::parse(json_begin, json_end, nullptr, false);
  if (meta.is_discarded() || !meta.is_object()) {
    LOG_NET_WARN("attachment metadata is not a JSON object");
    return CorruptedPlaceholder();
  }

  size_t file_offset = 4 + json_size;
  std::string ext = content_type == protocol::content::IMAGE
                        ? image_extension(wire, file_offset)
                        : FileExtension(meta);
  if (content_type == protocol::content::IMAGE && ext.empty()) {
    ext = ".jpg";
  }

  if (!util::ensure_directory(files_dir)) {
    LOG_NET_ERROR("cannot create files directory {}", files_dir.string());
    return CorruptedPlaceholder();
  }

  std::string name =
      util::random_file_name(protocol::ATTACHMENT_NAME_LENGTH) + ext;
  std::vector<uint8_t> file(wire.begin() + static_cast<std::ptrdiff_t>(file_offset),
                            wire.end());
  if (!util::atomic_write_file(files_dir / name, file)) {
    LOG_NET_ERROR("cannot store attachment {}", name);
    return CorruptedPlaceholder();
  }

  meta["name"] = name;
  LOG_NET_DEBUG("stored attachment {} ({} bytes)", name, file.size());
  std::string out = meta.dump();
  return std::vector<uint8_t>(out.begin(), out.end());
}

} // namespace network
} // namespace parley
