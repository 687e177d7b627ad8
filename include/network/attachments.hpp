#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace parley {
namespace network {

/**
 * Media attachments (IMAGE and FILE messages)
 *
 * Locally a message carries only JSON metadata whose "name" field refers to
 * a file in the files directory. On the wire the file travels with it:
 *
 *   [u32 json_size][json][file bytes]
 */

// Text delivered in place of an attachment that could not be decoded
constexpr const char *CORRUPTED_ATTACHMENT_TEXT = "<Message data corrupted>";

// Build the wire form. nullopt if files_dir is empty, the JSON is invalid
// or has no "name", or the file cannot be read.
std::optional<std::vector<uint8_t>>
pack_attachment(const std::vector<uint8_t> &metadata,
                const std::filesystem::path &files_dir);

// Store the embedded file under a fresh random name and return the JSON to
// deliver, with "name" rewritten. Malformed input or an empty files_dir
// yields placeholder JSON {"text":"<Message data corrupted>","name":""}.
std::vector<uint8_t> unpack_attachment(int32_t content_type,
                                       const std::vector<uint8_t> &wire,
                                       const std::filesystem::path &files_dir);

// ".jpg", ".png", ".gif", ".webp" from magic bytes, "" if unrecognized
std::string image_extension(const std::vector<uint8_t> &data, size_t offset = 0);

} // namespace network
} // namespace parley
