#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace parley {
namespace util {

/**
 * Crash-safe file replacement
 *
 * Writes to "<path>.tmp.<random>", fsyncs the file and its directory, then
 * renames over the target. Readers observe either the old or the new
 * content, never a partial write.
 *
 * @param mode permissions for a newly created file (0600 for key material)
 * @return false on any I/O failure; the temporary file is removed
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data, int mode = 0644);

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into vector
 * Returns empty vector on failure or if the file exceeds max_size
 */
std::vector<uint8_t> read_file(const std::filesystem::path &path,
                               size_t max_size = 64 * 1024 * 1024);

/**
 * Read entire file into string
 * Returns empty string on failure
 */
std::string read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Random [a-z0-9] name used for stored attachments
 */
std::string random_file_name(size_t length);

/**
 * ~/.parley, or ./.parley when HOME is unset
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace parley
