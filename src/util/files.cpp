#include "util/files.hpp"
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <unistd.h>

namespace parley {
namespace util {

namespace {

bool sync_directory(const std::filesystem::path &dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

std::mt19937 &thread_rng() {
  static thread_local std::mt19937 gen(std::random_device{}());
  return gen;
}

std::string random_suffix() {
  std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(thread_rng()));
  return std::string(buf);
}

bool write_all(int fd, const uint8_t *data, size_t size) {
  size_t total = 0;
  while (total < size) {
    ssize_t n = write(fd, data + total, size - total);
    if (n <= 0) {
      return false;
    }
    total += static_cast<size_t>(n);
  }
  return true;
}

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  std::error_code ec;
  if (!write_all(fd, data.data(), data.size()) || fsync(fd) != 0) {
    close(fd);
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  close(fd);

  if (!parent.empty() && !sync_directory(parent)) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  return true;
}

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  std::vector<uint8_t> vec(data.begin(), data.end());
  return atomic_write_file(path, vec, mode);
}

std::vector<uint8_t> read_file(const std::filesystem::path &path,
                               size_t max_size) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    return {};
  }

  std::streampos pos = file.tellg();
  if (pos == std::streampos(-1)) {
    return {};
  }
  auto size = static_cast<std::streamsize>(pos);
  if (size < 0 || static_cast<size_t>(size) > max_size) {
    return {};
  }

  std::vector<uint8_t> data(static_cast<size_t>(size));
  file.seekg(0);
  file.read(reinterpret_cast<char *>(data.data()), size);
  if (!file) {
    return {};
  }
  return data;
}

std::string read_file_string(const std::filesystem::path &path) {
  auto data = read_file(path);
  return std::string(data.begin(), data.end());
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

std::string random_file_name(size_t length) {
  static constexpr char kChars[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::uniform_int_distribution<size_t> dis(0, sizeof(kChars) - 2);
  std::string name;
  name.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    name.push_back(kChars[dis(thread_rng())]);
  }
  return name;
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".parley";
  }
  return std::filesystem::current_path() / ".parley";
}

} // namespace util
} // namespace parley
