// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace parley {
namespace util {

namespace fs = std::filesystem;

/**
 * Result of directory lock attempt
 */
enum class LockResult {
  Success,    // Lock acquired
  ErrorWrite, // Could not create lock file
  ErrorLock,  // Lock already held by another process
};

/**
 * DirectoryLock - exclusive fcntl() lock on <directory>/<name>
 *
 * Held for the lifetime of the object, so two daemons never share one
 * identity key and contact store. Closing the descriptor releases the lock.
 */
class DirectoryLock {
public:
  explicit DirectoryLock(const fs::path &directory,
                         const std::string &lockfile_name = ".lock");
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;

  LockResult result() const { return result_; }
  bool locked() const { return result_ == LockResult::Success; }

  // strerror() text of the failure, empty on success
  const std::string &reason() const { return reason_; }

private:
  int fd_{-1};
  LockResult result_{LockResult::ErrorWrite};
  std::string reason_;
};

} // namespace util
} // namespace parley
