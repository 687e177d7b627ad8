// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace parley {
namespace util {

DirectoryLock::DirectoryLock(const fs::path &directory,
                             const std::string &lockfile_name) {
  fs::path path = directory / lockfile_name;

  // O_CREAT: no separate create step, so no TOCTOU window
  // O_CLOEXEC: children must not inherit the lock
  fd_ = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
    result_ = LockResult::ErrorWrite;
    return;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // whole file

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    result_ = LockResult::ErrorLock;
    close(fd_);
    fd_ = -1;
    return;
  }

  LOG_DEBUG("locked {}", path.string());
  result_ = LockResult::Success;
}

DirectoryLock::~DirectoryLock() {
  if (fd_ != -1) {
    close(fd_);
  }
}

} // namespace util
} // namespace parley
