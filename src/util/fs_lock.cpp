// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace torlink {
namespace util {

const char *LockResultAsString(LockResult result) {
  switch (result) {
  case LockResult::Success:
    return "success";
  case LockResult::ErrorWrite:
    return "cannot create lock file";
  case LockResult::ErrorLock:
    return "already locked";
  }
  return "unknown";
}

DirectoryLock::DirectoryLock(std::filesystem::path directory,
                             std::string lockfile_name)
    : directory_(std::move(directory)),
      lockfile_name_(std::move(lockfile_name)) {}

DirectoryLock::~DirectoryLock() { release(); }

LockResult DirectoryLock::acquire() {
  if (fd_ != -1) {
    return LockResult::Success;
  }

  const auto file = path();
  // O_CLOEXEC keeps child processes from inheriting the lock
  int fd = ::open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    reason_ = std::strerror(errno);
    LOG_ERROR("Failed to open lock file {}: {}", file.string(), reason_);
    return LockResult::ErrorWrite;
  }

  struct flock lock {};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0;
  if (::fcntl(fd, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    ::close(fd);
    LOG_ERROR("Failed to lock directory {}: {}", directory_.string(), reason_);
    return LockResult::ErrorLock;
  }

  fd_ = fd;
  LOG_TRACE("Acquired directory lock: {}", directory_.string());
  return LockResult::Success;
}

void DirectoryLock::release() {
  if (fd_ == -1) {
    return;
  }
  ::close(fd_);
  fd_ = -1;
  LOG_TRACE("Released directory lock: {}", directory_.string());
}

} // namespace util
} // namespace torlink
