// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace torlink {
namespace util {

enum class LockResult {
  Success,
  // Lock file could not be created
  ErrorWrite,
  // Another process holds the lock
  ErrorLock,
};

const char *LockResultAsString(LockResult result);

/**
 * DirectoryLock - exclusive fcntl() lock on <dir>/<name>
 *
 * Keeps one torlinkd instance per data directory. The lock is held until
 * release() or destruction; closing the descriptor drops it.
 *
 *   DirectoryLock lock(datadir);
 *   if (lock.acquire() != LockResult::Success) { ... lock.reason() ... }
 */
class DirectoryLock {
public:
  explicit DirectoryLock(std::filesystem::path directory,
                         std::string lockfile_name = ".lock");
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;

  // Re-acquiring a held lock returns Success
  LockResult acquire();
  void release();

  bool held() const { return fd_ != -1; }
  const std::string &reason() const { return reason_; }
  std::filesystem::path path() const { return directory_ / lockfile_name_; }

private:
  std::filesystem::path directory_;
  std::string lockfile_name_;
  std::string reason_;
  int fd_{-1};
};

} // namespace util
} // namespace torlink
