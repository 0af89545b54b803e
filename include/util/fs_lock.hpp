// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_UTIL_FS_LOCK_HPP
#define CODL3_UTIL_FS_LOCK_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace codl3 {
namespace util {

namespace fs = std::filesystem;

enum class LockResult {
  Success,
  ErrorWrite, // Could not create or write the lock file
  ErrorLock,  // Another node holds the lock
};

// Node recorded in a held lock file
struct LockOwner {
  pid_t pid{0};
  std::string chain;
};

/**
 * DataDirLock - Exclusive lock on a node data directory
 *
 * Holds flock(LOCK_EX) on `<datadir>/.lock` and records the owning PID and
 * chain in the file, so a second node pointed at the same directory can
 * report who is using it. Each open descriptor is a separate lock, so two
 * instances in one process also exclude each other.
 *
 * Released on Release() or destruction. The file itself is left behind
 * empty.
 */
class DataDirLock {
public:
  static constexpr const char *LOCK_FILE_NAME = ".lock";

  explicit DataDirLock(fs::path datadir);
  ~DataDirLock();

  DataDirLock(const DataDirLock &) = delete;
  DataDirLock &operator=(const DataDirLock &) = delete;

  LockResult Acquire(const std::string &chain);
  void Release();

  bool IsHeld() const { return fd_ != -1; }
  const fs::path &GetPath() const { return path_; }

  // Last OS error from Acquire
  const std::string &GetReason() const { return reason_; }

  // Owner of the lock when Acquire returned ErrorLock
  const std::optional<LockOwner> &GetHolder() const { return holder_; }

  // Parse "<pid> <chain>" from a lock file; nullopt when empty or malformed
  static std::optional<LockOwner> ReadOwner(const fs::path &lockfile);

private:
  fs::path path_;
  int fd_{-1};
  std::string reason_;
  std::optional<LockOwner> holder_;
};

} // namespace util
} // namespace codl3

#endif // CODL3_UTIL_FS_LOCK_HPP
