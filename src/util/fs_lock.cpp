// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

namespace codl3 {
namespace util {

DataDirLock::DataDirLock(fs::path datadir)
    : path_(std::move(datadir) / LOCK_FILE_NAME) {}

DataDirLock::~DataDirLock() { Release(); }

LockResult DataDirLock::Acquire(const std::string &chain) {
  if (IsHeld()) {
    return LockResult::Success;
  }
  holder_.reset();

  int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    reason_ = std::strerror(errno);
    LOG_APP_ERROR("Failed to open lock file {}: {}", path_.string(), reason_);
    return LockResult::ErrorWrite;
  }

  if (flock(fd, LOCK_EX | LOCK_NB) == -1) {
    const int err = errno;
    reason_ = std::strerror(err);
    close(fd);
    if (err != EWOULDBLOCK) {
      LOG_APP_ERROR("Failed to lock {}: {}", path_.string(), reason_);
      return LockResult::ErrorWrite;
    }
    holder_ = ReadOwner(path_);
    return LockResult::ErrorLock;
  }

  const std::string owner =
      std::to_string(getpid()) + " " + chain + "\n";
  if (ftruncate(fd, 0) == -1 ||
      pwrite(fd, owner.data(), owner.size(), 0) !=
          static_cast<ssize_t>(owner.size())) {
    reason_ = std::strerror(errno);
    LOG_APP_ERROR("Failed to record owner in {}: {}", path_.string(), reason_);
    close(fd);
    return LockResult::ErrorWrite;
  }

  fd_ = fd;
  LOG_APP_DEBUG("Locked {} (pid {}, chain {})", path_.string(), getpid(),
                chain);
  return LockResult::Success;
}

void DataDirLock::Release() {
  if (!IsHeld()) {
    return;
  }
  // Clear the owner record before dropping the lock
  if (ftruncate(fd_, 0) == -1) {
    LOG_APP_WARN("Failed to clear {}: {}", path_.string(),
                 std::strerror(errno));
  }
  close(fd_);
  fd_ = -1;
}

std::optional<LockOwner> DataDirLock::ReadOwner(const fs::path &lockfile) {
  std::ifstream in(lockfile);
  LockOwner owner;
  long long pid = 0;
  if (!(in >> pid >> owner.chain) || pid <= 0) {
    return std::nullopt;
  }
  owner.pid = static_cast<pid_t>(pid);
  return owner;
}

} // namespace util
} // namespace codl3
