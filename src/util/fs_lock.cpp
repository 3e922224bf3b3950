// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "util/fs_lock.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>

#include <fcntl.h>
#include <unistd.h>

namespace signage {
namespace util {

namespace {

std::mutex g_dir_locks_mutex;
std::map<std::string, std::unique_ptr<FileLock>> g_dir_locks;  // key: lock file path

}  // namespace

FileLock::FileLock(const fs::path& file) {
  // O_CLOEXEC keeps the lock from leaking into the restart/update helpers
  fd_ = open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }

  struct flock lock;
  std::memset(&lock, 0, sizeof(lock));
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0;

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    return false;
  }
  return true;
}

bool FileLock::WriteContents(const std::string& contents) {
  if (fd_ == -1 || ftruncate(fd_, 0) != 0) {
    return false;
  }
  return pwrite(fd_, contents.data(), contents.size(), 0) == static_cast<ssize_t>(contents.size());
}

LockResult LockDirectory(const fs::path& directory, const std::string& lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  const fs::path lockfile_path = directory / lockfile_name;
  if (g_dir_locks.count(lockfile_path.string())) {
    return LockResult::Success;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile_path);
  if (!file_lock->is_open()) {
    LOG_APP_ERROR("Failed to open lock file {}: {}", lockfile_path.string(), file_lock->reason());
    return LockResult::ErrorWrite;
  }
  if (!file_lock->TryLock()) {
    LOG_APP_ERROR("Failed to lock directory {}: {}", directory.string(), file_lock->reason());
    return LockResult::ErrorLock;
  }
  if (!file_lock->WriteContents(std::to_string(getpid()) + "\n")) {
    LOG_APP_WARN("Could not record pid in {}", lockfile_path.string());
  }

  g_dir_locks.emplace(lockfile_path.string(), std::move(file_lock));
  LOG_APP_DEBUG("Acquired directory lock: {}", directory.string());
  return LockResult::Success;
}

void UnlockDirectory(const fs::path& directory, const std::string& lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  if (g_dir_locks.erase((directory / lockfile_name).string()) > 0) {
    LOG_APP_DEBUG("Released directory lock: {}", directory.string());
  }
}

}  // namespace util
}  // namespace signage
