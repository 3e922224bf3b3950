// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace signage {
namespace util {

namespace fs = std::filesystem;

/**
 * Exclusive advisory lock on a file (POSIX fcntl, Linux/macOS).
 * The lock is released when the object is destroyed.
 */
class FileLock {
public:
  explicit FileLock(const fs::path& file);
  ~FileLock();

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  // Try to acquire the lock without blocking
  bool TryLock();

  bool is_open() const { return fd_ != -1; }
  const std::string& reason() const { return reason_; }

  // Replace the file contents (the owner's pid, for operators)
  bool WriteContents(const std::string& contents);

private:
  std::string reason_;
  int fd_{-1};
};

enum class LockResult {
  Success,
  ErrorWrite,  // lock file could not be created
  ErrorLock,   // another process holds it
};

// Lock a data directory for the lifetime of the process (or until
// UnlockDirectory). Locking a directory this process already holds succeeds.
LockResult LockDirectory(const fs::path& directory, const std::string& lockfile_name = ".lock");

void UnlockDirectory(const fs::path& directory, const std::string& lockfile_name = ".lock");

}  // namespace util
}  // namespace signage
