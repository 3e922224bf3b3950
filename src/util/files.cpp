// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace signage {
namespace util {

namespace {

bool sync_fd(int fd) {
#if defined(__APPLE__)
  // fsync() on macOS does not flush the drive cache
  return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
  return fsync(fd) == 0;
#endif
}

bool sync_directory(const std::filesystem::path& dir) {
#if defined(__APPLE__)
  int fd = open(dir.c_str(), O_RDONLY);
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#endif
  if (fd < 0)
    return false;
  bool ok = sync_fd(fd);
  close(fd);
  return ok;
}

std::filesystem::path temp_path_for(const std::filesystem::path& path) {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
  auto temp = path;
  temp += ".tmp.";
  temp += buf;
  return temp;
}

// Opens a fresh temp file next to path. O_EXCL|O_NOFOLLOW so a pre-planted
// file or symlink makes the write fail instead of being followed.
int open_temp(const std::filesystem::path& temp, int mode) {
  return open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, mode);
}

bool write_all(int fd, const char* data, size_t size) {
  size_t total = 0;
  while (total < size) {
    ssize_t n = write(fd, data + total, size - total);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      return false;
    total += static_cast<size_t>(n);
  }
  return true;
}

// Syncs and renames temp over path. Cleans up temp on failure.
bool commit_temp(int fd, const std::filesystem::path& temp, const std::filesystem::path& path) {
  if (!sync_fd(fd)) {
    LOG_ERROR("atomic write: fsync failed for {}: {}", temp.string(), std::strerror(errno));
    close(fd);
    std::filesystem::remove(temp);
    return false;
  }
  close(fd);

  std::error_code ec;
  std::filesystem::rename(temp, path, ec);
  if (ec) {
    LOG_ERROR("atomic write: rename {} -> {} failed: {}", temp.string(), path.string(), ec.message());
    std::filesystem::remove(temp, ec);
    return false;
  }

  auto parent = path.parent_path();
  if (!parent.empty() && !sync_directory(parent)) {
    // Data is in place; only durability of the rename is uncertain
    LOG_WARN("atomic write: fsync of directory {} failed: {}", parent.string(), std::strerror(errno));
  }
  return true;
}

}  // namespace

bool atomic_write_file(const std::filesystem::path& path, std::string_view data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: cannot create directory {}", parent.string());
    return false;
  }

  auto temp = temp_path_for(path);
  int fd = open_temp(temp, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: cannot create {}: {} (errno={})", temp.string(), std::strerror(errno), errno);
    return false;
  }

  if (!write_all(fd, data.data(), data.size())) {
    LOG_ERROR("atomic_write_file: write to {} failed: {} (errno={})", temp.string(), std::strerror(errno), errno);
    close(fd);
    std::filesystem::remove(temp);
    return false;
  }

  return commit_temp(fd, temp, path);
}

bool atomic_copy_file(const std::filesystem::path& src, const std::filesystem::path& dst, int mode) {
  std::ifstream in(src, std::ios::binary);
  if (!in) {
    LOG_ERROR("atomic_copy_file: cannot open {}", src.string());
    return false;
  }

  auto parent = dst.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_copy_file: cannot create directory {}", parent.string());
    return false;
  }

  auto temp = temp_path_for(dst);
  int fd = open_temp(temp, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_copy_file: cannot create {}: {}", temp.string(), std::strerror(errno));
    return false;
  }

  std::vector<char> chunk(64 * 1024);
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    std::streamsize got = in.gcount();
    if (got > 0 && !write_all(fd, chunk.data(), static_cast<size_t>(got))) {
      LOG_ERROR("atomic_copy_file: write to {} failed: {}", temp.string(), std::strerror(errno));
      close(fd);
      std::filesystem::remove(temp);
      return false;
    }
  }
  if (in.bad()) {
    LOG_ERROR("atomic_copy_file: read from {} failed", src.string());
    close(fd);
    std::filesystem::remove(temp);
    return false;
  }

  return commit_temp(fd, temp, dst);
}

std::optional<std::vector<uint8_t>> read_file_bytes(const std::filesystem::path& path, size_t max_size) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_DEBUG("read_file: cannot stat {}: {}", path.string(), ec.message());
    return std::nullopt;
  }
  if (size > max_size) {
    LOG_ERROR("read_file: {} is {} bytes, limit is {}", path.string(), size, max_size);
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    LOG_ERROR("read_file: cannot open {}: {}", path.string(), std::strerror(errno));
    return std::nullopt;
  }

  std::vector<uint8_t> data(size);
  file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
  if (!file) {
    LOG_ERROR("read_file: short read on {}", path.string());
    return std::nullopt;
  }
  return data;
}

std::optional<std::string> read_file_string(const std::filesystem::path& path, size_t max_size) {
  auto bytes = read_file_bytes(path, max_size);
  if (!bytes) {
    return std::nullopt;
  }
  return std::string(bytes->begin(), bytes->end());
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::is_directory(dir);
}

std::filesystem::path get_default_datadir() {
  const char* home = std::getenv("HOME");
  if (!home || *home == '\0') {
    LOG_ERROR("get_default_datadir: HOME is not set; use --datadir");
    return {};
  }
#if defined(__APPLE__)
  return std::filesystem::path(home) / "Library" / "Application Support" / "Signage";
#else
  return std::filesystem::path(home) / ".signage";
#endif
}

std::string get_hostname() {
  char buf[256] = {};
  if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
    return "signage";
  }
  return std::string(buf);
}

}  // namespace util
}  // namespace signage
