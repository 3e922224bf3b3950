// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signage {
namespace util {

// Write data to path atomically: temp file in the same directory, fsync,
// rename over the target, fsync the directory. Returns false on any failure
// (the target is left untouched).
bool atomic_write_file(const std::filesystem::path& path, std::string_view data, int mode = 0644);

// Copy src to dst atomically (streamed, never fully buffered in memory).
bool atomic_copy_file(const std::filesystem::path& src, const std::filesystem::path& dst, int mode = 0644);

// Read a whole file. Returns std::nullopt if it cannot be read or is larger than max_size.
std::optional<std::string> read_file_string(const std::filesystem::path& path,
                                            size_t max_size = 16 * 1024 * 1024);

// Binary variant of read_file_string.
std::optional<std::vector<uint8_t>> read_file_bytes(const std::filesystem::path& path,
                                                    size_t max_size = 16 * 1024 * 1024);

// Create directory (and parents). Returns true if it exists afterwards.
bool ensure_directory(const std::filesystem::path& dir);

// ~/.signage on Linux, ~/Library/Application Support/Signage on macOS.
// Empty path if HOME is not set.
std::filesystem::path get_default_datadir();

// Host name used as the default display name ("signage" if unavailable).
std::string get_hostname();

}  // namespace util
}  // namespace signage
