// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

// Header-only so plugin modules can use it without linking the host library.

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

namespace signage {
namespace addon {

inline constexpr size_t kMaxFontFileSize = 16 * 1024 * 1024;

inline std::string Base64Encode(const std::string& in) {
  static const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((in.size() + 2) / 3) * 4);
  size_t i = 0;
  for (; i + 2 < in.size(); i += 3) {
    uint32_t n = (uint8_t(in[i]) << 16) | (uint8_t(in[i + 1]) << 8) | uint8_t(in[i + 2]);
    out += kAlphabet[(n >> 18) & 63];
    out += kAlphabet[(n >> 12) & 63];
    out += kAlphabet[(n >> 6) & 63];
    out += kAlphabet[n & 63];
  }
  if (i + 1 == in.size()) {
    uint32_t n = uint8_t(in[i]) << 16;
    out += kAlphabet[(n >> 18) & 63];
    out += kAlphabet[(n >> 12) & 63];
    out += "==";
  } else if (i + 2 == in.size()) {
    uint32_t n = (uint8_t(in[i]) << 16) | (uint8_t(in[i + 1]) << 8);
    out += kAlphabet[(n >> 18) & 63];
    out += kAlphabet[(n >> 12) & 63];
    out += kAlphabet[(n >> 6) & 63];
    out += '=';
  }
  return out;
}

// MIME type for a font file name, nullopt if it is not a font
inline std::optional<std::string> FontMimeType(const std::string& filename) {
  std::string ext = std::filesystem::path(filename).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  if (ext == ".ttf")
    return "font/ttf";
  if (ext == ".otf")
    return "font/otf";
  if (ext == ".woff")
    return "font/woff";
  if (ext == ".woff2")
    return "font/woff2";
  return std::nullopt;
}

// data: URL for a font in fonts_dir. Rejects names with a directory part.
inline std::optional<std::string> ReadFontDataUrl(const std::filesystem::path& fonts_dir, const std::string& name) {
  if (name.empty() || std::filesystem::path(name).filename().string() != name || name == "." || name == "..") {
    return std::nullopt;
  }
  auto mime = FontMimeType(name);
  if (!mime) {
    return std::nullopt;
  }

  std::error_code ec;
  const auto path = fonts_dir / name;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size > kMaxFontFileSize) {
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return "data:" + *mime + ";base64," + Base64Encode(data);
}

}  // namespace addon
}  // namespace signage
