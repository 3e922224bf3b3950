// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "datetime/datetime_addon.hpp"

#include "addon/font_data.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace signage {
namespace addons {

namespace {

constexpr size_t kMaxScriptSize = 4 * 1024 * 1024;

const char* const kFontsReadme =
    "Fonts Directory\n"
    "===============\n\n"
    "Shared by all addons that offer a font setting.\n"
    "Place .ttf, .otf, .woff or .woff2 files here, then reload addons.\n";

}  // namespace

DateTimeAddon::DateTimeAddon(addon::AddonHost& host) : host_(host), config_(nlohmann::json::object()) {}

void DateTimeAddon::Init(const nlohmann::json& config) {
  config_ = config;

  const auto fonts_dir = host_.fonts_dir();
  std::error_code ec;
  if (!fonts_dir.empty() && !std::filesystem::exists(fonts_dir, ec)) {
    if (std::filesystem::create_directories(fonts_dir, ec)) {
      std::ofstream(fonts_dir / "README.txt") << kFontsReadme;
      host_.logger()->info("created fonts directory {}", fonts_dir.string());
    } else {
      host_.logger()->warn("cannot create fonts directory {}: {}", fonts_dir.string(), ec.message());
    }
  }

  host_.logger()->info("clock overlay ready (font={}, style={})", config_.value("font", "default"),
                       config_.value("style", "static"));
}

void DateTimeAddon::UpdateConfig(const nlohmann::json& config) {
  for (const char* key : {"font", "fontSize", "dateSeparator", "timeSeparator", "style"}) {
    auto before = config_.find(key);
    auto after = config.find(key);
    if (after != config.end() && (before == config_.end() || *before != *after)) {
      host_.logger()->debug("{} changed to {}", key, after->dump());
    }
  }
  config_ = config;
}

void DateTimeAddon::Stop() {
  font_cache_.clear();
}

std::optional<std::string> DateTimeAddon::FrontendScript() const {
  const auto path = host_.addon_dir() / "frontend.js";
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size > kMaxScriptSize) {
    host_.logger()->warn("frontend script {} unavailable", path.string());
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  std::string script((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return addon::WrapFrontendScript(config_, script);
}

std::optional<std::string> DateTimeAddon::AssetData(const std::string& name) const {
  if (auto it = font_cache_.find(name); it != font_cache_.end()) {
    return it->second;
  }
  auto url = addon::ReadFontDataUrl(host_.fonts_dir(), name);
  if (!url) {
    host_.logger()->warn("font '{}' not found in {}", name, host_.fonts_dir().string());
    return std::nullopt;
  }
  font_cache_.emplace(name, *url);
  return url;
}

}  // namespace addons
}  // namespace signage
