// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "addon/addon.hpp"

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace signage {
namespace addons {

// Clock overlay. The display-side script does the drawing; this side keeps
// the effective config and serves font files as data: URLs.
class DateTimeAddon : public addon::Addon {
public:
  explicit DateTimeAddon(addon::AddonHost& host);

  void Init(const nlohmann::json& config) override;
  void UpdateConfig(const nlohmann::json& config) override;
  void Stop() override;

  std::optional<std::string> FrontendScript() const override;
  std::optional<std::string> AssetData(const std::string& name) const override;

  const nlohmann::json& config() const { return config_; }

private:
  addon::AddonHost& host_;
  nlohmann::json config_;
  mutable std::map<std::string, std::string> font_cache_;
};

}  // namespace addons
}  // namespace signage
