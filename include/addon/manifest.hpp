// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

/*
 Addon manifest (addon.json)

 {
   "info": {"name": "Date/Time Display", "version": "1.1.0", "author": "...",
            "description": "...", "category": "Display"},
   "settings": [
     {"id": "fontSize", "type": "range", "name": "Font Size", "min": 12, "max": 120, "default": 24, "unit": "px"},
     {"id": "font", "type": "select", "name": "Font", "optionsFrom": "fonts", "default": "default"},
     ...
   ],
   "module": "libsignage_datetime.so",   (optional, native plugin)
   "frontend": "frontend.js"             (optional, display-side script)
 }

 The addon id is the name of the directory holding addon.json.
*/

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace signage {
namespace addon {

inline constexpr const char* kManifestFileName = "addon.json";

struct AddonInfo {
  std::string name;
  std::string version;
  std::string author;
  std::string description;
  std::string category;
};

struct BooleanSetting {};

struct TextSetting {
  std::string placeholder;
};

struct ColorSetting {};

struct RangeSetting {
  double min{0};
  double max{0};
  double step{1};
  std::string unit;
};

struct SelectOption {
  std::string value;
  std::string label;
};

struct SelectSetting {
  std::vector<SelectOption> options;
  // "fonts": options are filled from the fonts directory at scan time
  std::string options_from;
};

using SettingConstraints = std::variant<BooleanSetting, TextSetting, ColorSetting, RangeSetting, SelectSetting>;

struct SettingSpec {
  std::string id;
  std::string name;
  std::string description;
  nlohmann::json default_value;
  SettingConstraints constraints;

  std::string TypeName() const;
  nlohmann::json ToJson() const;
};

struct AddonManifest {
  std::string id;
  AddonInfo info;
  std::vector<SettingSpec> settings;
  std::string module;    // shared library file name, relative to the addon dir
  std::string frontend;  // script file name, relative to the addon dir

  // {setting id: default} for every declared setting
  nlohmann::json Defaults() const;
  const SettingSpec* FindSetting(const std::string& setting_id) const;
  nlohmann::json SettingsJson() const;
};

// Throws CoreError(ValidationError) describing the first problem found
AddonManifest ParseManifest(const std::string& id, const nlohmann::json& j);

// Reads <addon_dir>/addon.json; id = directory name. Throws CoreError(ValidationError).
AddonManifest LoadManifest(const std::filesystem::path& addon_dir);

// Throws CoreError(ValidationError) if value does not satisfy the setting
void ValidateSettingValue(const SettingSpec& spec, const nlohmann::json& value);

// "#RGB" or "#RRGGBB"
bool IsValidColor(const std::string& value);

// "default" plus every .ttf/.otf/.woff/.woff2 in fonts_dir, sorted by label
std::vector<SelectOption> ListFontOptions(const std::filesystem::path& fonts_dir);

// Fill select settings that declare "optionsFrom": "fonts"
void ResolveDynamicOptions(AddonManifest& manifest, const std::filesystem::path& fonts_dir);

}  // namespace addon
}  // namespace signage
