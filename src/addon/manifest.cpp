// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "addon/manifest.hpp"

#include "addon/font_data.hpp"
#include "util/error.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace signage {
namespace addon {

namespace {

constexpr size_t kMaxManifestSize = 256 * 1024;

[[noreturn]] void Invalid(const std::string& id, const std::string& what) {
  throw CoreError(ErrorCode::ValidationError, "addon '" + id + "': " + what);
}

std::string OptionalString(const std::string& id, const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return "";
  }
  if (!it->is_string()) {
    Invalid(id, std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

std::string RequiredString(const std::string& id, const nlohmann::json& obj, const char* key, const std::string& where) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string() || it->get<std::string>().empty()) {
    Invalid(id, where + key + " is required");
  }
  return it->get<std::string>();
}

// Manifest-relative file names must stay inside the addon directory
std::string SafeFileName(const std::string& id, const nlohmann::json& obj, const char* key) {
  std::string value = OptionalString(id, obj, key);
  if (value.empty()) {
    return value;
  }
  std::filesystem::path p(value);
  if (p.is_absolute() || p.has_parent_path() || value == "." || value == "..") {
    Invalid(id, std::string(key) + " must be a plain file name");
  }
  return value;
}

SelectOption ParseOption(const std::string& id, const std::string& setting_id, const nlohmann::json& opt) {
  if (opt.is_string()) {
    return {opt.get<std::string>(), opt.get<std::string>()};
  }
  if (opt.is_object()) {
    auto value = opt.find("value");
    if (value != opt.end() && value->is_string()) {
      SelectOption out;
      out.value = value->get<std::string>();
      auto label = opt.find("label");
      out.label = (label != opt.end() && label->is_string()) ? label->get<std::string>() : out.value;
      return out;
    }
  }
  Invalid(id, "setting '" + setting_id + "' has a malformed option");
}

SettingSpec ParseSetting(const std::string& id, const nlohmann::json& s) {
  if (!s.is_object()) {
    Invalid(id, "settings entries must be objects");
  }

  SettingSpec spec;
  spec.id = RequiredString(id, s, "id", "setting ");
  const std::string where = "setting '" + spec.id + "' ";
  spec.name = OptionalString(id, s, "name");
  if (spec.name.empty()) {
    spec.name = spec.id;
  }
  spec.description = OptionalString(id, s, "description");
  const std::string type = RequiredString(id, s, "type", where);

  auto def = s.find("default");
  if (def == s.end()) {
    Invalid(id, where + "needs a default");
  }
  spec.default_value = *def;

  if (type == "boolean") {
    spec.constraints = BooleanSetting{};
  } else if (type == "text") {
    spec.constraints = TextSetting{OptionalString(id, s, "placeholder")};
  } else if (type == "color") {
    spec.constraints = ColorSetting{};
  } else if (type == "range") {
    RangeSetting range;
    auto min = s.find("min");
    auto max = s.find("max");
    if (min == s.end() || max == s.end() || !min->is_number() || !max->is_number()) {
      Invalid(id, where + "needs numeric min and max");
    }
    range.min = min->get<double>();
    range.max = max->get<double>();
    if (range.min > range.max) {
      Invalid(id, where + "has min > max");
    }
    auto step = s.find("step");
    if (step != s.end() && step->is_number() && step->get<double>() > 0) {
      range.step = step->get<double>();
    }
    range.unit = OptionalString(id, s, "unit");
    spec.constraints = range;
  } else if (type == "select") {
    SelectSetting select;
    select.options_from = OptionalString(id, s, "optionsFrom");
    if (!select.options_from.empty() && select.options_from != "fonts") {
      Invalid(id, where + "has unknown optionsFrom '" + select.options_from + "'");
    }
    auto options = s.find("options");
    if (options != s.end() && options->is_array()) {
      for (const auto& opt : *options) {
        select.options.push_back(ParseOption(id, spec.id, opt));
      }
    }
    if (select.options.empty() && select.options_from.empty()) {
      Invalid(id, where + "needs a non-empty options list");
    }
    spec.constraints = select;
  } else {
    Invalid(id, where + "has unknown type '" + type + "'");
  }

  // The default must satisfy its own constraints (dynamic selects are
  // checked once their options are known)
  const auto* select = std::get_if<SelectSetting>(&spec.constraints);
  if (!select || select->options_from.empty()) {
    ValidateSettingValue(spec, spec.default_value);
  }
  return spec;
}

struct TypeNameVisitor {
  std::string operator()(const BooleanSetting&) const { return "boolean"; }
  std::string operator()(const TextSetting&) const { return "text"; }
  std::string operator()(const ColorSetting&) const { return "color"; }
  std::string operator()(const RangeSetting&) const { return "range"; }
  std::string operator()(const SelectSetting&) const { return "select"; }
};

}  // namespace

std::string SettingSpec::TypeName() const {
  return std::visit(TypeNameVisitor{}, constraints);
}

nlohmann::json SettingSpec::ToJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["name"] = name;
  j["type"] = TypeName();
  j["default"] = default_value;
  if (!description.empty()) {
    j["description"] = description;
  }

  if (const auto* text = std::get_if<TextSetting>(&constraints)) {
    if (!text->placeholder.empty()) {
      j["placeholder"] = text->placeholder;
    }
  } else if (const auto* range = std::get_if<RangeSetting>(&constraints)) {
    j["min"] = range->min;
    j["max"] = range->max;
    j["step"] = range->step;
    if (!range->unit.empty()) {
      j["unit"] = range->unit;
    }
  } else if (const auto* select = std::get_if<SelectSetting>(&constraints)) {
    j["options"] = nlohmann::json::array();
    for (const auto& opt : select->options) {
      j["options"].push_back({{"value", opt.value}, {"label", opt.label}});
    }
  }
  return j;
}

nlohmann::json AddonManifest::Defaults() const {
  nlohmann::json defaults = nlohmann::json::object();
  for (const auto& s : settings) {
    defaults[s.id] = s.default_value;
  }
  return defaults;
}

const SettingSpec* AddonManifest::FindSetting(const std::string& setting_id) const {
  for (const auto& s : settings) {
    if (s.id == setting_id) {
      return &s;
    }
  }
  return nullptr;
}

nlohmann::json AddonManifest::SettingsJson() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& s : settings) {
    out.push_back(s.ToJson());
  }
  return out;
}

AddonManifest ParseManifest(const std::string& id, const nlohmann::json& j) {
  if (!j.is_object()) {
    Invalid(id, "manifest must be a JSON object");
  }

  AddonManifest manifest;
  manifest.id = id;

  auto info = j.find("info");
  if (info == j.end() || !info->is_object()) {
    Invalid(id, "info section is required");
  }
  manifest.info.name = RequiredString(id, *info, "name", "info.");
  manifest.info.version = RequiredString(id, *info, "version", "info.");
  manifest.info.author = OptionalString(id, *info, "author");
  manifest.info.description = OptionalString(id, *info, "description");
  manifest.info.category = OptionalString(id, *info, "category");

  auto settings = j.find("settings");
  if (settings != j.end() && !settings->is_null()) {
    if (!settings->is_array()) {
      Invalid(id, "settings must be an array");
    }
    for (const auto& s : *settings) {
      SettingSpec spec = ParseSetting(id, s);
      if (manifest.FindSetting(spec.id)) {
        Invalid(id, "duplicate setting '" + spec.id + "'");
      }
      manifest.settings.push_back(std::move(spec));
    }
  }

  manifest.module = SafeFileName(id, j, "module");
  manifest.frontend = SafeFileName(id, j, "frontend");
  return manifest;
}

AddonManifest LoadManifest(const std::filesystem::path& addon_dir) {
  const std::string id = addon_dir.filename().string();
  auto content = util::read_file_string(addon_dir / kManifestFileName, kMaxManifestSize);
  if (!content) {
    Invalid(id, std::string("cannot read ") + kManifestFileName);
  }

  auto j = nlohmann::json::parse(*content, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    Invalid(id, std::string(kManifestFileName) + " is not valid JSON");
  }
  return ParseManifest(id, j);
}

bool IsValidColor(const std::string& value) {
  if ((value.size() != 4 && value.size() != 7) || value[0] != '#') {
    return false;
  }
  return std::all_of(value.begin() + 1, value.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

void ValidateSettingValue(const SettingSpec& spec, const nlohmann::json& value) {
  auto reject = [&](const std::string& why) {
    throw CoreError(ErrorCode::ValidationError, "setting '" + spec.id + "': " + why);
  };

  if (std::holds_alternative<BooleanSetting>(spec.constraints)) {
    if (!value.is_boolean())
      reject("expected true or false");
  } else if (std::holds_alternative<TextSetting>(spec.constraints)) {
    if (!value.is_string())
      reject("expected a string");
  } else if (std::holds_alternative<ColorSetting>(spec.constraints)) {
    if (!value.is_string() || !IsValidColor(value.get<std::string>()))
      reject("expected a color like #RRGGBB");
  } else if (const auto* range = std::get_if<RangeSetting>(&spec.constraints)) {
    if (!value.is_number())
      reject("expected a number");
    double v = value.get<double>();
    if (std::isnan(v) || v < range->min || v > range->max) {
      reject("value outside [" + nlohmann::json(range->min).dump() + ", " + nlohmann::json(range->max).dump() + "]");
    }
  } else if (const auto* select = std::get_if<SelectSetting>(&spec.constraints)) {
    if (!value.is_string())
      reject("expected one of the listed options");
    const std::string v = value.get<std::string>();
    bool found = std::any_of(select->options.begin(), select->options.end(),
                             [&](const SelectOption& opt) { return opt.value == v; });
    if (!found)
      reject("'" + v + "' is not one of the listed options");
  }
}

std::vector<SelectOption> ListFontOptions(const std::filesystem::path& fonts_dir) {
  std::vector<SelectOption> fonts;
  std::error_code ec;
  if (!fonts_dir.empty() && std::filesystem::is_directory(fonts_dir, ec)) {
    for (const auto& entry : std::filesystem::directory_iterator(fonts_dir, ec)) {
      if (!entry.is_regular_file(ec)) {
        continue;
      }
      if (!FontMimeType(entry.path().filename().string())) {
        continue;
      }
      // "Open_Sans-Bold.ttf" -> "Open Sans Bold"
      std::string label = entry.path().stem().string();
      std::replace(label.begin(), label.end(), '-', ' ');
      std::replace(label.begin(), label.end(), '_', ' ');
      fonts.push_back({entry.path().filename().string(), label});
    }
  }
  std::sort(fonts.begin(), fonts.end(), [](const SelectOption& a, const SelectOption& b) { return a.label < b.label; });
  fonts.insert(fonts.begin(), SelectOption{"default", "Default (Arial)"});
  return fonts;
}

void ResolveDynamicOptions(AddonManifest& manifest, const std::filesystem::path& fonts_dir) {
  for (auto& spec : manifest.settings) {
    auto* select = std::get_if<SelectSetting>(&spec.constraints);
    if (select && select->options_from == "fonts") {
      select->options = ListFontOptions(fonts_dir);
      ValidateSettingValue(spec, spec.default_value);
    }
  }
}

}  // namespace addon
}  // namespace signage
