// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "addon/addon_registry.hpp"

#include "app/config_store.hpp"
#include "util/error.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <cctype>

namespace signage {
namespace addon {

const char* AddonStateName(AddonState state) {
  switch (state) {
  case AddonState::Unloaded:
    return "unloaded";
  case AddonState::Stopped:
    return "stopped";
  case AddonState::Running:
    return "running";
  }
  return "unknown";
}

namespace {

bool IsEnabled(const nlohmann::json& config) {
  auto it = config.find("enabled");
  return it == config.end() || !it->is_boolean() || it->get<bool>();
}

bool IsCredentialKey(std::string key) {
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
  return key == "password" || key == "token" || key == "secret";
}

}  // namespace

nlohmann::json StripCredentials(const nlohmann::json& partial) {
  nlohmann::json out = nlohmann::json::object();
  for (auto it = partial.begin(); it != partial.end(); ++it) {
    if (IsCredentialKey(it.key())) {
      LOG_ADDON_DEBUG("dropping credential field '{}' from addon config", it.key());
      continue;
    }
    out[it.key()] = *it;
  }
  return out;
}

// ---------------------------------------------------------------------------
// AddonInstance
// ---------------------------------------------------------------------------

AddonInstance::AddonInstance(AddonManifest manifest, std::filesystem::path dir, nlohmann::json config)
    : manifest_(std::move(manifest)), dir_(std::move(dir)) {
  set_config(config);
}

nlohmann::json AddonInstance::config() const {
  std::lock_guard<std::mutex> lock(data_mutex_);
  return config_;
}

bool AddonInstance::enabled() const {
  std::lock_guard<std::mutex> lock(data_mutex_);
  return enabled_;
}

AddonState AddonInstance::state() const {
  std::lock_guard<std::mutex> lock(data_mutex_);
  return state_;
}

std::string AddonInstance::last_error() const {
  std::lock_guard<std::mutex> lock(data_mutex_);
  return last_error_;
}

void AddonInstance::set_config(const nlohmann::json& config) {
  std::lock_guard<std::mutex> lock(data_mutex_);
  config_ = config.is_object() ? config : nlohmann::json::object();
  enabled_ = IsEnabled(config_);
}

void AddonInstance::set_state(AddonState state) {
  std::lock_guard<std::mutex> lock(data_mutex_);
  state_ = state;
}

void AddonInstance::set_last_error(const std::string& error) {
  std::lock_guard<std::mutex> lock(data_mutex_);
  last_error_ = error;
}

nlohmann::json AddonSummary::ToJson() const {
  nlohmann::json j;
  j["id"] = id;
  j["info"] = {{"name", info.name}, {"version", info.version}};
  if (!info.author.empty())
    j["info"]["author"] = info.author;
  if (!info.description.empty())
    j["info"]["description"] = info.description;
  if (!info.category.empty())
    j["info"]["category"] = info.category;
  j["enabled"] = enabled;
  j["config"] = config;
  j["settings"] = settings;
  j["state"] = AddonStateName(state);
  j["hasFrontend"] = has_frontend;
  j["hasBackend"] = has_module;
  if (!last_error.empty()) {
    j["lastError"] = last_error;
  }
  return j;
}

// ---------------------------------------------------------------------------
// AddonRegistry
// ---------------------------------------------------------------------------

AddonRegistry::AddonRegistry(app::ConfigStore& store, std::filesystem::path fonts_dir)
    : store_(store), fonts_dir_(std::move(fonts_dir)) {}

std::vector<AddonInstancePtr> AddonRegistry::ScanDirectory(const std::filesystem::path& addons_dir) const {
  std::error_code ec;
  if (!std::filesystem::exists(addons_dir, ec)) {
    if (!util::ensure_directory(addons_dir)) {
      throw CoreError(ErrorCode::LifecycleError, "cannot create addons directory " + addons_dir.string());
    }
    LOG_ADDON_INFO("created addons directory {}", addons_dir.string());
    return {};
  }

  std::vector<std::filesystem::path> dirs;
  std::filesystem::directory_iterator it(addons_dir, ec);
  if (ec) {
    throw CoreError(ErrorCode::LifecycleError, "cannot read addons directory " + addons_dir.string() + ": " +
                                                   ec.message());
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw CoreError(ErrorCode::LifecycleError, "error listing " + addons_dir.string() + ": " + ec.message());
    }
    std::error_code entry_ec;
    if (it->is_directory(entry_ec) && std::filesystem::exists(it->path() / kManifestFileName, entry_ec)) {
      dirs.push_back(it->path());
    }
  }
  std::sort(dirs.begin(), dirs.end());

  std::vector<AddonInstancePtr> out;
  for (const auto& dir : dirs) {
    try {
      AddonManifest manifest = LoadManifest(dir);
      ResolveDynamicOptions(manifest, fonts_dir_);

      nlohmann::json config = manifest.Defaults();
      nlohmann::json saved = store_.AddonConfig(manifest.id);
      if (saved.is_object()) {
        config.update(saved);
      }

      LOG_ADDON_DEBUG("found addon {} v{} ({})", manifest.id, manifest.info.version, manifest.info.name);
      out.push_back(std::make_shared<AddonInstance>(std::move(manifest), dir, std::move(config)));
    } catch (const CoreError& e) {
      LOG_ADDON_WARN("skipping addon in {}: {}", dir.string(), e.what());
    }
  }
  return out;
}

std::vector<AddonInstancePtr> AddonRegistry::Replace(std::vector<AddonInstancePtr> instances) {
  std::map<std::string, AddonInstancePtr> next;
  for (auto& inst : instances) {
    next[inst->id()] = std::move(inst);
  }

  std::vector<AddonInstancePtr> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, inst] : instances_) {
      previous.push_back(inst);
    }
    instances_ = std::move(next);
  }
  return previous;
}

std::vector<AddonSummary> AddonRegistry::Scan(const std::filesystem::path& addons_dir) {
  Replace(ScanDirectory(addons_dir));
  std::vector<AddonSummary> out;
  for (const auto& [id, summary] : GetAddonConfigs()) {
    out.push_back(summary);
  }
  LOG_ADDON_INFO("{} addon(s) found in {}", out.size(), addons_dir.string());
  return out;
}

AddonInstancePtr AddonRegistry::Get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = instances_.find(id);
  return it == instances_.end() ? nullptr : it->second;
}

std::vector<AddonInstancePtr> AddonRegistry::All() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AddonInstancePtr> out;
  out.reserve(instances_.size());
  for (const auto& [id, inst] : instances_) {
    out.push_back(inst);
  }
  return out;
}

AddonSummary AddonRegistry::Summarize(const AddonInstance& instance) const {
  AddonSummary s;
  s.id = instance.id();
  s.info = instance.manifest().info;
  s.enabled = instance.enabled();
  s.config = instance.config();
  s.settings = instance.manifest().SettingsJson();
  s.state = instance.state();
  s.has_frontend = !instance.manifest().frontend.empty();
  s.has_module = !instance.manifest().module.empty();
  s.last_error = instance.last_error();
  return s;
}

std::map<std::string, AddonSummary> AddonRegistry::GetAddonConfigs() const {
  std::map<std::string, AddonSummary> out;
  for (const auto& inst : All()) {
    out.emplace(inst->id(), Summarize(*inst));
  }
  return out;
}

void AddonRegistry::ValidatePatch(const AddonManifest& manifest, const nlohmann::json& patch) {
  for (auto it = patch.begin(); it != patch.end(); ++it) {
    if (it.key() == "enabled") {
      if (!it->is_boolean()) {
        throw CoreError(ErrorCode::ValidationError, "setting 'enabled': expected true or false");
      }
      continue;
    }
    if (const SettingSpec* spec = manifest.FindSetting(it.key())) {
      ValidateSettingValue(*spec, *it);
    }
  }
}

AddonSummary AddonRegistry::UpdateConfig(const std::string& id, const nlohmann::json& partial) {
  auto inst = Get(id);
  if (!inst) {
    throw CoreError(ErrorCode::NotFound, "unknown addon: " + id);
  }
  if (!partial.is_object()) {
    throw CoreError(ErrorCode::ValidationError, "addon config must be a JSON object");
  }

  nlohmann::json clean = StripCredentials(partial);
  ValidatePatch(inst->manifest(), clean);

  ReconfigureCallback reconfigure;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    reconfigure = reconfigure_;
  }
  if (reconfigure) {
    reconfigure(id, clean);
  } else {
    auto lock = LockFor(id);
    std::lock_guard<std::mutex> guard(*lock);
    auto current = Get(id);
    if (!current) {
      throw CoreError(ErrorCode::NotFound, "unknown addon: " + id);
    }
    current->set_config(CommitConfig(*current, clean));
  }

  auto current = Get(id);
  if (!current) {
    throw CoreError(ErrorCode::NotFound, "addon removed during update: " + id);
  }
  LOG_ADDON_INFO("addon {} config updated ({})", id, current->enabled() ? "enabled" : "disabled");
  return Summarize(*current);
}

nlohmann::json AddonRegistry::CommitConfig(const AddonInstance& instance, const nlohmann::json& patch) {
  ValidatePatch(instance.manifest(), patch);

  nlohmann::json merged = instance.config();
  merged.update(patch);

  try {
    store_.SetAddonConfig(instance.id(), merged);
  } catch (const std::exception& e) {
    LOG_ADDON_ERROR("could not save config for {}: {}", instance.id(), e.what());
    throw;
  }
  return merged;
}

std::optional<std::string> AddonRegistry::FrontendScript(const std::string& id) const {
  auto inst = Get(id);
  if (!inst) {
    throw CoreError(ErrorCode::NotFound, "unknown addon: " + id);
  }
  auto lock = LockFor(id);
  std::lock_guard<std::mutex> guard(*lock);
  if (!inst->module) {
    return std::nullopt;
  }
  try {
    return inst->module->addon().FrontendScript();
  } catch (const std::exception& e) {
    LOG_ADDON_ERROR("addon {} frontend script failed: {}", id, e.what());
    return std::nullopt;
  }
}

std::optional<std::string> AddonRegistry::AssetData(const std::string& id, const std::string& name) const {
  auto inst = Get(id);
  if (!inst) {
    throw CoreError(ErrorCode::NotFound, "unknown addon: " + id);
  }
  auto lock = LockFor(id);
  std::lock_guard<std::mutex> guard(*lock);
  if (!inst->module) {
    return std::nullopt;
  }
  try {
    return inst->module->addon().AssetData(name);
  } catch (const std::exception& e) {
    LOG_ADDON_ERROR("addon {} asset '{}' failed: {}", id, name, e.what());
    return std::nullopt;
  }
}

std::shared_ptr<std::mutex> AddonRegistry::LockFor(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = locks_[id];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

void AddonRegistry::SetReconfigureCallback(ReconfigureCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  reconfigure_ = std::move(callback);
}

}  // namespace addon
}  // namespace signage
