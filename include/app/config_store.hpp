// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace signage {
namespace app {

// Persistent device settings (the external settings store).
//
// Keys the core reads: displayName, port, discoveryPort, staticIp,
// manualPeers [{ip,name,port}], addons {<id>: {...}}. Other keys belong to
// the display/HTTP layers and are passed through untouched.
//
// Write methods throw std::runtime_error if the change cannot be persisted;
// the in-memory state is then left as it was.
class ConfigStore {
public:
  virtual ~ConfigStore() = default;

  virtual nlohmann::json Snapshot() const = 0;

  // Deep-merge patch into the config. Returns the new config.
  virtual nlohmann::json Merge(const nlohmann::json& patch) = 0;

  // Replace one top-level key
  virtual void Set(const std::string& key, const nlohmann::json& value) = 0;

  // Saved settings for one addon (null if none)
  virtual nlohmann::json AddonConfig(const std::string& addon_id) const = 0;
  virtual void SetAddonConfig(const std::string& addon_id, const nlohmann::json& config) = 0;
};

// Defaults every stored config is merged over
nlohmann::json DefaultConfig();

// RFC 7386-style deep merge, except that null values in patch are stored
// rather than deleting the key
void DeepMerge(nlohmann::json& target, const nlohmann::json& patch);

// config.json in the data directory, written atomically on every change.
class JsonConfigStore : public ConfigStore {
public:
  explicit JsonConfigStore(std::filesystem::path path);

  // Read the file (if any) and merge it over DefaultConfig(). A missing file
  // is created with defaults. Returns false if the file exists but cannot be
  // parsed, or the defaults cannot be written.
  bool Load();

  nlohmann::json Snapshot() const override;
  nlohmann::json Merge(const nlohmann::json& patch) override;
  void Set(const std::string& key, const nlohmann::json& value) override;
  nlohmann::json AddonConfig(const std::string& addon_id) const override;
  void SetAddonConfig(const std::string& addon_id, const nlohmann::json& config) override;

  const std::filesystem::path& path() const { return path_; }

private:
  // Must be called with mutex_ held
  void Persist(const nlohmann::json& next);

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  nlohmann::json config_;
};

}  // namespace app
}  // namespace signage
