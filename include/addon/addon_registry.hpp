// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "addon/addon.hpp"
#include "addon/manifest.hpp"
#include "addon/module_loader.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace signage {
namespace app {
class ConfigStore;
}

namespace addon {

enum class AddonState {
  Unloaded,  // no module instance
  Stopped,   // instantiated, not running (disabled or Init failed)
  Running,
};

const char* AddonStateName(AddonState state);

// One discovered addon. The manifest and directory never change; the rest is
// guarded by an internal mutex for readers, while lifecycle transitions are
// serialized by the per-addon lock from AddonRegistry::LockFor().
class AddonInstance {
public:
  AddonInstance(AddonManifest manifest, std::filesystem::path dir, nlohmann::json config);

  const AddonManifest& manifest() const { return manifest_; }
  const std::string& id() const { return manifest_.id; }
  const std::filesystem::path& dir() const { return dir_; }

  nlohmann::json config() const;
  bool enabled() const;
  AddonState state() const;
  std::string last_error() const;

  // Stores config and recomputes enabled (enabled unless config.enabled == false)
  void set_config(const nlohmann::json& config);
  void set_state(AddonState state);
  void set_last_error(const std::string& error);

  // Module slot; only touched with the per-addon lock held.
  // host must outlive module, so module is reset first.
  std::unique_ptr<AddonHost> host;
  std::unique_ptr<LoadedModule> module;

private:
  const AddonManifest manifest_;
  const std::filesystem::path dir_;

  mutable std::mutex data_mutex_;
  nlohmann::json config_;
  bool enabled_{true};
  AddonState state_{AddonState::Unloaded};
  std::string last_error_;
};

using AddonInstancePtr = std::shared_ptr<AddonInstance>;

// What callers may see of an addon; never exposes module handles
struct AddonSummary {
  std::string id;
  AddonInfo info;
  bool enabled{true};
  nlohmann::json config;
  nlohmann::json settings;
  AddonState state{AddonState::Unloaded};
  bool has_frontend{false};
  bool has_module{false};
  std::string last_error;

  nlohmann::json ToJson() const;
};

// AddonRegistry - the set of discovered addons
//
// Owns manifests and instances. Scanning is split into ScanDirectory (reads
// disk, touches nothing) and Replace (swaps the live set), so a reload can
// stage a new set and only commit it once the scan succeeded.
class AddonRegistry {
public:
  // Applies a validated, credential-free patch to a live addon. It must hold
  // LockFor(id) across CommitConfig and the reconfigure so that concurrent
  // updates of one addon merge in order. Installed by the lifecycle manager;
  // without one the merged config is only stored.
  using ReconfigureCallback = std::function<void(const std::string& id, const nlohmann::json& patch)>;

  AddonRegistry(app::ConfigStore& store, std::filesystem::path fonts_dir);

  // Build instances for every subdirectory holding addon.json. Invalid
  // manifests are logged and skipped. A missing directory is created and
  // yields an empty set; an unreadable one throws CoreError(LifecycleError).
  std::vector<AddonInstancePtr> ScanDirectory(const std::filesystem::path& addons_dir) const;

  // Swap in a new set; returns the previous one
  std::vector<AddonInstancePtr> Replace(std::vector<AddonInstancePtr> instances);

  // ScanDirectory + Replace. Only safe while no instance is loaded.
  std::vector<AddonSummary> Scan(const std::filesystem::path& addons_dir);

  AddonInstancePtr Get(const std::string& id) const;
  std::vector<AddonInstancePtr> All() const;

  std::map<std::string, AddonSummary> GetAddonConfigs() const;

  // Validate and merge a partial config, persist it, then reconfigure the
  // addon. Throws CoreError(NotFound) for an unknown id and
  // CoreError(ValidationError) for a bad value (nothing is changed).
  AddonSummary UpdateConfig(const std::string& id, const nlohmann::json& partial);

  // Merge patch over the instance's current config and persist the result,
  // which is returned; the instance itself is not touched. Caller holds
  // LockFor(instance.id()). Throws like UpdateConfig, or whatever the store
  // throws on a failed write.
  nlohmann::json CommitConfig(const AddonInstance& instance, const nlohmann::json& patch);

  std::optional<std::string> FrontendScript(const std::string& id) const;
  std::optional<std::string> AssetData(const std::string& id, const std::string& name) const;

  // Lifecycle lock for one addon id; the same mutex is returned across reloads
  std::shared_ptr<std::mutex> LockFor(const std::string& id) const;

  void SetReconfigureCallback(ReconfigureCallback callback);

  const std::filesystem::path& fonts_dir() const { return fonts_dir_; }

private:
  static void ValidatePatch(const AddonManifest& manifest, const nlohmann::json& patch);
  AddonSummary Summarize(const AddonInstance& instance) const;

  app::ConfigStore& store_;
  const std::filesystem::path fonts_dir_;

  mutable std::mutex mutex_;
  std::map<std::string, AddonInstancePtr> instances_;
  mutable std::map<std::string, std::shared_ptr<std::mutex>> locks_;
  ReconfigureCallback reconfigure_;
};

// Remove password/token/secret keys (case-insensitive) from a config patch
nlohmann::json StripCredentials(const nlohmann::json& partial);

}  // namespace addon
}  // namespace signage
