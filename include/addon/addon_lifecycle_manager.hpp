// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "addon/addon_registry.hpp"
#include "addon/module_loader.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace signage {
namespace addon {

struct ReloadReport {
  bool scan_ok{false};
  std::string scan_error;
  std::vector<std::string> stop_errors;  // "<id>: <message>"
  size_t loaded{0};
  size_t running{0};

  nlohmann::json ToJson() const;
};

// AddonLifecycleManager - drives addons through
//   Unloaded -> Stopped -> Running -> Stopped -> Unloaded
//
// Serialization:
// - one mutex per addon id (AddonRegistry::LockFor), stable across reloads,
//   so hooks of one addon never overlap while different addons may
//   transition concurrently
// - a reader/writer reload lock: single-addon transitions take it shared,
//   ReloadAll and StopAll take it exclusive
//
// Every hook call is wrapped; an addon that throws is logged and isolated.
class AddonLifecycleManager {
public:
  struct HostServices {
    std::filesystem::path fonts_dir;
    std::function<void(const std::string& addon_id, const nlohmann::json& message)> emit;
    std::function<bool()> request_restart;
  };

  AddonLifecycleManager(AddonRegistry& registry, std::shared_ptr<ModuleLoader> loader, HostServices services);
  ~AddonLifecycleManager();

  AddonLifecycleManager(const AddonLifecycleManager&) = delete;
  AddonLifecycleManager& operator=(const AddonLifecycleManager&) = delete;

  // Load the module if needed and Init() if enabled. Returns true if the
  // addon ends up running. Throws CoreError(NotFound) for an unknown id.
  bool LoadAndStart(const std::string& id);

  // LoadAndStart for every registered addon. Returns the number running.
  size_t StartAll();

  // Under the addon's lock: merge patch over the current config and persist
  // it, then Stop (if running), UpdateConfig hook, store config, Init (if
  // enabled). Nothing is stopped if validation or the write fails.
  // Throws CoreError(NotFound) for an unknown id.
  void ApplyConfigUpdate(const std::string& id, const nlohmann::json& patch);

  // Rescan addons_dir and restart everything from the fresh set. If the scan
  // fails the current set keeps running.
  ReloadReport ReloadAll(const std::filesystem::path& addons_dir);

  // Best-effort stop of every running addon (host shutdown)
  void StopAll();

  // Stop and unload everything; modules are released
  void UnloadAll();

  bool shutting_down() const { return shutting_down_.load(std::memory_order_acquire); }

private:
  // All *Locked helpers require the instance's per-addon mutex
  bool LoadAndStartLocked(AddonInstance& inst);
  bool InitLocked(AddonInstance& inst);
  // Returns an error message, empty on success
  std::string StopLocked(AddonInstance& inst);
  void UnloadLocked(AddonInstance& inst);

  AddonRegistry& registry_;
  std::shared_ptr<ModuleLoader> loader_;
  HostServices services_;

  std::shared_mutex reload_mutex_;
  std::atomic<bool> shutting_down_{false};
};

}  // namespace addon
}  // namespace signage
