// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace signage {
namespace addon {

// Bumped whenever Addon or AddonHost changes layout
inline constexpr int kAddonAbiVersion = 1;

// Services the host offers to one addon instance. Owned by the host and
// valid until the addon object is destroyed.
class AddonHost {
public:
  virtual ~AddonHost() = default;

  virtual const std::string& addon_id() const = 0;

  // Logger named after the addon. Addons must log through this rather than
  // their own spdlog registry so output lands in the host's sinks.
  virtual std::shared_ptr<spdlog::logger> logger() = 0;

  // Directory holding addon.json and the addon's files
  virtual std::filesystem::path addon_dir() const = 0;

  // Shared font directory (.ttf/.otf/.woff/.woff2)
  virtual std::filesystem::path fonts_dir() const = 0;

  // Send a message to the display channel, e.g. {"type":"restart-warning",...}
  virtual void Emit(const nlohmann::json& message) = 0;

  // Ask the host to restart the machine. Returns false if refused.
  virtual bool RequestSystemRestart() = 0;

  // True once the host has begun shutting down
  virtual bool shutting_down() const = 0;
};

// An addon instance. Hooks are never called concurrently for one instance.
//
// Init(config) starts the addon with its effective config (manifest defaults
// overlaid by saved values). Stop() must release every timer and thread the
// addon started; it may be called without a matching Init(). Exceptions
// thrown from hooks are caught by the host and isolate this addon only.
class Addon {
public:
  virtual ~Addon() = default;

  virtual void Init(const nlohmann::json& config) = 0;

  // Called with the merged config before the re-Init that follows an update
  virtual void UpdateConfig(const nlohmann::json& config) { (void)config; }

  virtual void Stop() = 0;

  // Display-side script, already carrying whatever config it needs
  virtual std::optional<std::string> FrontendScript() const { return std::nullopt; }

  // Named binary asset (e.g. a font as a data: URL)
  virtual std::optional<std::string> AssetData(const std::string& name) const {
    (void)name;
    return std::nullopt;
  }
};

// Prefixes a display script with `window.addonConfig = <config>;` so the
// script sees the addon's effective settings.
inline std::string WrapFrontendScript(const nlohmann::json& config, const std::string& script) {
  return "window.addonConfig = " + config.dump() + ";\n" + script;
}

}  // namespace addon
}  // namespace signage

// Plugin entry points. A native addon is a shared library exporting these
// three symbols; SIGNAGE_DECLARE_ADDON generates them.
extern "C" {
typedef int (*signage_addon_abi_version_fn)();
typedef signage::addon::Addon* (*signage_addon_create_fn)(signage::addon::AddonHost* host);
typedef void (*signage_addon_destroy_fn)(signage::addon::Addon* addon);
}

#define SIGNAGE_ADDON_EXPORT __attribute__((visibility("default")))

#define SIGNAGE_DECLARE_ADDON(AddonClass)                                                        \
  extern "C" SIGNAGE_ADDON_EXPORT int signage_addon_abi_version() {                              \
    return signage::addon::kAddonAbiVersion;                                                     \
  }                                                                                              \
  extern "C" SIGNAGE_ADDON_EXPORT signage::addon::Addon* signage_addon_create(                   \
      signage::addon::AddonHost* host) {                                                         \
    return new AddonClass(*host);                                                                \
  }                                                                                              \
  extern "C" SIGNAGE_ADDON_EXPORT void signage_addon_destroy(signage::addon::Addon* addon) {     \
    delete addon;                                                                                \
  }
