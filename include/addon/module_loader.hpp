// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "addon/addon.hpp"
#include "addon/manifest.hpp"

#include <filesystem>
#include <memory>

namespace signage {
namespace addon {

// A live addon object together with whatever keeps its code mapped.
// Destruction destroys the addon first, then releases the code.
class LoadedModule {
public:
  virtual ~LoadedModule() = default;
  virtual Addon& addon() = 0;
};

// Turns a manifest into a live addon object. Implementations throw
// CoreError(LifecycleError) when the addon cannot be instantiated.
class ModuleLoader {
public:
  virtual ~ModuleLoader() = default;
  virtual std::unique_ptr<LoadedModule> Load(const AddonManifest& manifest, const std::filesystem::path& addon_dir,
                                             AddonHost& host) = 0;
};

// Production loader:
// - manifest.module set: dlopen() the shared library and call its
//   signage_addon_create() after checking signage_addon_abi_version()
// - otherwise: a built-in script addon that serves manifest.frontend with
//   the config injected ahead of it
class DlModuleLoader : public ModuleLoader {
public:
  std::unique_ptr<LoadedModule> Load(const AddonManifest& manifest, const std::filesystem::path& addon_dir,
                                     AddonHost& host) override;
};

// Addon with no native code: holds its config and serves its display script.
class ScriptAddon : public Addon {
public:
  ScriptAddon(std::filesystem::path script_path, AddonHost& host);

  void Init(const nlohmann::json& config) override;
  void Stop() override;
  std::optional<std::string> FrontendScript() const override;

private:
  std::filesystem::path script_path_;  // empty = settings-only addon
  AddonHost& host_;
  nlohmann::json config_;
};

}  // namespace addon
}  // namespace signage
