// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "addon/module_loader.hpp"

#include "util/error.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <dlfcn.h>

namespace signage {
namespace addon {

namespace {

constexpr size_t kMaxScriptSize = 4 * 1024 * 1024;

class DlLoadedModule : public LoadedModule {
public:
  DlLoadedModule(void* handle, Addon* addon, signage_addon_destroy_fn destroy)
      : handle_(handle), addon_(addon), destroy_(destroy) {}

  ~DlLoadedModule() override {
    if (addon_) {
      destroy_(addon_);
    }
    if (handle_) {
      dlclose(handle_);
    }
  }

  DlLoadedModule(const DlLoadedModule&) = delete;
  DlLoadedModule& operator=(const DlLoadedModule&) = delete;

  Addon& addon() override { return *addon_; }

private:
  void* handle_;
  Addon* addon_;
  signage_addon_destroy_fn destroy_;
};

class BuiltinModule : public LoadedModule {
public:
  explicit BuiltinModule(std::unique_ptr<Addon> addon) : addon_(std::move(addon)) {}
  Addon& addon() override { return *addon_; }

private:
  std::unique_ptr<Addon> addon_;
};

// Closes the handle unless released
struct DlHandle {
  void* handle;
  ~DlHandle() {
    if (handle) {
      dlclose(handle);
    }
  }
  void* release() {
    void* h = handle;
    handle = nullptr;
    return h;
  }
};

[[noreturn]] void LoadFailed(const std::string& id, const std::string& what) {
  throw CoreError(ErrorCode::LifecycleError, "addon '" + id + "': " + what);
}

template <typename Fn>
Fn LookupSymbol(void* handle, const char* name, const std::string& id) {
  dlerror();
  void* sym = dlsym(handle, name);
  const char* err = dlerror();
  if (err != nullptr || sym == nullptr) {
    LoadFailed(id, std::string("missing symbol ") + name);
  }
  return reinterpret_cast<Fn>(sym);
}

}  // namespace

std::unique_ptr<LoadedModule> DlModuleLoader::Load(const AddonManifest& manifest, const std::filesystem::path& addon_dir,
                                                   AddonHost& host) {
  if (manifest.module.empty()) {
    std::filesystem::path script;
    if (!manifest.frontend.empty()) {
      script = addon_dir / manifest.frontend;
      if (!std::filesystem::is_regular_file(script)) {
        LoadFailed(manifest.id, "frontend script " + manifest.frontend + " not found");
      }
    }
    return std::make_unique<BuiltinModule>(std::make_unique<ScriptAddon>(script, host));
  }

  const auto library = addon_dir / manifest.module;
  DlHandle handle{dlopen(library.c_str(), RTLD_NOW | RTLD_LOCAL)};
  if (!handle.handle) {
    const char* err = dlerror();
    LoadFailed(manifest.id, std::string("dlopen failed: ") + (err ? err : "unknown error"));
  }

  auto abi_version = LookupSymbol<signage_addon_abi_version_fn>(handle.handle, "signage_addon_abi_version", manifest.id);
  auto create = LookupSymbol<signage_addon_create_fn>(handle.handle, "signage_addon_create", manifest.id);
  auto destroy = LookupSymbol<signage_addon_destroy_fn>(handle.handle, "signage_addon_destroy", manifest.id);

  int version = abi_version();
  if (version != kAddonAbiVersion) {
    LoadFailed(manifest.id, "built for addon ABI " + std::to_string(version) + ", host speaks " +
                                std::to_string(kAddonAbiVersion));
  }

  Addon* addon = nullptr;
  try {
    addon = create(&host);
  } catch (const std::exception& e) {
    LoadFailed(manifest.id, std::string("create failed: ") + e.what());
  }
  if (!addon) {
    LoadFailed(manifest.id, "create returned null");
  }

  LOG_ADDON_DEBUG("loaded {} from {}", manifest.id, library.string());
  return std::make_unique<DlLoadedModule>(handle.release(), addon, destroy);
}

ScriptAddon::ScriptAddon(std::filesystem::path script_path, AddonHost& host)
    : script_path_(std::move(script_path)), host_(host), config_(nlohmann::json::object()) {}

void ScriptAddon::Init(const nlohmann::json& config) {
  config_ = config;
  host_.logger()->debug("script addon started");
}

void ScriptAddon::Stop() {}

std::optional<std::string> ScriptAddon::FrontendScript() const {
  if (script_path_.empty()) {
    return std::nullopt;
  }
  auto script = util::read_file_string(script_path_, kMaxScriptSize);
  if (!script) {
    return std::nullopt;
  }
  return WrapFrontendScript(config_, *script);
}

}  // namespace addon
}  // namespace signage
