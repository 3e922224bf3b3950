// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "addon/addon_lifecycle_manager.hpp"

#include "util/error.hpp"
#include "util/logging.hpp"

#include <mutex>

namespace signage {
namespace addon {

namespace {

// AddonHost handed to one addon instance
class InstanceHost : public AddonHost {
public:
  InstanceHost(std::string id, std::filesystem::path dir, const AddonLifecycleManager::HostServices& services,
               const std::atomic<bool>& shutting_down)
      : id_(std::move(id)), dir_(std::move(dir)), services_(services), shutting_down_(shutting_down) {
    auto base = util::LogManager::GetLogger("addon");
    logger_ = std::make_shared<spdlog::logger>("addon:" + id_, base->sinks().begin(), base->sinks().end());
    logger_->set_level(base->level());
    logger_->flush_on(spdlog::level::warn);
  }

  const std::string& addon_id() const override { return id_; }
  std::shared_ptr<spdlog::logger> logger() override { return logger_; }
  std::filesystem::path addon_dir() const override { return dir_; }
  std::filesystem::path fonts_dir() const override { return services_.fonts_dir; }

  void Emit(const nlohmann::json& message) override {
    if (!services_.emit) {
      return;
    }
    try {
      services_.emit(id_, message);
    } catch (const std::exception& e) {
      if (shutting_down_.load(std::memory_order_acquire) && IsTransientIOError(e)) {
        return;
      }
      LOG_ADDON_WARN("message from {} not delivered: {}", id_, e.what());
    }
  }

  bool RequestSystemRestart() override {
    if (!services_.request_restart) {
      LOG_ADDON_WARN("{} requested a system restart but none is configured", id_);
      return false;
    }
    LOG_ADDON_INFO("{} requested a system restart", id_);
    return services_.request_restart();
  }

  bool shutting_down() const override { return shutting_down_.load(std::memory_order_acquire); }

private:
  std::string id_;
  std::filesystem::path dir_;
  const AddonLifecycleManager::HostServices& services_;
  const std::atomic<bool>& shutting_down_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace

nlohmann::json ReloadReport::ToJson() const {
  nlohmann::json j;
  j["success"] = scan_ok;
  if (!scan_ok) {
    j["error"] = scan_error;
  }
  j["loaded"] = loaded;
  j["running"] = running;
  if (!stop_errors.empty()) {
    j["stopErrors"] = stop_errors;
  }
  return j;
}

AddonLifecycleManager::AddonLifecycleManager(AddonRegistry& registry, std::shared_ptr<ModuleLoader> loader,
                                             HostServices services)
    : registry_(registry),
      loader_(loader ? std::move(loader) : std::make_shared<DlModuleLoader>()),
      services_(std::move(services)) {
  registry_.SetReconfigureCallback(
      [this](const std::string& id, const nlohmann::json& patch) { ApplyConfigUpdate(id, patch); });
}

AddonLifecycleManager::~AddonLifecycleManager() {
  registry_.SetReconfigureCallback(nullptr);
  UnloadAll();
}

bool AddonLifecycleManager::LoadAndStart(const std::string& id) {
  std::shared_lock<std::shared_mutex> reload(reload_mutex_);
  auto inst = registry_.Get(id);
  if (!inst) {
    throw CoreError(ErrorCode::NotFound, "unknown addon: " + id);
  }
  auto lock = registry_.LockFor(id);
  std::lock_guard<std::mutex> guard(*lock);
  return LoadAndStartLocked(*inst);
}

size_t AddonLifecycleManager::StartAll() {
  std::shared_lock<std::shared_mutex> reload(reload_mutex_);
  size_t running = 0;
  for (const auto& inst : registry_.All()) {
    auto lock = registry_.LockFor(inst->id());
    std::lock_guard<std::mutex> guard(*lock);
    if (LoadAndStartLocked(*inst)) {
      ++running;
    }
  }
  return running;
}

void AddonLifecycleManager::ApplyConfigUpdate(const std::string& id, const nlohmann::json& patch) {
  std::shared_lock<std::shared_mutex> reload(reload_mutex_);
  auto lock = registry_.LockFor(id);
  std::lock_guard<std::mutex> guard(*lock);
  // Looked up under the lock so a reload cannot swap the instance mid-update
  auto inst = registry_.Get(id);
  if (!inst) {
    throw CoreError(ErrorCode::NotFound, "unknown addon: " + id);
  }

  const nlohmann::json new_config = registry_.CommitConfig(*inst, patch);

  if (inst->state() == AddonState::Running) {
    std::string err = StopLocked(*inst);
    if (!err.empty()) {
      LOG_ADDON_WARN("addon {} did not stop cleanly before reconfigure: {}", id, err);
    }
  }

  if (inst->module) {
    try {
      inst->module->addon().UpdateConfig(new_config);
    } catch (const std::exception& e) {
      LOG_ADDON_ERROR("addon {} rejected config update hook: {}", id, e.what());
      inst->set_last_error(e.what());
    }
  }

  inst->set_config(new_config);
  if (!inst->enabled()) {
    LOG_ADDON_INFO("addon {} disabled", id);
    return;
  }
  if (!inst->module) {
    LoadAndStartLocked(*inst);
  } else {
    InitLocked(*inst);
  }
}

ReloadReport AddonLifecycleManager::ReloadAll(const std::filesystem::path& addons_dir) {
  std::unique_lock<std::shared_mutex> reload(reload_mutex_);
  ReloadReport report;

  std::vector<AddonInstancePtr> staged;
  try {
    staged = registry_.ScanDirectory(addons_dir);
  } catch (const std::exception& e) {
    report.scan_error = e.what();
    LOG_ADDON_ERROR("addon reload aborted, keeping current addons: {}", e.what());
    return report;
  }
  report.scan_ok = true;

  for (const auto& inst : registry_.All()) {
    auto lock = registry_.LockFor(inst->id());
    std::lock_guard<std::mutex> guard(*lock);
    std::string err = StopLocked(*inst);
    if (!err.empty()) {
      report.stop_errors.push_back(inst->id() + ": " + err);
    }
    UnloadLocked(*inst);
  }

  registry_.Replace(staged);

  for (const auto& inst : staged) {
    auto lock = registry_.LockFor(inst->id());
    std::lock_guard<std::mutex> guard(*lock);
    if (LoadAndStartLocked(*inst)) {
      ++report.running;
    }
    if (inst->module) {
      ++report.loaded;
    }
  }

  LOG_ADDON_INFO("addons reloaded: {} loaded, {} running, {} stop error(s)", report.loaded, report.running,
                 report.stop_errors.size());
  return report;
}

void AddonLifecycleManager::StopAll() {
  std::unique_lock<std::shared_mutex> reload(reload_mutex_);
  shutting_down_.store(true, std::memory_order_release);
  for (const auto& inst : registry_.All()) {
    auto lock = registry_.LockFor(inst->id());
    std::lock_guard<std::mutex> guard(*lock);
    std::string err = StopLocked(*inst);
    if (!err.empty()) {
      LOG_ADDON_WARN("addon {} did not stop cleanly: {}", inst->id(), err);
    }
  }
}

void AddonLifecycleManager::UnloadAll() {
  std::unique_lock<std::shared_mutex> reload(reload_mutex_);
  for (const auto& inst : registry_.All()) {
    auto lock = registry_.LockFor(inst->id());
    std::lock_guard<std::mutex> guard(*lock);
    StopLocked(*inst);
    UnloadLocked(*inst);
  }
}

bool AddonLifecycleManager::LoadAndStartLocked(AddonInstance& inst) {
  if (!inst.module) {
    try {
      inst.host = std::make_unique<InstanceHost>(inst.id(), inst.dir(), services_, shutting_down_);
      inst.module = loader_->Load(inst.manifest(), inst.dir(), *inst.host);
      inst.set_state(AddonState::Stopped);
      inst.set_last_error("");
    } catch (const std::exception& e) {
      LOG_ADDON_ERROR("failed to load addon {}: {}", inst.id(), e.what());
      inst.module.reset();
      inst.host.reset();
      inst.set_last_error(e.what());
      // A failed instance is still visible as Stopped, never Running
      inst.set_state(AddonState::Stopped);
      return false;
    }
  }

  if (!inst.enabled()) {
    LOG_ADDON_DEBUG("addon {} is disabled, not starting", inst.id());
    return false;
  }
  if (inst.state() == AddonState::Running) {
    return true;
  }
  return InitLocked(inst);
}

bool AddonLifecycleManager::InitLocked(AddonInstance& inst) {
  if (!inst.module) {
    return false;
  }
  try {
    inst.module->addon().Init(inst.config());
    inst.set_state(AddonState::Running);
    inst.set_last_error("");
    LOG_ADDON_INFO("addon {} started", inst.id());
    return true;
  } catch (const std::exception& e) {
    LOG_ADDON_ERROR("addon {} failed to start: {}", inst.id(), e.what());
    inst.set_last_error(e.what());
    inst.set_state(AddonState::Stopped);
    return false;
  }
}

std::string AddonLifecycleManager::StopLocked(AddonInstance& inst) {
  if (inst.state() != AddonState::Running || !inst.module) {
    return "";
  }

  std::string error;
  try {
    inst.module->addon().Stop();
    LOG_ADDON_DEBUG("addon {} stopped", inst.id());
  } catch (const std::exception& e) {
    if (IsTransientIOError(e)) {
      // Output stream already gone; the addon has stopped regardless
      if (!shutting_down()) {
        LOG_ADDON_DEBUG("addon {} hit a transient I/O error while stopping: {}", inst.id(), e.what());
      }
    } else {
      error = e.what();
      LOG_ADDON_ERROR("addon {} failed to stop: {}", inst.id(), e.what());
    }
  }
  inst.set_state(AddonState::Stopped);
  return error;
}

void AddonLifecycleManager::UnloadLocked(AddonInstance& inst) {
  inst.module.reset();
  inst.host.reset();
  inst.set_state(AddonState::Unloaded);
}

}  // namespace addon
}  // namespace signage
