// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "infra/test_module_loader.hpp"

#include "util/error.hpp"

#include <stdexcept>
#include <system_error>
#include <thread>

namespace signage {
namespace test {

namespace {

class InstrumentedModule : public addon::LoadedModule {
public:
  InstrumentedModule(std::shared_ptr<AddonProbe> probe, addon::AddonHost& host) : addon_(std::move(probe), host) {}
  addon::Addon& addon() override { return addon_; }

private:
  InstrumentedAddon addon_;
};

}  // namespace

InstrumentedAddon::InstrumentedAddon(std::shared_ptr<AddonProbe> probe, addon::AddonHost& host)
    : probe_(std::move(probe)), host_(host) {}

InstrumentedAddon::~InstrumentedAddon() {
  probe_->destroyed++;
}

void InstrumentedAddon::Enter(const char* event) {
  if (probe_->in_hook.fetch_add(1) != 0) {
    probe_->overlapped = true;
  }
  {
    std::lock_guard<std::mutex> lock(probe_->mutex);
    probe_->events.emplace_back(event);
  }
  if (int delay = probe_->hook_delay_ms.load(); delay > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
  }
}

void InstrumentedAddon::Exit() {
  probe_->in_hook.fetch_sub(1);
}

void InstrumentedAddon::Init(const nlohmann::json& config) {
  Enter("init");
  probe_->init_calls++;
  {
    std::lock_guard<std::mutex> lock(probe_->mutex);
    probe_->last_init_config = config;
  }
  config_ = config;
  Exit();
  if (probe_->throw_on_init) {
    throw std::runtime_error("init failed on purpose");
  }
}

void InstrumentedAddon::UpdateConfig(const nlohmann::json& config) {
  Enter("update");
  probe_->update_calls++;
  config_ = config;
  Exit();
}

void InstrumentedAddon::Stop() {
  Enter("stop");
  probe_->stop_calls++;
  Exit();
  if (probe_->throw_on_stop) {
    throw std::system_error(std::make_error_code(std::errc::broken_pipe), "write to display");
  }
}

std::optional<std::string> InstrumentedAddon::FrontendScript() const {
  return addon::WrapFrontendScript(config_, "/* " + host_.addon_id() + " */");
}

std::optional<std::string> InstrumentedAddon::AssetData(const std::string& name) const {
  if (name == "echo") {
    return config_.dump();
  }
  return std::nullopt;
}

std::unique_ptr<addon::LoadedModule> TestModuleLoader::Load(const addon::AddonManifest& manifest,
                                                            const std::filesystem::path& addon_dir,
                                                            addon::AddonHost& host) {
  (void)addon_dir;
  std::shared_ptr<AddonProbe> probe;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_.count(manifest.id)) {
      throw CoreError(ErrorCode::LifecycleError, manifest.id + ": module failed to load");
    }
    auto& slot = probes_[manifest.id];
    if (!slot) {
      slot = std::make_shared<AddonProbe>();
    }
    probe = slot;
    loads_[manifest.id]++;
    hosts_[manifest.id] = &host;
  }
  return std::make_unique<InstrumentedModule>(probe, host);
}

std::shared_ptr<AddonProbe> TestModuleLoader::Probe(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = probes_[id];
  if (!slot) {
    slot = std::make_shared<AddonProbe>();
  }
  return slot;
}

void TestModuleLoader::FailLoad(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  failing_.insert(id);
}

int TestModuleLoader::load_count(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loads_.find(id);
  return it == loads_.end() ? 0 : it->second;
}

addon::AddonHost* TestModuleLoader::last_host(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = hosts_.find(id);
  return it == hosts_.end() ? nullptr : it->second;
}

}  // namespace test
}  // namespace signage
