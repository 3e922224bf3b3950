// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "app/coordinator.hpp"

#include "util/error.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"

#include <stdexcept>

namespace signage {
namespace app {

namespace {

uint16_t PortFrom(const nlohmann::json& stored, const char* key, uint16_t fallback) {
  auto it = stored.find(key);
  if (it == stored.end() || !it->is_number_integer()) {
    return fallback;
  }
  int64_t v = it->get<int64_t>();
  return (v > 0 && v <= 65535) ? static_cast<uint16_t>(v) : fallback;
}

std::string StringFrom(const nlohmann::json& stored, const char* key) {
  auto it = stored.find(key);
  return (it != stored.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

// Type checks for the keys the core itself consumes
void ValidateCorePatch(const nlohmann::json& patch) {
  auto reject = [](const std::string& what) { throw CoreError(ErrorCode::ValidationError, what); };

  if (auto it = patch.find("displayName"); it != patch.end()) {
    if (!it->is_string() || it->get<std::string>().empty())
      reject("displayName must be a non-empty string");
  }
  for (const char* key : {"port", "discoveryPort", "wsPort"}) {
    if (auto it = patch.find(key); it != patch.end()) {
      if (!it->is_number_integer() || it->get<int64_t>() <= 0 || it->get<int64_t>() > 65535)
        reject(std::string(key) + " must be a port number");
    }
  }
  if (auto it = patch.find("staticIp"); it != patch.end()) {
    if (!it->is_string())
      reject("staticIp must be a string");
    const std::string ip = it->get<std::string>();
    if (!ip.empty() && !util::IsValidIPAddress(ip))
      reject("staticIp is not a valid address: " + ip);
  }
}

}  // namespace

network::NetworkManager::Config NetworkConfigFrom(const nlohmann::json& stored, network::NetworkManager::Config base) {
  base.registry.display_name = StringFrom(stored, "displayName");
  base.registry.api_port = PortFrom(stored, "port", base.registry.api_port);
  base.registry.static_ip = StringFrom(stored, "staticIp");
  base.discovery.port = PortFrom(stored, "discoveryPort", base.discovery.port);
  return base;
}

Coordinator::Coordinator(const Config& config, ConfigStore& store, std::shared_ptr<network::HttpClient> http,
                         std::shared_ptr<addon::ModuleLoader> loader,
                         std::shared_ptr<asio::io_context> external_io_context)
    : config_(config), store_(store) {
  if (config_.addons_dir.empty())
    config_.addons_dir = config_.datadir / "addons";
  if (config_.fonts_dir.empty())
    config_.fonts_dir = config_.datadir / "fonts";
  if (config_.media_dir.empty())
    config_.media_dir = config_.datadir / "media";
  if (config_.updates_dir.empty())
    config_.updates_dir = config_.datadir / "updates";

  network_ = std::make_unique<network::NetworkManager>(config_.network, std::move(http), std::move(external_io_context));
  network_->registry().SetChangeCallback(
      [this]() { notifications_.NotifyPeersChanged(PeersChangedEvent{network_->registry().List()}); });
  network_->dispatcher().SetLocalHandler(
      [this](network::FanoutOperation op, const network::FanoutPayload& payload) { HandleLocalOperation(op, payload); });

  addon_registry_ = std::make_unique<addon::AddonRegistry>(store_, config_.fonts_dir);

  addon::AddonLifecycleManager::HostServices services;
  services.fonts_dir = config_.fonts_dir;
  services.emit = [this](const std::string& addon_id, const nlohmann::json& message) {
    notifications_.NotifyAddonMessage(AddonMessageEvent{addon_id, message});
  };
  services.request_restart = [this]() { return RequestRestart(); };
  addon_lifecycle_ = std::make_unique<addon::AddonLifecycleManager>(*addon_registry_, std::move(loader), services);
}

Coordinator::~Coordinator() {
  Stop();
  addon_lifecycle_.reset();
  network_->registry().SetChangeCallback(nullptr);
}

bool Coordinator::Start() {
  if (started_.load(std::memory_order_acquire)) {
    return true;
  }

  for (const auto& dir : {config_.media_dir, config_.updates_dir, config_.fonts_dir}) {
    if (!util::ensure_directory(dir)) {
      LOG_APP_WARN("cannot create {}", dir.string());
    }
  }

  // Manual peers survive restarts; discovered ones are relearned
  nlohmann::json saved = store_.Snapshot().value("manualPeers", nlohmann::json::array());
  if (saved.is_array()) {
    std::vector<network::Peer> peers;
    for (const auto& entry : saved) {
      if (!entry.is_object())
        continue;
      network::Peer p;
      p.ip = StringFrom(entry, "ip");
      p.name = StringFrom(entry, "name");
      p.port = PortFrom(entry, "port", 0);
      peers.push_back(std::move(p));
    }
    network_->registry().LoadManual(peers);
  }

  if (!network_->start()) {
    LOG_APP_ERROR("networking failed to start");
    return false;
  }

  try {
    addon_registry_->Scan(config_.addons_dir);
  } catch (const std::exception& e) {
    LOG_APP_ERROR("addon scan failed, continuing without addons: {}", e.what());
  }
  size_t running = addon_lifecycle_->StartAll();
  LOG_APP_INFO("{} addon(s) running", running);

  started_.store(true, std::memory_order_release);
  return true;
}

void Coordinator::Stop() {
  if (!started_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  addon_lifecycle_->StopAll();
  network_->stop();
}

std::vector<network::Peer> Coordinator::ListPeers() const {
  return network_->registry().List();
}

network::Peer Coordinator::AddManualPeer(const std::string& ip, const std::string& name, uint16_t port) {
  network::Peer peer = network_->registry().AddManual(ip, name, port);
  PersistManualPeers();
  return peer;
}

bool Coordinator::RemovePeer(const std::string& id) {
  auto existing = network_->registry().Get(id);
  bool removed = network_->registry().Remove(id);
  if (removed && existing && existing->manual) {
    PersistManualPeers();
  }
  return removed;
}

bool Coordinator::CheckPeer(const std::string& id) {
  return network_->registry().CheckLiveness(id);
}

network::FanoutResult Coordinator::Fanout(const std::vector<std::string>& target_ids, network::FanoutOperation op,
                                          const network::FanoutPayload& payload,
                                          std::optional<std::chrono::milliseconds> timeout) {
  network::FanoutResult result = network_->dispatcher().Dispatch(target_ids, op, payload, timeout);

  // A peer that answered is online; one that could not be reached is not
  for (const auto& r : result.results) {
    if (r.target_id == network::kLocalPeerId) {
      continue;
    }
    if (r.success) {
      network_->registry().MarkOnline(r.target_id, true);
    } else if (r.code == ErrorCode::Unreachable && r.error != "peer offline") {
      network_->registry().MarkOnline(r.target_id, false);
    }
  }
  return result;
}

std::map<std::string, addon::AddonSummary> Coordinator::ListAddons() const {
  return addon_registry_->GetAddonConfigs();
}

addon::AddonSummary Coordinator::UpdateAddonConfig(const std::string& id, const nlohmann::json& partial) {
  addon::AddonSummary summary = addon_registry_->UpdateConfig(id, partial);
  notifications_.NotifyAddonsChanged(AddonsChangedEvent{id});
  return summary;
}

addon::ReloadReport Coordinator::ReloadAddons() {
  addon::ReloadReport report = addon_lifecycle_->ReloadAll(config_.addons_dir);
  if (report.scan_ok) {
    notifications_.NotifyAddonsChanged(AddonsChangedEvent{});
  }
  return report;
}

std::optional<std::string> Coordinator::AddonFrontendScript(const std::string& id) const {
  return addon_registry_->FrontendScript(id);
}

std::optional<std::string> Coordinator::AddonAssetData(const std::string& id, const std::string& name) const {
  return addon_registry_->AssetData(id, name);
}

nlohmann::json Coordinator::ApplyLocalConfig(const nlohmann::json& patch) {
  if (!patch.is_object()) {
    throw CoreError(ErrorCode::ValidationError, "config patch must be a JSON object");
  }
  nlohmann::json clean = patch;
  clean.erase("password");
  ValidateCorePatch(clean);

  nlohmann::json updated = store_.Merge(clean);

  network_->UpdateIdentity(StringFrom(updated, "displayName"), PortFrom(updated, "port", 3000),
                           StringFrom(updated, "staticIp"));
  LOG_APP_INFO("device settings updated ({} key(s))", clean.size());
  notifications_.NotifyConfigChanged(ConfigChangedEvent{updated});
  return updated;
}

std::filesystem::path Coordinator::ReceiveMedia(const std::filesystem::path& source, const std::string& filename) {
  const std::filesystem::path name = std::filesystem::path(filename).filename();
  if (name.empty() || name == "." || name == ".." || filename.find_first_of("/\\") != std::string::npos) {
    throw CoreError(ErrorCode::ValidationError, "invalid media file name: '" + filename + "'");
  }

  const auto dest = config_.media_dir / name;
  if (!util::atomic_copy_file(source, dest)) {
    throw std::runtime_error("could not store media file " + name.string());
  }
  LOG_APP_INFO("media file {} received", name.string());
  notifications_.NotifyMediaChanged(MediaChangedEvent{name.string()});
  return dest;
}

std::filesystem::path Coordinator::ReceiveUpdate(const std::filesystem::path& source, bool restart_pc) {
  const auto dest = config_.updates_dir / ("pending-update" + source.extension().string());
  if (!util::atomic_copy_file(source, dest)) {
    throw std::runtime_error("could not stage update package");
  }

  std::error_code ec;
  const auto size = std::filesystem::file_size(dest, ec);
  nlohmann::json info{
      {"version", util::FormatIsoTime(util::GetTimeMillis())},
      {"path", dest.string()},
      {"originalName", source.filename().string()},
      {"size", ec ? 0 : size},
      {"applied", false},
      {"restartPC", restart_pc},
  };
  if (!util::atomic_write_file(config_.updates_dir / "update-info.json", info.dump(2) + "\n")) {
    throw std::runtime_error("could not write update-info.json");
  }
  LOG_APP_INFO("update package staged at {} (restart after install: {})", dest.string(), restart_pc);

  InstallerCallback installer;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    installer = installer_;
  }
  if (installer) {
    installer(dest, restart_pc);
  } else {
    LOG_APP_WARN("no installer configured; update left staged");
  }
  return dest;
}

void Coordinator::SetInstaller(InstallerCallback installer) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  installer_ = std::move(installer);
}

void Coordinator::SetRestartHandler(RestartCallback handler) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  restart_handler_ = std::move(handler);
}

bool Coordinator::RequestRestart() {
  RestartCallback handler;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    handler = restart_handler_;
  }
  return handler ? handler() : false;
}

void Coordinator::HandleLocalOperation(network::FanoutOperation op, const network::FanoutPayload& payload) {
  switch (op) {
  case network::FanoutOperation::ApplyConfig:
    ApplyLocalConfig(payload.config);
    break;
  case network::FanoutOperation::UploadMedia:
    ReceiveMedia(payload.file, payload.filename);
    break;
  case network::FanoutOperation::PushUpdate:
    ReceiveUpdate(payload.file, payload.restart_pc);
    break;
  }
}

void Coordinator::PersistManualPeers() {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& peer : network_->registry().ManualPeers()) {
    list.push_back({{"ip", peer.ip}, {"name", peer.name}, {"port", peer.port}});
  }
  try {
    store_.Set("manualPeers", list);
  } catch (const std::exception& e) {
    LOG_APP_ERROR("could not save manual peers: {}", e.what());
  }
}

}  // namespace app
}  // namespace signage
