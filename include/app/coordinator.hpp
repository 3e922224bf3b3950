// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "addon/addon_lifecycle_manager.hpp"
#include "addon/addon_registry.hpp"
#include "addon/module_loader.hpp"
#include "app/config_store.hpp"
#include "app/notifications.hpp"
#include "network/fanout_dispatcher.hpp"
#include "network/http_client.hpp"
#include "network/network_manager.hpp"

#include <atomic>
#include <chrono>
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

// Coordinator - the facade the display loop, HTTP layer and RPC talk to
//
// Owns the network side (peers, discovery, fan-out) and the addon runtime,
// and turns their changes into Notifications. Reads and writes device
// settings through the ConfigStore it is given.
class Coordinator {
public:
  struct Config {
    std::filesystem::path datadir;
    std::filesystem::path addons_dir;   // empty = <datadir>/addons
    std::filesystem::path fonts_dir;    // empty = <datadir>/fonts
    std::filesystem::path media_dir;    // empty = <datadir>/media
    std::filesystem::path updates_dir;  // empty = <datadir>/updates
    network::NetworkManager::Config network;
  };

  // Hands a staged update package to the installer
  using InstallerCallback = std::function<void(const std::filesystem::path& package, bool restart_pc)>;
  // Restarts the machine; returns false if refused
  using RestartCallback = std::function<bool()>;

  Coordinator(const Config& config, ConfigStore& store, std::shared_ptr<network::HttpClient> http = nullptr,
              std::shared_ptr<addon::ModuleLoader> loader = nullptr,
              std::shared_ptr<asio::io_context> external_io_context = nullptr);
  ~Coordinator();

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  // Restore manual peers, start networking, scan and start addons.
  // Returns false if networking refused to start.
  bool Start();

  // Stop addons, then networking. Idempotent.
  void Stop();

  // --- Peers ---------------------------------------------------------------
  std::vector<network::Peer> ListPeers() const;
  network::Peer AddManualPeer(const std::string& ip, const std::string& name, uint16_t port = 0);
  bool RemovePeer(const std::string& id);
  // Throws CoreError(NotFound) for an unknown id
  bool CheckPeer(const std::string& id);
  network::FanoutResult Fanout(const std::vector<std::string>& target_ids, network::FanoutOperation op,
                               const network::FanoutPayload& payload,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // --- Addons --------------------------------------------------------------
  std::map<std::string, addon::AddonSummary> ListAddons() const;
  addon::AddonSummary UpdateAddonConfig(const std::string& id, const nlohmann::json& partial);
  addon::ReloadReport ReloadAddons();
  std::optional<std::string> AddonFrontendScript(const std::string& id) const;
  std::optional<std::string> AddonAssetData(const std::string& id, const std::string& name) const;

  // --- This device ---------------------------------------------------------
  // Merge a settings patch (password is never taken from a patch). Returns the new config.
  nlohmann::json ApplyLocalConfig(const nlohmann::json& patch);
  // Copy a received media file into the media directory
  std::filesystem::path ReceiveMedia(const std::filesystem::path& source, const std::string& filename);
  // Stage an update package and hand it to the installer
  std::filesystem::path ReceiveUpdate(const std::filesystem::path& source, bool restart_pc);

  void SetInstaller(InstallerCallback installer);
  void SetRestartHandler(RestartCallback handler);

  // --- Notifications -------------------------------------------------------
  Notifications& notifications() { return notifications_; }
  [[nodiscard]] Notifications::Subscription SubscribeConfigChanged(Notifications::ConfigChangedCallback cb) {
    return notifications_.SubscribeConfigChanged(std::move(cb));
  }
  [[nodiscard]] Notifications::Subscription SubscribeMediaChanged(Notifications::MediaChangedCallback cb) {
    return notifications_.SubscribeMediaChanged(std::move(cb));
  }
  [[nodiscard]] Notifications::Subscription SubscribeAddonsChanged(Notifications::AddonsChangedCallback cb) {
    return notifications_.SubscribeAddonsChanged(std::move(cb));
  }
  [[nodiscard]] Notifications::Subscription SubscribeAddonMessage(Notifications::AddonMessageCallback cb) {
    return notifications_.SubscribeAddonMessage(std::move(cb));
  }
  [[nodiscard]] Notifications::Subscription SubscribePeersChanged(Notifications::PeersChangedCallback cb) {
    return notifications_.SubscribePeersChanged(std::move(cb));
  }

  network::NetworkManager& network() { return *network_; }
  addon::AddonRegistry& addon_registry() { return *addon_registry_; }
  addon::AddonLifecycleManager& addon_lifecycle() { return *addon_lifecycle_; }
  const Config& config() const { return config_; }

private:
  void HandleLocalOperation(network::FanoutOperation op, const network::FanoutPayload& payload);
  void PersistManualPeers();
  bool RequestRestart();

  Config config_;
  ConfigStore& store_;
  Notifications notifications_;

  std::unique_ptr<network::NetworkManager> network_;
  std::unique_ptr<addon::AddonRegistry> addon_registry_;
  std::unique_ptr<addon::AddonLifecycleManager> addon_lifecycle_;

  std::mutex callbacks_mutex_;
  InstallerCallback installer_;
  RestartCallback restart_handler_;

  std::atomic<bool> started_{false};
};

// Network settings derived from the stored config (display name, ports, static IP)
network::NetworkManager::Config NetworkConfigFrom(const nlohmann::json& stored,
                                                  network::NetworkManager::Config base = {});

}  // namespace app
}  // namespace signage
