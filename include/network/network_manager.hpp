// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery_service.hpp"
#include "network/fanout_dispatcher.hpp"
#include "network/http_client.hpp"
#include "network/peer_health_monitor.hpp"
#include "network/peer_registry.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <asio/executor_work_guard.hpp>

namespace signage {
namespace network {

// NetworkManager - owns the device-to-device side of the node
//
// Components:
// - PeerRegistry: table of sibling devices
// - DiscoveryService: UDP announce/listen + stale-peer sweep
// - PeerHealthMonitor: periodic liveness probes
// - FanoutDispatcher: config/media/update fan-out
//
// Single-threaded networking reactor:
// - All timers and the UDP socket run on one io_context thread
// - Config::io_threads MUST be 1 in production (0 = external io_context for tests)
// - HTTP requests never run on the reactor; they block worker threads instead
class NetworkManager {
public:
  struct Config {
    size_t io_threads;       // MUST be 1 in production (0 = external io_context for tests)
    bool discovery_enabled;  // false = manual peers only

    PeerRegistry::Config registry;
    DiscoveryService::Config discovery;
    PeerHealthMonitor::Config health;

    Config() : io_threads(1), discovery_enabled(true) {}
  };

  // http: nullptr = plain asio client. external_io_context: nullptr = create owned.
  explicit NetworkManager(const Config& config = Config{}, std::shared_ptr<HttpClient> http = nullptr,
                          std::shared_ptr<asio::io_context> external_io_context = nullptr);
  ~NetworkManager();

  // Returns false if a component refused its configuration
  bool start();

  // Idempotent; blocks until the IO thread has exited
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  PeerRegistry& registry() { return *registry_; }
  FanoutDispatcher& dispatcher() { return *dispatcher_; }
  PeerHealthMonitor& health_monitor() { return *health_monitor_; }
  DiscoveryService* discovery() { return discovery_.get(); }

  // Display name / API port / static IP changed in the config store
  void UpdateIdentity(const std::string& display_name, uint16_t api_port, const std::string& static_ip);

private:
  Config config_;
  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;

  std::shared_ptr<asio::io_context> io_context_;
  bool external_io_context_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::vector<std::thread> io_threads_;

  std::shared_ptr<HttpClient> http_;
  std::unique_ptr<PeerRegistry> registry_;
  std::unique_ptr<DiscoveryService> discovery_;
  std::unique_ptr<PeerHealthMonitor> health_monitor_;
  std::unique_ptr<FanoutDispatcher> dispatcher_;
};

}  // namespace network
}  // namespace signage
