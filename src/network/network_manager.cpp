// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/network_manager.hpp"

#include "util/logging.hpp"

#include <stdexcept>

namespace signage {
namespace network {

NetworkManager::NetworkManager(const Config& config, std::shared_ptr<HttpClient> http,
                               std::shared_ptr<asio::io_context> external_io_context)
    : config_(config),
      io_context_(external_io_context ? external_io_context : std::make_shared<asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      http_(http ? std::move(http) : std::make_shared<HttplibClient>()) {
  registry_ = std::make_unique<PeerRegistry>(config_.registry, http_);

  // Discovery identity follows the registry's
  config_.discovery.display_name = config_.registry.display_name;
  config_.discovery.api_port = config_.registry.api_port;
  config_.discovery.static_ip = config_.registry.static_ip;
  if (config_.discovery_enabled) {
    discovery_ = std::make_unique<DiscoveryService>(*io_context_, *registry_, config_.discovery);
  }

  health_monitor_ = std::make_unique<PeerHealthMonitor>(*io_context_, *registry_, config_.health);
  dispatcher_ = std::make_unique<FanoutDispatcher>(*registry_, http_);
}

NetworkManager::~NetworkManager() {
  stop();
}

bool NetworkManager::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  if (discovery_) {
    try {
      discovery_->Start();
    } catch (const std::invalid_argument& e) {
      LOG_NET_ERROR("discovery configuration rejected: {}", e.what());
      return false;
    }
  }
  health_monitor_->Start();

  if (config_.io_threads > 0 && !external_io_context_) {
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        asio::make_work_guard(*io_context_));
    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          io_context_->run();
        } catch (const std::exception& e) {
          LOG_NET_ERROR("network reactor stopped by exception: {}", e.what());
        }
      });
    }
  }

  running_.store(true, std::memory_order_release);
  LOG_NET_INFO("network started (discovery {})", discovery_ ? "on" : "off");
  return true;
}

void NetworkManager::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  // 1. Stop components while the reactor still runs so cancellations are delivered
  if (discovery_) {
    discovery_->Stop();
  }
  health_monitor_->Stop();

  // 2. Stop the reactor (only if we own it)
  if (!external_io_context_) {
    if (work_guard_) {
      work_guard_.reset();
    }
    io_context_->stop();
    for (auto& thread : io_threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    io_threads_.clear();
    io_context_->restart();
  }
  LOG_NET_DEBUG("network stopped");
}

void NetworkManager::UpdateIdentity(const std::string& display_name, uint16_t api_port, const std::string& static_ip) {
  registry_->SetIdentity(display_name, api_port, static_ip);
  if (discovery_) {
    discovery_->SetIdentity(display_name, api_port, static_ip);
  }
}

}  // namespace network
}  // namespace signage
