// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/peer_health_monitor.hpp"

#include "util/logging.hpp"
#include "util/thread_joiner.hpp"

#include <vector>

namespace signage {
namespace network {

PeerHealthMonitor::PeerHealthMonitor(asio::io_context& io_context, PeerRegistry& registry, const Config& config)
    : io_context_(io_context), registry_(registry), config_(config) {}

PeerHealthMonitor::~PeerHealthMonitor() {
  Stop();
}

void PeerHealthMonitor::Start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  timer_ = std::make_unique<asio::steady_timer>(io_context_);
  asio::post(io_context_, [this]() { schedule_next(); });
}

void PeerHealthMonitor::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    join_worker();
    return;
  }
  if (timer_) {
    timer_->cancel();
  }
  join_worker();
}

void PeerHealthMonitor::join_worker() {
  std::lock_guard<std::mutex> lock(worker_mutex_);
  if (worker_.joinable()) {
    worker_.join();
  }
}

size_t PeerHealthMonitor::CheckAll() {
  auto peers = registry_.List();
  if (peers.empty()) {
    return 0;
  }

  std::vector<char> online(peers.size(), 0);
  std::vector<std::thread> probes;
  util::ThreadJoiner joiner(probes);
  probes.reserve(peers.size());
  for (size_t i = 0; i < peers.size(); ++i) {
    probes.emplace_back([this, &peers, &online, i]() { online[i] = registry_.CheckLiveness(peers[i]) ? 1 : 0; });
  }
  joiner.JoinAll();

  size_t count = 0;
  for (char o : online) {
    count += o ? 1 : 0;
  }
  LOG_NET_TRACE("health check: {}/{} peers online", count, peers.size());
  return count;
}

void PeerHealthMonitor::launch_round() {
  if (round_in_progress_.exchange(true, std::memory_order_acq_rel)) {
    LOG_NET_DEBUG("health check still running, skipping this round");
    return;
  }

  std::lock_guard<std::mutex> lock(worker_mutex_);
  if (worker_.joinable()) {
    // Previous round already finished (round_in_progress_ was false)
    worker_.join();
  }
  worker_ = std::thread([this]() {
    try {
      CheckAll();
    } catch (const std::exception& e) {
      LOG_NET_ERROR("health check round failed: {}", e.what());
    }
    rounds_.fetch_add(1, std::memory_order_relaxed);
    round_in_progress_.store(false, std::memory_order_release);
  });
}

void PeerHealthMonitor::schedule_next() {
  if (!running_.load(std::memory_order_acquire) || !timer_) {
    return;
  }

  timer_->expires_after(config_.interval);
  timer_->async_wait([this](const asio::error_code& ec) {
    if (!ec && running_.load(std::memory_order_acquire)) {
      launch_round();
      schedule_next();
    }
  });
}

}  // namespace network
}  // namespace signage
