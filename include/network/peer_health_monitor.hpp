// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_registry.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

#include <asio.hpp>

namespace signage {
namespace network {

// Periodically probes every known peer (manual and discovered) and updates
// its online flag. The timer runs on the shared io_context; the probes run
// on a worker thread, one thread per peer, so the reactor never waits on HTTP.
// A round that is still running when the timer fires again is not overlapped.
class PeerHealthMonitor {
public:
  struct Config {
    std::chrono::milliseconds interval;

    Config() : interval(10000) {}
  };

  PeerHealthMonitor(asio::io_context& io_context, PeerRegistry& registry, const Config& config = Config{});
  ~PeerHealthMonitor();

  PeerHealthMonitor(const PeerHealthMonitor&) = delete;
  PeerHealthMonitor& operator=(const PeerHealthMonitor&) = delete;

  void Start();
  void Stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Probe every peer now, blocking until all probes finish. Returns the
  // number of peers found online.
  size_t CheckAll();

  uint64_t rounds_completed() const { return rounds_.load(std::memory_order_relaxed); }

private:
  void schedule_next();
  void launch_round();
  void join_worker();

  asio::io_context& io_context_;
  PeerRegistry& registry_;
  Config config_;

  std::unique_ptr<asio::steady_timer> timer_;
  std::atomic<bool> running_{false};
  std::atomic<bool> round_in_progress_{false};
  std::atomic<uint64_t> rounds_{0};

  std::mutex worker_mutex_;
  std::thread worker_;
};

}  // namespace network
}  // namespace signage
