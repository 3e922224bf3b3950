// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_registry.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>

namespace signage {
namespace network {

// DiscoveryService - UDP broadcast announce / listen
//
// Stopped -> Listening -> Stopped. While listening:
// - a receive loop hands every well-formed announcement to the PeerRegistry
// - an announce timer broadcasts our identity
// - a sweep timer evicts discovered peers that stopped announcing
//
// The two timers are independent and keep running when the socket fails to
// bind (degraded mode: we cannot hear siblings but they can still hear us).
//
// Threading: socket and timer handlers run on the io_context thread.
// Start()/Stop() may be called from any thread.
class DiscoveryService {
public:
  struct Config {
    uint16_t port;           // UDP port to bind (0 = ephemeral, tests)
    uint16_t announce_port;  // destination port for announcements (0 = same as port)
    std::chrono::milliseconds announce_interval;
    std::chrono::milliseconds sweep_interval;
    std::chrono::milliseconds staleness;  // must be >= 5 x announce_interval

    std::string display_name;
    uint16_t api_port;
    std::string static_ip;  // adds the /24 broadcast of this address as a target

    Config()
        : port(3002), announce_port(0), announce_interval(5000), sweep_interval(10000), staleness(30000),
          api_port(3000) {}
  };

  DiscoveryService(asio::io_context& io_context, PeerRegistry& registry, const Config& config = Config{});
  ~DiscoveryService();

  DiscoveryService(const DiscoveryService&) = delete;
  DiscoveryService& operator=(const DiscoveryService&) = delete;

  // Throws std::invalid_argument if the staleness window is shorter than
  // five announce intervals. A bind failure does not throw; see bind_error().
  void Start();

  // Idempotent
  void Stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }
  bool is_listening() const { return listening_.load(std::memory_order_acquire); }
  std::optional<std::string> bind_error() const;

  // Bound UDP port (0 if not bound)
  uint16_t local_port() const { return local_port_.load(std::memory_order_acquire); }

  // Queue one announcement round on the io_context
  void AnnounceNow();

  void SetIdentity(const std::string& display_name, uint16_t api_port, const std::string& static_ip);

  // Destination addresses for the next announcement round
  std::vector<std::string> AnnounceTargets() const;

  uint64_t datagrams_received() const { return datagrams_received_.load(std::memory_order_relaxed); }
  uint64_t datagrams_dropped() const { return datagrams_dropped_.load(std::memory_order_relaxed); }

private:
  void start_receive();
  void handle_datagram(size_t bytes);
  void send_announcements();
  void schedule_next_announce();
  void schedule_next_sweep();

  asio::io_context& io_context_;
  PeerRegistry& registry_;

  mutable std::mutex config_mutex_;
  Config config_;

  asio::ip::udp::socket socket_;
  asio::ip::udp::endpoint remote_endpoint_;
  std::array<char, kMaxAnnouncementSize> recv_buffer_{};

  std::unique_ptr<asio::steady_timer> announce_timer_;
  std::unique_ptr<asio::steady_timer> sweep_timer_;

  std::atomic<bool> running_{false};
  std::atomic<bool> listening_{false};
  std::atomic<uint16_t> local_port_{0};
  std::optional<std::string> bind_error_;  // guarded by config_mutex_

  std::atomic<uint64_t> datagrams_received_{0};
  std::atomic<uint64_t> datagrams_dropped_{0};

  // Serializes Start/Stop
  std::mutex start_stop_mutex_;
};

}  // namespace network
}  // namespace signage
