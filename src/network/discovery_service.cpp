// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/discovery_service.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include <stdexcept>

namespace signage {
namespace network {

namespace {

// Staleness must cover several missed announcements
constexpr int kMinAnnouncementsPerWindow = 5;

}  // namespace

DiscoveryService::DiscoveryService(asio::io_context& io_context, PeerRegistry& registry, const Config& config)
    : io_context_(io_context), registry_(registry), config_(config), socket_(io_context) {}

DiscoveryService::~DiscoveryService() {
  Stop();
}

void DiscoveryService::Start() {
  std::lock_guard<std::mutex> guard(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return;
  }

  Config config;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config = config_;
    bind_error_.reset();
  }

  if (config.announce_interval.count() <= 0 || config.sweep_interval.count() <= 0) {
    throw std::invalid_argument("discovery intervals must be positive");
  }
  if (config.staleness < config.announce_interval * kMinAnnouncementsPerWindow) {
    throw std::invalid_argument("discovery staleness window (" + std::to_string(config.staleness.count()) +
                                "ms) must be at least " + std::to_string(kMinAnnouncementsPerWindow) +
                                " announce intervals (" + std::to_string(config.announce_interval.count()) + "ms)");
  }

  asio::error_code ec;
  socket_.open(asio::ip::udp::v4(), ec);
  if (!ec) {
    socket_.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    socket_.set_option(asio::socket_base::broadcast(true), ec);
  }
  if (ec) {
    LOG_NET_ERROR("discovery: cannot open UDP socket: {}", ec.message());
  } else {
    socket_.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), config.port), ec);
    if (ec) {
      LOG_NET_ERROR("discovery: cannot bind UDP port {}: {} (running without discovery listener)", config.port,
                    ec.message());
      std::lock_guard<std::mutex> lock(config_mutex_);
      bind_error_ = ec.message();
    } else {
      asio::error_code ep_ec;
      auto ep = socket_.local_endpoint(ep_ec);
      local_port_.store(ep_ec ? config.port : ep.port(), std::memory_order_release);
      listening_.store(true, std::memory_order_release);
      LOG_NET_INFO("discovery listening on UDP port {}", local_port());
    }
  }

  announce_timer_ = std::make_unique<asio::steady_timer>(io_context_);
  sweep_timer_ = std::make_unique<asio::steady_timer>(io_context_);
  running_.store(true, std::memory_order_release);

  asio::post(io_context_, [this]() {
    if (!running_.load(std::memory_order_acquire))
      return;
    if (listening_.load(std::memory_order_acquire)) {
      start_receive();
    }
    // First announcement goes out immediately
    send_announcements();
    schedule_next_announce();
    schedule_next_sweep();
  });
}

void DiscoveryService::Stop() {
  std::lock_guard<std::mutex> guard(start_stop_mutex_);
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  if (announce_timer_) {
    announce_timer_->cancel();
  }
  if (sweep_timer_) {
    sweep_timer_->cancel();
  }

  asio::error_code ignored;
  socket_.close(ignored);
  listening_.store(false, std::memory_order_release);
  local_port_.store(0, std::memory_order_release);
  LOG_NET_DEBUG("discovery stopped");
}

std::optional<std::string> DiscoveryService::bind_error() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return bind_error_;
}

void DiscoveryService::AnnounceNow() {
  asio::post(io_context_, [this]() {
    if (running_.load(std::memory_order_acquire)) {
      send_announcements();
    }
  });
}

void DiscoveryService::SetIdentity(const std::string& display_name, uint16_t api_port, const std::string& static_ip) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_.display_name = display_name;
  config_.api_port = api_port;
  config_.static_ip = static_ip;
}

std::vector<std::string> DiscoveryService::AnnounceTargets() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  std::vector<std::string> targets{"255.255.255.255", "127.0.0.1"};
  if (!config_.static_ip.empty()) {
    auto subnet = util::SubnetBroadcastV4(config_.static_ip);
    if (subnet && *subnet != targets[0]) {
      targets.push_back(*subnet);
    }
  }
  return targets;
}

void DiscoveryService::start_receive() {
  socket_.async_receive_from(asio::buffer(recv_buffer_), remote_endpoint_,
                             [this](const asio::error_code& ec, size_t bytes) {
                               if (ec == asio::error::operation_aborted || !running_.load(std::memory_order_acquire)) {
                                 return;
                               }
                               if (ec) {
                                 // Transient (e.g. ICMP port unreachable surfaced on the socket)
                                 LOG_NET_DEBUG("discovery receive error: {}", ec.message());
                               } else {
                                 handle_datagram(bytes);
                               }
                               start_receive();
                             });
}

void DiscoveryService::handle_datagram(size_t bytes) {
  datagrams_received_.fetch_add(1, std::memory_order_relaxed);

  auto msg = DecodeAnnouncement(std::string_view(recv_buffer_.data(), bytes));
  const std::string source = remote_endpoint_.address().to_string();
  if (!msg) {
    datagrams_dropped_.fetch_add(1, std::memory_order_relaxed);
    LOG_NET_TRACE("discovery: dropped {} byte datagram from {}", bytes, source);
    return;
  }

  try {
    registry_.UpsertFromAnnouncement(*msg, source);
  } catch (const std::exception& e) {
    LOG_NET_ERROR("discovery: failed to record announcement from {}: {}", source, e.what());
  }
}

void DiscoveryService::send_announcements() {
  if (!socket_.is_open()) {
    return;
  }

  Announcement msg;
  uint16_t dest_port;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    msg.id = config_.display_name;
    msg.name = config_.display_name;
    msg.port = config_.api_port;
    dest_port = config_.announce_port != 0 ? config_.announce_port : config_.port;
  }
  if (dest_port == 0) {
    return;
  }

  auto payload = std::make_shared<std::string>(EncodeAnnouncement(msg));
  for (const auto& target : AnnounceTargets()) {
    asio::error_code ec;
    auto address = asio::ip::make_address(target, ec);
    if (ec) {
      continue;
    }
    asio::ip::udp::endpoint endpoint(address, dest_port);
    socket_.async_send_to(asio::buffer(*payload), endpoint,
                          [payload, target](const asio::error_code& send_ec, size_t) {
                            if (send_ec && send_ec != asio::error::operation_aborted) {
                              LOG_NET_TRACE("discovery: announce to {} failed: {}", target, send_ec.message());
                            }
                          });
  }
}

void DiscoveryService::schedule_next_announce() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::chrono::milliseconds interval;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    interval = config_.announce_interval;
  }
  announce_timer_->expires_after(interval);
  announce_timer_->async_wait([this](const asio::error_code& ec) {
    if (!ec && running_.load(std::memory_order_acquire)) {
      send_announcements();
      schedule_next_announce();
    }
  });
}

void DiscoveryService::schedule_next_sweep() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  std::chrono::milliseconds interval;
  std::chrono::milliseconds staleness;
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    interval = config_.sweep_interval;
    staleness = config_.staleness;
  }
  sweep_timer_->expires_after(interval);
  sweep_timer_->async_wait([this, staleness](const asio::error_code& ec) {
    if (!ec && running_.load(std::memory_order_acquire)) {
      try {
        size_t removed = registry_.SweepStale(staleness);
        if (removed > 0) {
          LOG_NET_DEBUG("discovery sweep removed {} peer(s)", removed);
        }
      } catch (const std::exception& e) {
        LOG_NET_ERROR("discovery sweep failed: {}", e.what());
      }
      schedule_next_sweep();
    }
  });
}

}  // namespace network
}  // namespace signage
