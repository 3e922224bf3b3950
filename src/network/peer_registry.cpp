// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/peer_registry.hpp"

#include "util/error.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"

#include <nlohmann/json.hpp>

namespace signage {
namespace network {

PeerRegistry::PeerRegistry(const Config& config, std::shared_ptr<HttpClient> http)
    : config_(config), http_(http ? std::move(http) : std::make_shared<HttplibClient>()) {}

bool PeerRegistry::UpsertFromAnnouncement(const Announcement& msg, const std::string& source_ip) {
  bool inserted = false;
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (msg.id == config_.display_name) {
      return false;
    }

    // A sibling on this machine shows up as 127.0.0.1. Give it the static IP
    // so other devices can reach it, unless it is this process's own port.
    std::string ip;
    if (util::IsLoopback(source_ip)) {
      if (!config_.static_ip.empty() && msg.port != config_.api_port) {
        ip = config_.static_ip;
      } else {
        ip = "localhost";
      }
    } else {
      auto normalized = util::ValidateAndNormalizeIP(source_ip);
      if (!normalized) {
        LOG_NET_TRACE("announcement from unparseable source '{}' dropped", source_ip);
        return false;
      }
      ip = *normalized;
    }

    const std::string id = MakePeerId(ip, msg.port);
    const int64_t now = util::GetTimeMillis();

    auto it = peers_.find(id);
    if (it != peers_.end()) {
      Peer& peer = it->second;
      changed = !peer.online || peer.name != msg.name;
      peer.name = msg.name;
      peer.port = msg.port;
      peer.last_seen = now;
      peer.online = true;
    } else {
      Peer peer;
      peer.id = id;
      peer.name = msg.name;
      peer.ip = ip;
      peer.port = msg.port;
      peer.manual = false;
      peer.online = true;
      peer.last_seen = now;
      peers_.emplace(id, std::move(peer));
      inserted = true;
      changed = true;
      LOG_NET_INFO("discovered peer {} ({})", msg.name, id);
    }
  }

  if (changed) {
    NotifyChanged();
  }
  return inserted;
}

Peer PeerRegistry::AddManual(const std::string& ip, const std::string& name, uint16_t port) {
  auto host = util::NormalizePeerHost(ip);
  if (!host) {
    throw CoreError(ErrorCode::ValidationError, "invalid peer address: '" + ip + "'");
  }

  Peer peer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    peer.ip = *host;
    peer.port = port != 0 ? port : config_.api_port;
    peer.id = MakePeerId(peer.ip, peer.port);
    peer.name = name.empty() ? peer.ip : name;
    peer.manual = true;
    peer.online = false;
    peers_[peer.id] = peer;
  }
  LOG_NET_INFO("added manual peer {} ({})", peer.name, peer.id);
  NotifyChanged();
  return peer;
}

bool PeerRegistry::Remove(const std::string& id) {
  size_t erased;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    erased = peers_.erase(id);
  }
  if (erased > 0) {
    LOG_NET_INFO("removed peer {}", id);
    NotifyChanged();
  }
  return erased > 0;
}

std::vector<Peer> PeerRegistry::List() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Peer> out;
  out.reserve(peers_.size());
  for (const auto& [id, peer] : peers_) {
    out.push_back(peer);
  }
  return out;
}

std::optional<Peer> PeerRegistry::Get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(id);
  if (it == peers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

size_t PeerRegistry::SweepStale(std::chrono::milliseconds max_age) {
  size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = util::GetTimeMillis();
    for (auto it = peers_.begin(); it != peers_.end();) {
      const Peer& peer = it->second;
      if (!peer.manual && now - peer.last_seen >= max_age.count()) {
        LOG_NET_DEBUG("peer {} ({}) went quiet, dropping", peer.name, peer.id);
        it = peers_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  if (removed > 0) {
    NotifyChanged();
  }
  return removed;
}

std::string PeerRegistry::ProbeAddress(const Peer& peer) const {
  if (!config_.static_ip.empty() && (peer.ip == "localhost" || util::IsLoopback(peer.ip))) {
    return config_.static_ip;
  }
  return peer.ip;
}

bool PeerRegistry::CheckLiveness(const Peer& peer) {
  HttpRequest request;
  std::chrono::milliseconds timeout;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    request.host = ProbeAddress(peer);
    timeout = config_.liveness_timeout;
  }
  request.method = "GET";
  request.port = peer.port;
  request.target = "/api/config";
  request.timeout = timeout;

  bool online = false;
  std::string display_name;
  try {
    HttpResult result = http_->Perform(request);
    online = result.ok && result.response.is_success();
    if (online) {
      auto body = nlohmann::json::parse(result.response.body, nullptr, /*allow_exceptions=*/false);
      if (body.is_object()) {
        auto it = body.find("displayName");
        if (it != body.end() && it->is_string()) {
          display_name = it->get<std::string>();
        }
      }
    } else {
      LOG_NET_DEBUG("peer {} unreachable: {}", peer.id,
                    result.ok ? "HTTP " + std::to_string(result.response.status) : result.error);
    }
  } catch (const std::exception& e) {
    LOG_NET_WARN("liveness probe of {} failed: {}", peer.id, e.what());
    online = false;
  }

  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(peer.id);
    if (it != peers_.end()) {
      Peer& stored = it->second;
      changed = stored.online != online;
      stored.online = online;
      stored.last_checked = util::GetTimeMillis();
      if (!display_name.empty() && display_name != stored.name) {
        stored.name = display_name;
        changed = true;
      }
    }
  }
  if (changed) {
    NotifyChanged();
  }
  return online;
}

bool PeerRegistry::CheckLiveness(const std::string& id) {
  auto peer = Get(id);
  if (!peer) {
    throw CoreError(ErrorCode::NotFound, "unknown peer: " + id);
  }
  return CheckLiveness(*peer);
}

void PeerRegistry::MarkOnline(const std::string& id, bool online) {
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(id);
    if (it != peers_.end() && it->second.online != online) {
      it->second.online = online;
      changed = true;
    }
  }
  if (changed) {
    NotifyChanged();
  }
}

std::vector<Peer> PeerRegistry::ManualPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Peer> out;
  for (const auto& [id, peer] : peers_) {
    if (peer.manual) {
      out.push_back(peer);
    }
  }
  return out;
}

void PeerRegistry::LoadManual(const std::vector<Peer>& peers) {
  size_t loaded = 0;
  for (const auto& peer : peers) {
    try {
      AddManual(peer.ip, peer.name, peer.port);
      ++loaded;
    } catch (const CoreError& e) {
      LOG_NET_WARN("skipping saved peer: {}", e.what());
    }
  }
  LOG_NET_DEBUG("restored {} manual peer(s)", loaded);
}

void PeerRegistry::SetIdentity(const std::string& display_name, uint16_t api_port, const std::string& static_ip) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.display_name = display_name;
  config_.api_port = api_port;
  config_.static_ip = static_ip;
}

PeerRegistry::Config PeerRegistry::config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

void PeerRegistry::SetChangeCallback(ChangeCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_change_ = std::move(callback);
}

void PeerRegistry::NotifyChanged() {
  ChangeCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callback = on_change_;
  }
  if (!callback) {
    return;
  }
  try {
    callback();
  } catch (const std::exception& e) {
    LOG_NET_ERROR("peer change listener threw: {}", e.what());
  }
}

}  // namespace network
}  // namespace signage
