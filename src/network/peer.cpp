// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/peer.hpp"

namespace signage {
namespace network {

std::string MakePeerId(const std::string& ip, uint16_t port) {
  if (ip.find(':') != std::string::npos) {
    return "[" + ip + "]:" + std::to_string(port);
  }
  return ip + ":" + std::to_string(port);
}

std::string PeerBaseUrl(const Peer& peer) {
  return "http://" + MakePeerId(peer.ip, peer.port);
}

nlohmann::json PeerToJson(const Peer& peer) {
  nlohmann::json j;
  j["id"] = peer.id;
  j["name"] = peer.name;
  j["ip"] = peer.ip;
  j["port"] = peer.port;
  j["manual"] = peer.manual;
  j["online"] = peer.online;
  if (peer.last_seen > 0) {
    j["lastSeen"] = peer.last_seen;
  }
  if (peer.last_checked > 0) {
    j["lastChecked"] = peer.last_checked;
  }
  return j;
}

}  // namespace network
}  // namespace signage
