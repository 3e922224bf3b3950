// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace signage {
namespace network {

// Synthetic fan-out target that resolves to this device (no network hop)
inline constexpr const char* kLocalPeerId = "local";

// A sibling signage player.
//
// A peer is either manual (added by an operator, never evicted) or
// discovered (created from a UDP announcement and evicted by the sweep when
// announcements stop). The id "<ip>:<port>" is fixed for the record's lifetime.
struct Peer {
  std::string id;
  std::string name;
  std::string ip;
  uint16_t port{0};
  bool manual{false};
  bool online{false};
  int64_t last_seen{0};     // ms, last announcement (discovered peers)
  int64_t last_checked{0};  // ms, last liveness probe
};

std::string MakePeerId(const std::string& ip, uint16_t port);

// Base URL of the peer's HTTP API, e.g. "http://192.168.1.20:3000"
std::string PeerBaseUrl(const Peer& peer);

nlohmann::json PeerToJson(const Peer& peer);

}  // namespace network
}  // namespace signage
