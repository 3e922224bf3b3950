// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "network/announcement.hpp"
#include "network/http_client.hpp"
#include "network/peer.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace signage {
namespace network {

// PeerRegistry - owns the table of sibling devices
//
// Writers (discovery receive loop, sweep timer, liveness probes, RPC) are
// serialized under one mutex. Readers get snapshot copies, so a fan-out never
// observes a half-updated record.
//
// The change callback fires outside the lock after a peer is added, removed,
// renamed or flips online state.
class PeerRegistry {
public:
  struct Config {
    std::string display_name;  // our own name; announcements carrying it are ignored
    uint16_t api_port;         // our HTTP API port (default for manual peers)
    std::string static_ip;     // empty = none configured
    std::chrono::milliseconds liveness_timeout;

    Config() : api_port(3000), liveness_timeout(2000) {}
  };

  using ChangeCallback = std::function<void()>;

  explicit PeerRegistry(const Config& config = Config{}, std::shared_ptr<HttpClient> http = nullptr);

  // Upsert a discovered peer from an announcement received from source_ip.
  // Returns true if a new peer was inserted.
  bool UpsertFromAnnouncement(const Announcement& msg, const std::string& source_ip);

  // Add (or replace) a manual peer. port 0 = our own API port.
  // Throws CoreError(ValidationError) for an address that is neither numeric nor "localhost".
  Peer AddManual(const std::string& ip, const std::string& name, uint16_t port = 0);

  bool Remove(const std::string& id);

  std::vector<Peer> List() const;
  std::optional<Peer> Get(const std::string& id) const;
  size_t size() const;

  // Drop discovered peers not heard from within max_age. Returns number removed.
  size_t SweepStale(std::chrono::milliseconds max_age);

  // Probe GET /api/config on the peer. Never throws.
  bool CheckLiveness(const Peer& peer);
  bool CheckLiveness(const std::string& id);

  void MarkOnline(const std::string& id, bool online);

  // Persistence of manual peers (discovered ones are never persisted)
  std::vector<Peer> ManualPeers() const;
  void LoadManual(const std::vector<Peer>& peers);

  void SetIdentity(const std::string& display_name, uint16_t api_port, const std::string& static_ip);
  Config config() const;

  void SetChangeCallback(ChangeCallback callback);

private:
  // Address used to reach a peer; loopback peers go through the static IP when set
  std::string ProbeAddress(const Peer& peer) const;
  void NotifyChanged();

  mutable std::mutex mutex_;
  Config config_;
  std::map<std::string, Peer> peers_;
  ChangeCallback on_change_;
  std::shared_ptr<HttpClient> http_;
};

}  // namespace network
}  // namespace signage
