// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace signage {
namespace app {

// Event value types - immutable snapshots of what happened

struct ConfigChangedEvent {
  nlohmann::json config;  // full config after the change
};

struct MediaChangedEvent {
  std::string filename;  // file added to the media directory
};

struct AddonsChangedEvent {
  std::string addon_id;  // empty = the whole set changed (reload)
};

struct AddonMessageEvent {
  std::string addon_id;
  nlohmann::json payload;  // e.g. {"type":"restart-warning","minutes":5}
};

struct PeersChangedEvent {
  std::vector<network::Peer> peers;
};

// Change notifications for the render loop and the HTTP layer
//
// - Observer pattern with std::function
// - Synchronous delivery on the notifying thread, outside the lock, so a
//   callback may subscribe or unsubscribe
// - RAII subscriptions
// - A callback that throws is logged and does not stop delivery to others
class Notifications {
public:
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void Unsubscribe();

  private:
    friend class Notifications;
    Subscription(Notifications* owner, size_t id);

    Notifications* owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  using ConfigChangedCallback = std::function<void(const ConfigChangedEvent&)>;
  using MediaChangedCallback = std::function<void(const MediaChangedEvent&)>;
  using AddonsChangedCallback = std::function<void(const AddonsChangedEvent&)>;
  using AddonMessageCallback = std::function<void(const AddonMessageEvent&)>;
  using PeersChangedCallback = std::function<void(const PeersChangedEvent&)>;

  Notifications() = default;
  Notifications(const Notifications&) = delete;
  Notifications& operator=(const Notifications&) = delete;

  [[nodiscard]] Subscription SubscribeConfigChanged(ConfigChangedCallback callback);
  [[nodiscard]] Subscription SubscribeMediaChanged(MediaChangedCallback callback);
  [[nodiscard]] Subscription SubscribeAddonsChanged(AddonsChangedCallback callback);
  [[nodiscard]] Subscription SubscribeAddonMessage(AddonMessageCallback callback);
  [[nodiscard]] Subscription SubscribePeersChanged(PeersChangedCallback callback);

  void NotifyConfigChanged(const ConfigChangedEvent& event);
  void NotifyMediaChanged(const MediaChangedEvent& event);
  void NotifyAddonsChanged(const AddonsChangedEvent& event);
  void NotifyAddonMessage(const AddonMessageEvent& event);
  void NotifyPeersChanged(const PeersChangedEvent& event);

  size_t subscriber_count() const;

private:
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    ConfigChangedCallback config_changed;
    MediaChangedCallback media_changed;
    AddonsChangedCallback addons_changed;
    AddonMessageCallback addon_message;
    PeersChangedCallback peers_changed;
  };

  Subscription Add(CallbackEntry entry);

  template <typename Callback, typename Event>
  void Deliver(Callback CallbackEntry::*member, const Event& event, const char* what);

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1};  // 0 reserved for invalid
};

}  // namespace app
}  // namespace signage
