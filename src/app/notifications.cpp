// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "app/notifications.hpp"

#include "util/logging.hpp"

#include <algorithm>

namespace signage {
namespace app {

// ============================================================================
// Notifications::Subscription
// ============================================================================

Notifications::Subscription::Subscription(Notifications* owner, size_t id) : owner_(owner), id_(id), active_(true) {}

Notifications::Subscription::~Subscription() {
  Unsubscribe();
}

Notifications::Subscription::Subscription(Subscription&& other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

Notifications::Subscription& Notifications::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void Notifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// Notifications
// ============================================================================

Notifications::Subscription Notifications::Add(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entry.id = next_id_++;
  size_t id = entry.id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

Notifications::Subscription Notifications::SubscribeConfigChanged(ConfigChangedCallback callback) {
  CallbackEntry entry{};
  entry.config_changed = std::move(callback);
  return Add(std::move(entry));
}

Notifications::Subscription Notifications::SubscribeMediaChanged(MediaChangedCallback callback) {
  CallbackEntry entry{};
  entry.media_changed = std::move(callback);
  return Add(std::move(entry));
}

Notifications::Subscription Notifications::SubscribeAddonsChanged(AddonsChangedCallback callback) {
  CallbackEntry entry{};
  entry.addons_changed = std::move(callback);
  return Add(std::move(entry));
}

Notifications::Subscription Notifications::SubscribeAddonMessage(AddonMessageCallback callback) {
  CallbackEntry entry{};
  entry.addon_message = std::move(callback);
  return Add(std::move(entry));
}

Notifications::Subscription Notifications::SubscribePeersChanged(PeersChangedCallback callback) {
  CallbackEntry entry{};
  entry.peers_changed = std::move(callback);
  return Add(std::move(entry));
}

template <typename Callback, typename Event>
void Notifications::Deliver(Callback CallbackEntry::*member, const Event& event, const char* what) {
  // Snapshot so callbacks run without the lock held
  std::vector<Callback> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.reserve(callbacks_.size());
    for (const auto& entry : callbacks_) {
      if (entry.*member) {
        snapshot.push_back(entry.*member);
      }
    }
  }

  for (const auto& callback : snapshot) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      LOG_APP_ERROR("{} listener threw: {}", what, e.what());
    }
  }
}

void Notifications::NotifyConfigChanged(const ConfigChangedEvent& event) {
  Deliver(&CallbackEntry::config_changed, event, "config-changed");
}

void Notifications::NotifyMediaChanged(const MediaChangedEvent& event) {
  Deliver(&CallbackEntry::media_changed, event, "media-changed");
}

void Notifications::NotifyAddonsChanged(const AddonsChangedEvent& event) {
  Deliver(&CallbackEntry::addons_changed, event, "addons-changed");
}

void Notifications::NotifyAddonMessage(const AddonMessageEvent& event) {
  Deliver(&CallbackEntry::addon_message, event, "addon-message");
}

void Notifications::NotifyPeersChanged(const PeersChangedEvent& event) {
  Deliver(&CallbackEntry::peers_changed, event, "peers-changed");
}

size_t Notifications::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void Notifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(callbacks_.begin(), callbacks_.end(), [id](const CallbackEntry& entry) { return entry.id == id; });
  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

}  // namespace app
}  // namespace signage
