// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "app/config_store.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"

#include <stdexcept>

namespace signage {
namespace app {

nlohmann::json DefaultConfig() {
  return {
      {"displayName", util::get_hostname()},
      {"port", 3000},
      {"wsPort", 3001},
      {"discoveryPort", 3002},
      {"staticIp", ""},
      {"localhostOnly", false},
      {"imageDuration", 5000},
      {"videoPosition", "after"},
      {"imageScaling", "contain"},
      {"rotation", 0},
      {"manualPeers", nlohmann::json::array()},
      {"addons", nlohmann::json::object()},
  };
}

void DeepMerge(nlohmann::json& target, const nlohmann::json& patch) {
  if (!patch.is_object() || !target.is_object()) {
    target = patch;
    return;
  }
  for (auto it = patch.begin(); it != patch.end(); ++it) {
    auto existing = target.find(it.key());
    if (existing != target.end() && existing->is_object() && it->is_object()) {
      DeepMerge(*existing, *it);
    } else {
      target[it.key()] = *it;
    }
  }
}

JsonConfigStore::JsonConfigStore(std::filesystem::path path) : path_(std::move(path)), config_(DefaultConfig()) {}

bool JsonConfigStore::Load() {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json merged = DefaultConfig();

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    LOG_APP_INFO("no config at {}, writing defaults", path_.string());
    try {
      Persist(merged);
    } catch (const std::exception& e) {
      LOG_APP_ERROR("{}", e.what());
      return false;
    }
    return true;
  }

  auto content = util::read_file_string(path_);
  if (!content) {
    LOG_APP_ERROR("cannot read {}", path_.string());
    return false;
  }
  auto stored = nlohmann::json::parse(*content, nullptr, /*allow_exceptions=*/false);
  if (stored.is_discarded() || !stored.is_object()) {
    LOG_APP_ERROR("{} is not a JSON object", path_.string());
    return false;
  }

  DeepMerge(merged, stored);
  config_ = std::move(merged);
  LOG_APP_DEBUG("loaded config from {}", path_.string());
  return true;
}

nlohmann::json JsonConfigStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

nlohmann::json JsonConfigStore::Merge(const nlohmann::json& patch) {
  if (!patch.is_object()) {
    throw std::invalid_argument("config patch must be a JSON object");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json next = config_;
  DeepMerge(next, patch);
  Persist(next);
  return config_;
}

void JsonConfigStore::Set(const std::string& key, const nlohmann::json& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json next = config_;
  next[key] = value;
  Persist(next);
}

nlohmann::json JsonConfigStore::AddonConfig(const std::string& addon_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto addons = config_.find("addons");
  if (addons == config_.end() || !addons->is_object()) {
    return nullptr;
  }
  auto it = addons->find(addon_id);
  return it == addons->end() ? nlohmann::json(nullptr) : *it;
}

void JsonConfigStore::SetAddonConfig(const std::string& addon_id, const nlohmann::json& config) {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json next = config_;
  if (!next["addons"].is_object()) {
    next["addons"] = nlohmann::json::object();
  }
  next["addons"][addon_id] = config;
  Persist(next);
}

void JsonConfigStore::Persist(const nlohmann::json& next) {
  if (!util::atomic_write_file(path_, next.dump(2) + "\n")) {
    throw std::runtime_error("failed to write " + path_.string());
  }
  config_ = next;
}

}  // namespace app
}  // namespace signage
