// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "scheduled-restart/scheduled_restart_addon.hpp"

#include "addon/font_data.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace signage {
namespace addons {

namespace {

constexpr size_t kMaxScriptSize = 4 * 1024 * 1024;

int IntSetting(const nlohmann::json& config, const char* key, int fallback) {
  auto it = config.find(key);
  return (it != config.end() && it->is_number()) ? it->get<int>() : fallback;
}

}  // namespace

ScheduledRestartAddon::ScheduledRestartAddon(addon::AddonHost& host, Timing timing)
    : host_(host), timing_(timing), config_(nlohmann::json::object()) {}

ScheduledRestartAddon::~ScheduledRestartAddon() {
  Stop();
}

void ScheduledRestartAddon::Init(const nlohmann::json& config) {
  Stop();
  config_ = config;

  if (!config_.value("enabled", false)) {
    host_.logger()->info("scheduled restart disabled");
    return;
  }

  const bool test_mode = config_.value("testMode", false);
  const int interval = test_mode ? IntSetting(config_, "testInterval", 5) : IntSetting(config_, "restartInterval", 24);
  const int warning = IntSetting(config_, "warningTime", 5);

  const auto interval_ms = test_mode ? timing_.minute * interval : timing_.minute * 60 * interval;
  const auto warning_ms = std::min<std::chrono::milliseconds>(timing_.minute * warning, interval_ms);
  const auto now = std::chrono::steady_clock::now();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
    warning_active_ = false;
    test_mode_ = test_mode;
    warning_minutes_ = warning;
    restart_at_ = now + interval_ms;
    warn_at_ = *restart_at_ - warning_ms;
  }

  host_.logger()->info("restart scheduled in {} {}, warning {} minute(s) before", interval,
                       test_mode ? "minute(s)" : "hour(s)", warning);
  worker_ = std::thread(&ScheduledRestartAddon::Run, this);
}

void ScheduledRestartAddon::Stop() {
  bool clear_warning = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
    clear_warning = warning_active_;
    warning_active_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    restart_at_.reset();
  }
  font_cache_.clear();

  if (clear_warning) {
    EmitSafe({{"type", "remove-warning"}});
  }
}

void ScheduledRestartAddon::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  const auto restart_at = *restart_at_;
  const auto warn_at = warn_at_;
  const int warning_minutes = warning_minutes_;
  bool warned = false;
  auto next_update = restart_at;

  while (!stop_requested_) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= restart_at) {
      break;
    }

    if (!warned && now >= warn_at) {
      warned = true;
      warning_active_ = true;
      next_update = now + timing_.minute;
      lock.unlock();
      host_.logger()->info("showing restart warning");
      EmitSafe({{"type", "restart-warning"}, {"warningTime", warning_minutes}});
      lock.lock();
      continue;
    }

    if (warned && now >= next_update) {
      const auto left = restart_at - now;
      const auto minutes_left = (left + timing_.minute - std::chrono::milliseconds(1)) / timing_.minute;
      next_update += timing_.minute;
      lock.unlock();
      EmitSafe({{"type", "update-warning"}, {"warningTime", static_cast<int>(minutes_left)}});
      lock.lock();
      continue;
    }

    const auto deadline = std::min(restart_at, warned ? next_update : warn_at);
    cv_.wait_until(lock, deadline, [this] { return stop_requested_; });
  }

  if (stop_requested_) {
    return;
  }

  lock.unlock();
  host_.logger()->warn("restart interval reached");
  EmitSafe({{"type", "restart-now"}});
  lock.lock();

  // Give the display a moment to show the message
  if (cv_.wait_for(lock, timing_.restart_delay, [this] { return stop_requested_; })) {
    return;
  }
  lock.unlock();

  bool accepted = false;
  try {
    accepted = host_.RequestSystemRestart();
  } catch (const std::exception& e) {
    host_.logger()->error("restart request failed: {}", e.what());
  }
  if (!accepted) {
    host_.logger()->error("system restart was not performed");
  }
}

void ScheduledRestartAddon::EmitSafe(const nlohmann::json& message) {
  try {
    host_.Emit(message);
  } catch (const std::exception& e) {
    if (!host_.shutting_down()) {
      host_.logger()->warn("could not send {}: {}", message.value("type", "message"), e.what());
    }
  }
}

std::string ScheduledRestartAddon::TimeRemaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!restart_at_) {
    return "Not scheduled";
  }
  const auto left =
      std::chrono::duration_cast<std::chrono::milliseconds>(*restart_at_ - std::chrono::steady_clock::now());
  if (left.count() <= 0) {
    return "Restarting soon...";
  }
  return FormatRemaining(left, test_mode_);
}

bool ScheduledRestartAddon::is_scheduled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return restart_at_.has_value();
}

bool ScheduledRestartAddon::warning_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return warning_active_;
}

std::string ScheduledRestartAddon::FormatRemaining(std::chrono::milliseconds remaining, bool test_mode) {
  const auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(remaining).count();
  const long long hours = total_seconds / 3600;
  const long long minutes = test_mode ? total_seconds / 60 : (total_seconds % 3600) / 60;
  const long long seconds = total_seconds % 60;

  if (!test_mode && hours > 0) {
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
  }
  if (minutes > 0) {
    return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
  }
  return std::to_string(seconds) + "s";
}

std::optional<std::string> ScheduledRestartAddon::FrontendScript() const {
  const auto path = host_.addon_dir() / "frontend.js";
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size > kMaxScriptSize) {
    host_.logger()->warn("frontend script {} unavailable", path.string());
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  std::string script((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return addon::WrapFrontendScript(config_, script);
}

std::optional<std::string> ScheduledRestartAddon::AssetData(const std::string& name) const {
  if (name == "timeRemaining") {
    return TimeRemaining();
  }
  if (auto it = font_cache_.find(name); it != font_cache_.end()) {
    return it->second;
  }
  auto url = addon::ReadFontDataUrl(host_.fonts_dir(), name);
  if (url) {
    font_cache_.emplace(name, *url);
  }
  return url;
}

}  // namespace addons
}  // namespace signage
