// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "addon/addon.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace signage {
namespace addons {

// Restarts the machine every restartInterval hours (testInterval minutes in
// test mode). warningTime minutes before the restart it emits
// {"type":"restart-warning","warningTime":N}, then "update-warning" once a
// minute, then "restart-now", and after a short grace period asks the host
// for a system restart. Stop() clears any visible warning with "remove-warning".
class ScheduledRestartAddon : public addon::Addon {
public:
  struct Timing {
    std::chrono::milliseconds minute{60 * 1000};
    std::chrono::milliseconds restart_delay{5000};  // after restart-now
    Timing() noexcept {}
  };

  explicit ScheduledRestartAddon(addon::AddonHost& host, Timing timing = Timing{});
  ~ScheduledRestartAddon() override;

  void Init(const nlohmann::json& config) override;
  void Stop() override;

  std::optional<std::string> FrontendScript() const override;
  // "timeRemaining" or a font file name
  std::optional<std::string> AssetData(const std::string& name) const override;

  // "Not scheduled", "Restarting soon...", or e.g. "23h 59m 58s"
  std::string TimeRemaining() const;
  bool is_scheduled() const;
  bool warning_active() const;

  // "1h 2m 3s" / "2m 3s" / "3s"; test mode never shows hours
  static std::string FormatRemaining(std::chrono::milliseconds remaining, bool test_mode);

private:
  void Run();
  void EmitSafe(const nlohmann::json& message);

  addon::AddonHost& host_;
  const Timing timing_;
  nlohmann::json config_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  bool warning_active_{false};
  std::optional<std::chrono::steady_clock::time_point> restart_at_;
  std::chrono::steady_clock::time_point warn_at_;
  int warning_minutes_{0};
  bool test_mode_{false};
  std::thread worker_;

  mutable std::map<std::string, std::string> font_cache_;
};

}  // namespace addons
}  // namespace signage
