// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace signage {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "network", "addon", "app"), all
 * sharing the same sinks. The host configures the level once at startup;
 * the control socket can change levels at runtime.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once.
 */
class LogManager {
public:
  // Initialize logging with the given minimum level. Only the first call
  // has any effect; later calls are no-ops.
  static void Initialize(const std::string& log_level = "info", bool log_to_file = false,
                         const std::string& log_file_path = "debug.log");

  // Flush and drop all loggers. Logging after shutdown re-initializes with defaults.
  static void Shutdown();

  // Logger for a component. Unknown names return the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set level on every component logger.
  static void SetLogLevel(const std::string& level);

  // Set level for one component. Returns false if the component is unknown.
  static bool SetComponentLevel(const std::string& component, const std::string& level);

  // Names accepted by GetLogger / SetComponentLevel.
  static const std::vector<std::string>& Components();
};

}  // namespace util
}  // namespace signage

// Convenience macros for logging
#define LOG_TRACE(...) signage::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) signage::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) signage::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) signage::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) signage::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) signage::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) signage::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) signage::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) signage::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) signage::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_ADDON_TRACE(...) signage::util::LogManager::GetLogger("addon")->trace(__VA_ARGS__)
#define LOG_ADDON_DEBUG(...) signage::util::LogManager::GetLogger("addon")->debug(__VA_ARGS__)
#define LOG_ADDON_INFO(...) signage::util::LogManager::GetLogger("addon")->info(__VA_ARGS__)
#define LOG_ADDON_WARN(...) signage::util::LogManager::GetLogger("addon")->warn(__VA_ARGS__)
#define LOG_ADDON_ERROR(...) signage::util::LogManager::GetLogger("addon")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...) signage::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...) signage::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...) signage::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...) signage::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
