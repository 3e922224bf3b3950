// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "app/config_store.hpp"
#include "app/coordinator.hpp"
#include "network/rpc_server.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace signage {
namespace app {

// Settings from the command line. Unset optionals fall back to config.json.
struct AppConfig {
  std::filesystem::path datadir;
  std::filesystem::path addons_dir;  // empty = <datadir>/addons

  std::optional<uint16_t> api_port;
  std::optional<uint16_t> discovery_port;
  std::optional<std::string> display_name;
  std::optional<std::string> static_ip;
  bool discovery_enabled{true};

  // Shell command run when an addon asks for a system restart (empty = refuse)
  std::string restart_command{"sudo reboot"};
  // Shell command given the staged package path (empty = stage only)
  std::string update_command;
};

// Application - owns the config store, coordinator and control socket
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;

  // Data dir, config store, coordinator, RPC. Returns false on any failure.
  bool initialize();

  bool start();
  void stop();

  // Block until a signal or the stop RPC, then shut down
  void wait_for_shutdown();

  void request_shutdown() { shutdown_requested_ = true; }
  bool is_running() const { return running_; }

  Coordinator* coordinator() { return coordinator_.get(); }
  JsonConfigStore* config_store() { return config_store_.get(); }

  static Application* instance();

private:
  bool init_datadir();
  bool init_config();
  bool init_coordinator();
  bool init_rpc();

  void shutdown();
  void setup_signal_handlers();
  static void signal_handler(int signal);

  bool run_restart_command();
  void run_update_command(const std::filesystem::path& package, bool restart_pc);

  AppConfig config_;

  std::unique_ptr<JsonConfigStore> config_store_;
  std::unique_ptr<Coordinator> coordinator_;
  std::unique_ptr<rpc::RPCServer> rpc_server_;

  std::atomic<bool> running_{false};
  std::atomic<bool> datadir_locked_{false};
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace signage
