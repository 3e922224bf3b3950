// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace signage {
namespace app {

namespace {

// Single-quote for /bin/sh
std::string ShellQuote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  return out + "'";
}

}  // namespace

Application* Application::instance_ = nullptr;

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

bool Application::initialize() {
  std::cout << GetFullVersionString() << "\n" << std::flush;

  LOG_INFO("Initializing signage node...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_config()) {
    LOG_ERROR("Failed to load configuration");
    return false;
  }

  if (!init_coordinator()) {
    LOG_ERROR("Failed to initialize coordinator");
    return false;
  }

  if (!init_rpc()) {
    LOG_ERROR("Failed to initialize RPC server");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting signage node...");

  setup_signal_handlers();

  if (!coordinator_->Start()) {
    LOG_ERROR("Failed to start coordinator");
    return false;
  }

  if (!rpc_server_->Start()) {
    LOG_ERROR("Failed to start RPC server");
    coordinator_->Stop();
    return false;
  }

  running_ = true;

  const auto identity = coordinator_->network().registry().config();
  LOG_INFO("Signage node started as '{}'", identity.display_name);
  LOG_INFO("Data directory: {}", config_.datadir.string());
  if (auto* discovery = coordinator_->network().discovery()) {
    LOG_INFO("Discovery on UDP port {}", discovery->local_port());
  } else {
    LOG_INFO("Discovery disabled");
  }
  LOG_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_INFO("Shutting down signage node...");

  // Stop accepting control requests first
  if (rpc_server_) {
    LOG_INFO("Stopping RPC server...");
    rpc_server_->Stop();
  }

  // Addons, then discovery and health polling
  if (coordinator_) {
    LOG_INFO("Stopping addons and networking...");
    coordinator_->Stop();
  }

  if (datadir_locked_.exchange(false)) {
    util::UnlockDirectory(config_.datadir, ".lock");
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  if (config_.datadir.empty()) {
    LOG_ERROR("Data directory is not set. HOME may be unset; use --datadir to choose one.");
    return false;
  }

  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  // One node per data directory
  util::LockResult lock_result = util::LockDirectory(config_.datadir, ".lock");
  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }
  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. signaged is probably already running.",
              config_.datadir.string());
    return false;
  }
  datadir_locked_ = true;
  return true;
}

bool Application::init_config() {
  const auto path = config_.datadir / "config.json";
  config_store_ = std::make_unique<JsonConfigStore>(path);
  if (!config_store_->Load()) {
    LOG_ERROR("Could not load {}. Fix or remove the file and restart.", path.string());
    return false;
  }
  LOG_INFO("Loaded settings from {}", path.string());
  return true;
}

bool Application::init_coordinator() {
  // Command-line values win over config.json for this run only
  nlohmann::json settings = config_store_->Snapshot();
  if (config_.display_name)
    settings["displayName"] = *config_.display_name;
  if (config_.api_port)
    settings["port"] = *config_.api_port;
  if (config_.discovery_port)
    settings["discoveryPort"] = *config_.discovery_port;
  if (config_.static_ip)
    settings["staticIp"] = *config_.static_ip;

  Coordinator::Config cc;
  cc.datadir = config_.datadir;
  cc.addons_dir = config_.addons_dir;
  cc.network = NetworkConfigFrom(settings);
  cc.network.discovery_enabled = config_.discovery_enabled;

  if (cc.network.registry.display_name.empty()) {
    cc.network.registry.display_name = util::get_hostname();
  }

  coordinator_ = std::make_unique<Coordinator>(cc, *config_store_);
  coordinator_->SetRestartHandler([this]() { return run_restart_command(); });
  coordinator_->SetInstaller(
      [this](const std::filesystem::path& package, bool restart_pc) { run_update_command(package, restart_pc); });
  return true;
}

bool Application::init_rpc() {
  std::string socket_path = (config_.datadir / "node.sock").string();
  rpc_server_ = std::make_unique<rpc::RPCServer>(socket_path, *coordinator_, [this]() { request_shutdown(); });
  return true;
}

bool Application::run_restart_command() {
  if (config_.restart_command.empty()) {
    LOG_WARN("System restart requested but no restart command is configured");
    return false;
  }
  LOG_WARN("System restart requested, running: {}", config_.restart_command);
  int rc = std::system(config_.restart_command.c_str());
  if (rc != 0) {
    LOG_ERROR("Restart command exited with status {}", rc);
    return false;
  }
  return true;
}

void Application::run_update_command(const std::filesystem::path& package, bool restart_pc) {
  if (config_.update_command.empty()) {
    LOG_INFO("Update staged at {}; no update command configured", package.string());
    return;
  }
  std::string cmd = config_.update_command + " " + ShellQuote(package.string());
  if (restart_pc) {
    cmd += " --restart";
  }
  LOG_INFO("Running update command: {}", cmd);
  int rc = std::system(cmd.c_str());
  if (rc != 0) {
    LOG_ERROR("Update command exited with status {}", rc);
  }
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
  // Peers vanish mid-upload; a broken pipe must not kill the node
  std::signal(SIGPIPE, SIG_IGN);
}

void Application::signal_handler(int signal) {
  if (instance_) {
    // write() is async-signal-safe, std::cout is not
    static const char msg[] = "\nReceived signal\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace signage
