// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "version.hpp"
#include <filesystem>
#include <optional>
#include <iostream>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char *program_name) {
  std::cout
      << "Signage Node - display coordination daemon\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Options:\n"
      << "  --datadir=<path>          Data directory (default: ~/.signage)\n"
      << "  --addons=<path>           Addons directory (default: <datadir>/addons)\n"
      << "  --port=<port>             Display API port announced to peers (default from config.json)\n"
      << "  --discovery-port=<port>   UDP discovery port (default 3002)\n"
      << "  --name=<name>             Display name announced to peers\n"
      << "  --static-ip=<ip>          Address peers use to reach this display\n"
      << "  --no-discovery            Do not broadcast or listen for announcements\n"
      << "  --restart-command=<cmd>   Command run when an addon requests a restart (default: sudo reboot)\n"
      << "  --update-command=<cmd>    Command run with a received update package\n"
      << "  --loglevel=<level>        trace, debug, info, warn, error (default: info)\n"
      << "  --debug=<component>       Debug logging for one component (network, addon, app)\n"
      << "  --logfile                 Also log to <datadir>/debug.log\n"
      << "  --version                 Show version information\n"
      << "  --help                    Show this help message\n"
      << std::endl;
}

bool ParsePortFlag(const std::string &arg, size_t prefix_len, std::optional<uint16_t> &out) {
  auto port = signage::util::ParsePort(arg.substr(prefix_len));
  if (!port) {
    std::cerr << "Error: invalid port in " << arg << "\n";
    return false;
  }
  out = *port;
  return true;
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    signage::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    bool log_to_file = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << signage::GetFullVersionString() << std::endl;
        return 0;
      } else if (arg.starts_with("--datadir=")) {
        config.datadir = arg.substr(10);
      } else if (arg.starts_with("--addons=")) {
        config.addons_dir = arg.substr(9);
      } else if (arg.starts_with("--port=")) {
        if (!ParsePortFlag(arg, 7, config.api_port))
          return 1;
      } else if (arg.starts_with("--discovery-port=")) {
        if (!ParsePortFlag(arg, 17, config.discovery_port))
          return 1;
      } else if (arg.starts_with("--name=")) {
        config.display_name = arg.substr(7);
        if (config.display_name->empty()) {
          std::cerr << "Error: --name requires a non-empty value\n";
          return 1;
        }
      } else if (arg.starts_with("--static-ip=")) {
        config.static_ip = arg.substr(12);
        if (!config.static_ip->empty() && !signage::util::IsValidIPAddress(*config.static_ip)) {
          std::cerr << "Error: invalid address in " << arg << "\n";
          return 1;
        }
      } else if (arg == "--no-discovery") {
        config.discovery_enabled = false;
      } else if (arg.starts_with("--restart-command=")) {
        config.restart_command = arg.substr(18);
      } else if (arg.starts_with("--update-command=")) {
        config.update_command = arg.substr(17);
      } else if (arg.starts_with("--loglevel=")) {
        log_level = arg.substr(11);
      } else if (arg.starts_with("--debug=")) {
        debug_components.push_back(arg.substr(8));
      } else if (arg == "--logfile") {
        log_to_file = true;
      } else {
        std::cerr << "Error: unknown option " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    if (config.datadir.empty()) {
      config.datadir = signage::util::get_default_datadir();
    }

    std::string log_file;
    if (log_to_file && !config.datadir.empty()) {
      if (signage::util::ensure_directory(config.datadir)) {
        log_file = (config.datadir / "debug.log").string();
      } else {
        std::cerr << "Warning: cannot create " << config.datadir << ", logging to console only\n";
      }
    }
    signage::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);
    for (const auto &component : debug_components) {
      if (!signage::util::LogManager::SetComponentLevel(component, "debug")) {
        LOG_WARN("Unknown log component '{}'", component);
      }
    }

    signage::app::Application app(config);
    if (!app.initialize()) {
      LOG_ERROR("Initialization failed");
      signage::util::LogManager::Shutdown();
      return 1;
    }
    if (!app.start()) {
      LOG_ERROR("Startup failed");
      app.stop();
      signage::util::LogManager::Shutdown();
      return 1;
    }

    app.wait_for_shutdown();
    signage::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
