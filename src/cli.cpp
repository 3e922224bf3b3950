// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/rpc_client.hpp"
#include "util/error.hpp"
#include "util/files.hpp"
#include "util/netaddress.hpp"
#include "version.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

std::vector<std::string> SplitTargets(const std::string &arg) {
  std::vector<std::string> out;
  if (arg == "all") {
    return out;
  }
  size_t start = 0;
  while (start <= arg.size()) {
    size_t comma = arg.find(',', start);
    if (comma == std::string::npos) {
      comma = arg.size();
    }
    if (comma > start) {
      out.push_back(arg.substr(start, comma - start));
    }
    start = comma + 1;
  }
  if (out.empty()) {
    throw signage::CoreError(signage::ErrorCode::ValidationError, "no targets given");
  }
  return out;
}

void RequireArgs(const std::vector<std::string> &params, size_t min, size_t max, const char *usage) {
  if (params.size() < min || params.size() > max) {
    throw signage::CoreError(signage::ErrorCode::ValidationError, std::string("usage: ") + usage);
  }
}

bool ParseBoolArg(const std::string &s) {
  if (s == "true" || s == "1") {
    return true;
  }
  if (s == "false" || s == "0") {
    return false;
  }
  throw signage::CoreError(signage::ErrorCode::ValidationError, "restartPC must be true or false");
}

nlohmann::json ParseObjectArg(const std::string &s, const char *what) {
  auto j = nlohmann::json::parse(s, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw signage::CoreError(signage::ErrorCode::ValidationError, std::string(what) + " must be a JSON object");
  }
  return j;
}

nlohmann::json RunCommand(signage::rpc::RPCClient &client, const std::string &command,
                          const std::vector<std::string> &params) {
  if (command == "getinfo") {
    RequireArgs(params, 0, 0, "getinfo");
    return client.GetInfo();
  }
  if (command == "stop") {
    RequireArgs(params, 0, 0, "stop");
    client.Stop();
    return "Signage node stopping";
  }
  if (command == "listpeers") {
    RequireArgs(params, 0, 0, "listpeers");
    return client.ListPeers();
  }
  if (command == "addpeer") {
    RequireArgs(params, 1, 3, "addpeer <ip> [name] [port]");
    uint16_t port = 0;
    if (params.size() > 2) {
      auto parsed = signage::util::ParsePort(params[2]);
      if (!parsed) {
        throw signage::CoreError(signage::ErrorCode::ValidationError, "invalid port: " + params[2]);
      }
      port = *parsed;
    }
    return client.AddPeer(params[0], params.size() > 1 ? params[1] : "", port);
  }
  if (command == "removepeer") {
    RequireArgs(params, 1, 1, "removepeer <id>");
    return {{"id", params[0]}, {"removed", client.RemovePeer(params[0])}};
  }
  if (command == "checkpeer") {
    RequireArgs(params, 1, 1, "checkpeer <id>");
    return {{"id", params[0]}, {"online", client.CheckPeer(params[0])}};
  }
  if (command == "fanout") {
    RequireArgs(params, 3, 4, "fanout <apply-config|upload-media|push-update> <targets|all> <payload> [restartPC]");
    const auto targets = SplitTargets(params[1]);
    if (params[0] == "apply-config") {
      return client.ApplyConfig(targets, ParseObjectArg(params[2], "apply-config payload"));
    }
    if (params[0] == "upload-media") {
      return client.UploadMedia(targets, params[2]);
    }
    if (params[0] == "push-update") {
      return client.PushUpdate(targets, params[2], params.size() > 3 && ParseBoolArg(params[3]));
    }
    throw signage::CoreError(signage::ErrorCode::ValidationError, "unknown fanout operation: " + params[0]);
  }
  if (command == "listaddons") {
    RequireArgs(params, 0, 0, "listaddons");
    return client.ListAddons();
  }
  if (command == "setaddonconfig") {
    RequireArgs(params, 2, 2, "setaddonconfig <id> <json>");
    return client.SetAddonConfig(params[0], ParseObjectArg(params[1], "addon config"));
  }
  if (command == "reloadaddons") {
    RequireArgs(params, 0, 0, "reloadaddons");
    return client.ReloadAddons();
  }
  // logging and anything newer than this client go through untyped
  return client.CallJson(command, params);
}

}  // namespace

void PrintUsage(const char *program_name) {
  std::cout
      << "Signage CLI - Control a local signage node\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.signage)\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n\n"
      << "Commands:\n"
      << "\n"
      << "Node:\n"
      << "  getinfo                      Identity, discovery state, peer and addon counts\n"
      << "\n"
      << "Peers:\n"
      << "  listpeers                    List known displays\n"
      << "  addpeer <ip> [name] [port]   Add a manual peer (saved in config.json)\n"
      << "  removepeer <id>              Remove a peer (id is ip:port)\n"
      << "  checkpeer <id>               Probe a peer now\n"
      << "  fanout <op> <targets> <payload> [restartPC]\n"
      << "                               Push to peers. op: apply-config (payload: JSON),\n"
      << "                               upload-media (payload: file), push-update\n"
      << "                               (payload: package file). targets: id,id,... or all\n"
      << "                               Use 'local' to include this display.\n"
      << "\n"
      << "Addons:\n"
      << "  listaddons                   List addons with settings and state\n"
      << "  setaddonconfig <id> <json>   Update addon settings (e.g. '{\"enabled\":false}')\n"
      << "  reloadaddons                 Rescan the addons directory and restart addons\n"
      << "\n"
      << "Logging:\n"
      << "  logging [<category>:<level>...]  Get/set log levels (default, network, addon, app, all)\n"
      << "\n"
      << "Control:\n"
      << "  stop                         Stop the node\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    std::string datadir;
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (command.empty() && (arg == "--help" || arg == "-h")) {
        PrintUsage(argv[0]);
        return 0;
      } else if (command.empty() && (arg == "--version" || arg == "-v")) {
        std::cout << signage::GetFullVersionString() << std::endl;
        return 0;
      } else if (command.empty() && arg.starts_with("--datadir=")) {
        datadir = arg.substr(10);
        if (datadir.empty()) {
          std::cerr << "Error: --datadir requires a non-empty path\n";
          return 1;
        }
      } else if (command.empty()) {
        command = arg;
      } else {
        params.push_back(arg);
      }
    }

    if (datadir.empty()) {
      std::filesystem::path datadir_path = signage::util::get_default_datadir();
      if (datadir_path.empty()) {
        std::cerr << "Error: HOME environment variable not set.\n"
                  << "Please set HOME or use --datadir explicitly.\n";
        return 1;
      }
      datadir = datadir_path.string();
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    // Local only: there is no network control port
    signage::rpc::RPCClient client(std::filesystem::path(datadir) / "node.sock");
    nlohmann::json reply = RunCommand(client, command, params);
    if (reply.is_string()) {
      std::cout << reply.get<std::string>() << std::endl;
    } else {
      std::cout << reply.dump(2) << std::endl;
    }
    return 0;

  } catch (const signage::CoreError &e) {
    std::cerr << "Error (" << signage::ErrorCodeName(e.code()) << "): " << e.what() << std::endl;
    if (e.code() == signage::ErrorCode::Unreachable) {
      std::cerr << "Make sure signaged is running.\n";
    }
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
