// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

/**
 * RPC Server Implementation - Unix Domain Sockets
 *
 * The control socket is only reachable on the same machine:
 * - No network port is opened
 * - Authentication is handled by filesystem permissions (0600)
 * - The socket file is created at: datadir/node.sock
 *
 * signage-cli is the intended client; each request runs on its own thread.
 */

#include "network/rpc_server.hpp"

#include "app/coordinator.hpp"
#include "network/discovery_service.hpp"
#include "network/fanout_dispatcher.hpp"
#include "network/network_manager.hpp"
#include "network/peer.hpp"
#include "util/error.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"

#include "version.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace signage {
namespace rpc {

namespace {

constexpr size_t kMaxRequestSize = 256 * 1024;

std::string Reply(const nlohmann::json& j) {
  return j.dump(2) + "\n";
}

std::vector<std::string> SplitList(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, sep)) {
    if (!item.empty())
      out.push_back(item);
  }
  return out;
}

bool ParseBoolParam(const std::string& s, bool& out) {
  if (s == "true" || s == "1") {
    out = true;
    return true;
  }
  if (s == "false" || s == "0") {
    out = false;
    return true;
  }
  return false;
}

}  // namespace

std::string JsonError(const std::string& message, const std::string& code) {
  nlohmann::json j{{"error", message}};
  if (!code.empty()) {
    j["code"] = code;
  }
  return j.dump() + "\n";
}

RPCServer::RPCServer(const std::string& socket_path, app::Coordinator& coordinator,
                     std::function<void()> shutdown_callback)
    : socket_path_(socket_path), coordinator_(coordinator), shutdown_callback_(std::move(shutdown_callback)),
      server_fd_(-1), running_(false), shutting_down_(false) {
  RegisterHandlers();
}

RPCServer::~RPCServer() {
  Stop();
}

void RPCServer::RegisterHandlers() {
  // Node
  handlers_["getinfo"] = [this](const auto& p) { return HandleGetInfo(p); };
  handlers_["stop"] = [this](const auto& p) { return HandleStop(p); };
  handlers_["logging"] = [this](const auto& p) { return HandleLogging(p); };

  // Peers
  handlers_["listpeers"] = [this](const auto& p) { return HandleListPeers(p); };
  handlers_["addpeer"] = [this](const auto& p) { return HandleAddPeer(p); };
  handlers_["removepeer"] = [this](const auto& p) { return HandleRemovePeer(p); };
  handlers_["checkpeer"] = [this](const auto& p) { return HandleCheckPeer(p); };
  handlers_["fanout"] = [this](const auto& p) { return HandleFanout(p); };

  // Addons
  handlers_["listaddons"] = [this](const auto& p) { return HandleListAddons(p); };
  handlers_["setaddonconfig"] = [this](const auto& p) { return HandleSetAddonConfig(p); };
  handlers_["reloadaddons"] = [this](const auto& p) { return HandleReloadAddons(p); };
}

bool RPCServer::Start() {
  if (running_) {
    return true;
  }

  unlink(socket_path_.c_str());

  // sockaddr_un::sun_path is 108 bytes on Linux, 104 on BSD/macOS
  constexpr size_t MAX_SOCKET_PATH = 104;
  if (socket_path_.length() >= MAX_SOCKET_PATH) {
    LOG_ERROR("RPC socket path too long ({} chars, max {}): {}", socket_path_.length(), MAX_SOCKET_PATH, socket_path_);
    return false;
  }

  mode_t old_umask = umask(0077);

  server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    umask(old_umask);
    LOG_ERROR("Failed to create RPC socket: {}", std::strerror(errno));
    return false;
  }

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
    LOG_ERROR("Failed to bind RPC socket to {}: {}", socket_path_, std::strerror(errno));
    close(server_fd_);
    server_fd_ = -1;
    umask(old_umask);
    return false;
  }
  umask(old_umask);

  if (chmod(socket_path_.c_str(), 0600) != 0) {
    LOG_WARN("Could not restrict permissions on {}", socket_path_);
  }

  if (listen(server_fd_, 5) < 0) {
    LOG_ERROR("Failed to listen on RPC socket");
    close(server_fd_);
    server_fd_ = -1;
    return false;
  }

  shutting_down_.store(false, std::memory_order_release);
  running_ = true;
  server_thread_ = std::thread(&RPCServer::ServerThread, this);

  LOG_INFO("RPC server started on {}", socket_path_);
  return true;
}

void RPCServer::Stop() {
  if (!running_) {
    return;
  }

  shutting_down_.store(true, std::memory_order_release);
  running_ = false;

  // shutdown() reliably unblocks accept(); close() alone does not everywhere
  if (server_fd_ >= 0) {
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  // Request threads are detached and reference this object
  while (active_requests_.load() > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  unlink(socket_path_.c_str());

  LOG_INFO("RPC server stopped");
}

void RPCServer::ServerThread() {
  while (running_) {
    struct sockaddr_un client_addr;
    socklen_t client_len = sizeof(client_addr);

    int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
    if (client_fd < 0) {
      if (running_) {
        LOG_WARN("failed to accept RPC connection: {}", std::strerror(errno));
      }
      continue;
    }

    if (active_requests_.load() >= MAX_CONCURRENT_REQUESTS) {
      LOG_WARN("RPC request rejected: {} concurrent requests (max {})", active_requests_.load(),
               MAX_CONCURRENT_REQUESTS);
      SendResponse(client_fd, JsonError("Server busy - too many concurrent requests"));
      close(client_fd);
      continue;
    }

    // Thread per request so a slow fanout does not block listpeers
    active_requests_++;
    std::thread([this, client_fd]() {
      try {
        HandleClient(client_fd);
      } catch (const std::exception& e) {
        LOG_ERROR("RPC HandleClient exception: {}", e.what());
      }
      close(client_fd);
      active_requests_--;
    }).detach();
  }
}

bool RPCServer::SendResponse(int client_fd, const std::string& response) {
  size_t total_sent = 0;
  while (total_sent < response.size()) {
    ssize_t sent = send(client_fd, response.c_str() + total_sent, response.size() - total_sent, MSG_NOSIGNAL);
    if (sent <= 0) {
      if (sent < 0 && errno != EPIPE) {
        LOG_WARN("RPC send failed: {}", std::strerror(errno));
      }
      return false;
    }
    total_sent += static_cast<size_t>(sent);
  }
  return true;
}

void RPCServer::HandleClient(int client_fd) {
  if (shutting_down_.load(std::memory_order_acquire)) {
    SendResponse(client_fd, JsonError("Server shutting down"));
    return;
  }

  // Hung clients must not pin a thread forever
  struct timeval timeout;
  timeout.tv_sec = 30;
  timeout.tv_usec = 0;
  if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
    LOG_WARN("Failed to set RPC socket recv timeout");
  }

  std::string request;
  char buffer[4096];
  while (request.find('\n') == std::string::npos) {
    ssize_t received = recv(client_fd, buffer, sizeof(buffer), 0);
    if (received < 0) {
      LOG_DEBUG("RPC recv failed: {}", std::strerror(errno));
      return;
    }
    if (received == 0) {
      break;
    }
    request.append(buffer, static_cast<size_t>(received));
    if (request.size() > kMaxRequestSize) {
      LOG_WARN("RPC request too large: {} bytes", request.size());
      SendResponse(client_fd, JsonError("Request too large"));
      return;
    }
  }
  if (request.empty()) {
    return;
  }

  nlohmann::json j = nlohmann::json::parse(request, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    SendResponse(client_fd, JsonError("Invalid JSON"));
    return;
  }
  auto method_it = j.find("method");
  if (method_it == j.end() || !method_it->is_string()) {
    SendResponse(client_fd, JsonError("Missing or invalid method field"));
    return;
  }

  std::vector<std::string> params;
  if (auto it = j.find("params"); it != j.end()) {
    if (it->is_array()) {
      for (const auto& param : *it) {
        params.push_back(param.is_string() ? param.get<std::string>() : param.dump());
      }
    } else if (it->is_string()) {
      params.push_back(it->get<std::string>());
    }
  }

  SendResponse(client_fd, ExecuteCommand(method_it->get<std::string>(), params));
}

std::string RPCServer::ExecuteCommand(const std::string& method, const std::vector<std::string>& params) {
  LOG_DEBUG("RPCServer method={}", method);

  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return JsonError("Unknown command: " + method);
  }

  try {
    return it->second(params);
  } catch (const CoreError& e) {
    LOG_WARN("RPC command '{}' failed: {}", method, e.what());
    return JsonError(e.what(), ErrorCodeName(e.code()));
  } catch (const std::invalid_argument& e) {
    return JsonError(e.what(), ErrorCodeName(ErrorCode::ValidationError));
  } catch (const std::exception& e) {
    LOG_ERROR("RPC command '{}' failed: {}", method, e.what());
    return JsonError(e.what());
  }
}

std::string RPCServer::HandleGetInfo(const std::vector<std::string>& params) {
  auto& net = coordinator_.network();
  const auto identity = net.registry().config();
  const auto peers = net.registry().List();
  const auto online = std::count_if(peers.begin(), peers.end(), [](const network::Peer& p) { return p.online; });

  nlohmann::json discovery = nullptr;
  if (auto* d = net.discovery()) {
    discovery = {{"listening", d->is_listening()}, {"port", d->local_port()}};
    if (auto err = d->bind_error()) {
      discovery["error"] = *err;
    }
  }

  const auto addons = coordinator_.ListAddons();
  const auto running = std::count_if(addons.begin(), addons.end(), [](const auto& kv) {
    return kv.second.state == addon::AddonState::Running;
  });

  return Reply({
      {"version", GetVersionString()},
      {"displayName", identity.display_name},
      {"apiPort", identity.api_port},
      {"staticIp", identity.static_ip},
      {"discovery", discovery},
      {"peers", peers.size()},
      {"onlinePeers", online},
      {"addons", addons.size()},
      {"runningAddons", running},
  });
}

std::string RPCServer::HandleStop(const std::vector<std::string>& params) {
  LOG_INFO("Received stop command via RPC");
  shutting_down_.store(true, std::memory_order_release);
  if (shutdown_callback_) {
    shutdown_callback_();
  }
  return "\"Signage node stopping\"\n";
}

std::string RPCServer::HandleLogging(const std::vector<std::string>& params) {
  const auto& components = util::LogManager::Components();

  if (params.empty()) {
    nlohmann::json categories = nlohmann::json::object();
    for (const auto& name : components) {
      auto level = spdlog::level::to_string_view(util::LogManager::GetLogger(name)->level());
      categories[name] = std::string(level.data(), level.size());
    }
    return Reply({{"categories", categories}});
  }

  // "category:level" or "all:level"
  static const std::vector<std::string> valid_levels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
  nlohmann::json updated = nlohmann::json::array();
  for (const auto& param : params) {
    size_t colon_pos = param.find(':');
    if (colon_pos == std::string::npos) {
      return JsonError("Invalid format. Use 'category:level' (e.g., 'network:debug' or 'all:info')");
    }
    std::string category = param.substr(0, colon_pos);
    std::string level = param.substr(colon_pos + 1);

    if (std::find(valid_levels.begin(), valid_levels.end(), level) == valid_levels.end()) {
      return JsonError("Invalid log level '" + level + "'. Valid levels: trace, debug, info, warn, error, critical, off");
    }

    if (category == "all") {
      util::LogManager::SetLogLevel(level);
    } else if (!util::LogManager::SetComponentLevel(category, level)) {
      return JsonError("Invalid category '" + category + "'");
    }
    updated.push_back({{"category", category}, {"level", level}});
  }
  return Reply({{"updated", updated}});
}

std::string RPCServer::HandleListPeers(const std::vector<std::string>& params) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& peer : coordinator_.ListPeers()) {
    arr.push_back(network::PeerToJson(peer));
  }
  return Reply(arr);
}

std::string RPCServer::HandleAddPeer(const std::vector<std::string>& params) {
  if (params.empty()) {
    return JsonError("Usage: addpeer <ip> [name] [port]");
  }
  std::string name = params.size() > 1 ? params[1] : "";
  uint16_t port = 0;
  if (params.size() > 2) {
    auto parsed = util::ParsePort(params[2]);
    if (!parsed) {
      return JsonError("Invalid port: " + params[2]);
    }
    port = *parsed;
  }
  return Reply(network::PeerToJson(coordinator_.AddManualPeer(params[0], name, port)));
}

std::string RPCServer::HandleRemovePeer(const std::vector<std::string>& params) {
  if (params.size() != 1) {
    return JsonError("Usage: removepeer <id>");
  }
  return Reply({{"id", params[0]}, {"removed", coordinator_.RemovePeer(params[0])}});
}

std::string RPCServer::HandleCheckPeer(const std::vector<std::string>& params) {
  if (params.size() != 1) {
    return JsonError("Usage: checkpeer <id>");
  }
  return Reply({{"id", params[0]}, {"online", coordinator_.CheckPeer(params[0])}});
}

std::string RPCServer::HandleFanout(const std::vector<std::string>& params) {
  // fanout <operation> <target,target,...|all> <payload> [restartPC]
  if (params.size() < 3) {
    return JsonError("Usage: fanout <apply-config|upload-media|push-update> <targets|all> <json|file> [restartPC]");
  }
  auto op = network::ParseOperation(params[0]);
  if (!op) {
    return JsonError("Unknown operation: " + params[0]);
  }

  std::vector<std::string> targets;
  if (params[1] == "all") {
    for (const auto& peer : coordinator_.ListPeers()) {
      targets.push_back(peer.id);
    }
  } else {
    targets = SplitList(params[1], ',');
  }
  if (targets.empty()) {
    return JsonError("No targets");
  }

  network::FanoutPayload payload;
  if (*op == network::FanoutOperation::ApplyConfig) {
    payload.config = nlohmann::json::parse(params[2], nullptr, false);
    if (payload.config.is_discarded() || !payload.config.is_object()) {
      return JsonError("apply-config payload must be a JSON object");
    }
  } else {
    payload.file = params[2];
    payload.filename = payload.file.filename().string();
    if (params.size() > 3 && !ParseBoolParam(params[3], payload.restart_pc)) {
      return JsonError("restartPC must be true or false");
    }
  }

  return Reply(coordinator_.Fanout(targets, *op, payload).ToJson());
}

std::string RPCServer::HandleListAddons(const std::vector<std::string>& params) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [id, summary] : coordinator_.ListAddons()) {
    out[id] = summary.ToJson();
  }
  return Reply(out);
}

std::string RPCServer::HandleSetAddonConfig(const std::vector<std::string>& params) {
  if (params.size() != 2) {
    return JsonError("Usage: setaddonconfig <id> <json>");
  }
  nlohmann::json partial = nlohmann::json::parse(params[1], nullptr, false);
  if (partial.is_discarded() || !partial.is_object()) {
    return JsonError("config must be a JSON object");
  }
  return Reply(coordinator_.UpdateAddonConfig(params[0], partial).ToJson());
}

std::string RPCServer::HandleReloadAddons(const std::vector<std::string>& params) {
  return Reply(coordinator_.ReloadAddons().ToJson());
}

}  // namespace rpc
}  // namespace signage
