// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace signage {

namespace app {
class Coordinator;
}

namespace rpc {

// Build {"error": message} (and "code" when given) as a JSON line
std::string JsonError(const std::string& message, const std::string& code = "");

// RPC Server using Unix Domain Sockets (Local-Only Access)
//
// One request per connection: a JSON object {"method": ..., "params": [...]}
// terminated by newline or EOF; the reply is a JSON document followed by EOF.
class RPCServer {
public:
  using CommandHandler = std::function<std::string(const std::vector<std::string>&)>;

  RPCServer(const std::string& socket_path, app::Coordinator& coordinator,
            std::function<void()> shutdown_callback = nullptr);
  ~RPCServer();

  RPCServer(const RPCServer&) = delete;
  RPCServer& operator=(const RPCServer&) = delete;

  bool Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Run a command in-process (used by the socket path and by tests)
  std::string ExecuteCommand(const std::string& method, const std::vector<std::string>& params);

private:
  void ServerThread();
  void HandleClient(int client_fd);
  void RegisterHandlers();

  bool SendResponse(int client_fd, const std::string& response);

  // Node
  std::string HandleGetInfo(const std::vector<std::string>& params);
  std::string HandleStop(const std::vector<std::string>& params);
  std::string HandleLogging(const std::vector<std::string>& params);

  // Peers
  std::string HandleListPeers(const std::vector<std::string>& params);
  std::string HandleAddPeer(const std::vector<std::string>& params);
  std::string HandleRemovePeer(const std::vector<std::string>& params);
  std::string HandleCheckPeer(const std::vector<std::string>& params);
  std::string HandleFanout(const std::vector<std::string>& params);

  // Addons
  std::string HandleListAddons(const std::vector<std::string>& params);
  std::string HandleSetAddonConfig(const std::vector<std::string>& params);
  std::string HandleReloadAddons(const std::vector<std::string>& params);

  std::string socket_path_;
  app::Coordinator& coordinator_;
  std::function<void()> shutdown_callback_;

  int server_fd_;
  std::atomic<bool> running_;
  std::atomic<bool> shutting_down_;
  std::thread server_thread_;

  // Limit concurrent requests to prevent thread exhaustion
  std::atomic<int> active_requests_{0};
  static constexpr int MAX_CONCURRENT_REQUESTS = 10;

  std::map<std::string, CommandHandler> handlers_;
};

}  // namespace rpc
}  // namespace signage
