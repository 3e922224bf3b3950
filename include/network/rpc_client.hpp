// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace signage {
namespace rpc {

// RPCClient - signaged's control socket from the outside
//
// One connection per call: the request is a single JSON line and the node
// closes the socket after its reply. A reply of the form {"error", "code"}
// is raised as CoreError with the decoded code, or std::runtime_error when
// the node sent no code. A node that cannot be reached is
// CoreError(Unreachable).
class RPCClient {
public:
  // Long enough for a fan-out that waits on the slowest upload
  static constexpr std::chrono::seconds kDefaultTimeout{90};

  explicit RPCClient(std::filesystem::path socket_path, std::chrono::seconds timeout = kDefaultTimeout);

  // Raw exchange; returns the reply text unparsed
  std::string Call(const std::string& method, const std::vector<std::string>& params = {});

  // Call and decode the reply, raising error replies
  nlohmann::json CallJson(const std::string& method, const std::vector<std::string>& params = {});

  nlohmann::json GetInfo();
  void Stop();

  nlohmann::json ListPeers();
  // port 0 leaves the node's default
  nlohmann::json AddPeer(const std::string& ip, const std::string& name = "", uint16_t port = 0);
  bool RemovePeer(const std::string& peer_id);
  bool CheckPeer(const std::string& peer_id);

  // Fan-out; an empty target list means every known peer
  nlohmann::json ApplyConfig(const std::vector<std::string>& targets, const nlohmann::json& config);
  nlohmann::json UploadMedia(const std::vector<std::string>& targets, const std::filesystem::path& file);
  nlohmann::json PushUpdate(const std::vector<std::string>& targets, const std::filesystem::path& package,
                            bool restart_pc);

  nlohmann::json ListAddons();
  nlohmann::json SetAddonConfig(const std::string& addon_id, const nlohmann::json& patch);
  nlohmann::json ReloadAddons();

  const std::filesystem::path& socket_path() const { return socket_path_; }

private:
  nlohmann::json Fanout(const std::string& op, const std::vector<std::string>& targets, const std::string& payload,
                        const std::vector<std::string>& extra = {});

  std::filesystem::path socket_path_;
  std::chrono::seconds timeout_;
};

}  // namespace rpc
}  // namespace signage
