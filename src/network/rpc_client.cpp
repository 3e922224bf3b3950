// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/rpc_client.hpp"

#include "util/error.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace signage {
namespace rpc {

namespace {

constexpr size_t kMaxReplySize = 10 * 1024 * 1024;

// Owns one connected descriptor
class Connection {
public:
  Connection(const std::filesystem::path& path, std::chrono::seconds timeout) {
    const std::string p = path.string();
    sockaddr_un addr{};
    if (p.size() >= sizeof(addr.sun_path)) {
      throw CoreError(ErrorCode::ValidationError,
                      "control socket path too long (" + std::to_string(p.size()) + " bytes), use a shorter --datadir");
    }
    fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd_ < 0) {
      throw std::runtime_error(std::string("cannot create socket: ") + std::strerror(errno));
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, p.c_str(), p.size() + 1);
    if (connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      const std::string reason = std::strerror(errno);
      close(fd_);
      throw CoreError(ErrorCode::Unreachable, "cannot reach signaged at " + p + ": " + reason);
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count());
    if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
      const std::string reason = std::strerror(errno);
      close(fd_);
      throw std::runtime_error("cannot set control socket timeout: " + reason);
    }
  }

  ~Connection() { close(fd_); }

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  void SendAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
      ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        throw CoreError(ErrorCode::Unreachable, std::string("control socket write failed: ") + std::strerror(errno));
      }
      sent += static_cast<size_t>(n);
    }
  }

  // Until the node closes its end
  std::string ReadAll() {
    std::string reply;
    char buf[4096];
    for (;;) {
      ssize_t n = recv(fd_, buf, sizeof(buf), 0);
      if (n < 0) {
        throw CoreError(ErrorCode::Unreachable, errno == EAGAIN || errno == EWOULDBLOCK
                                                    ? "no reply from signaged"
                                                    : std::string("control socket read failed: ") +
                                                          std::strerror(errno));
      }
      if (n == 0) {
        return reply;
      }
      reply.append(buf, static_cast<size_t>(n));
      if (reply.size() > kMaxReplySize) {
        throw std::runtime_error("reply from signaged exceeds 10 MB");
      }
    }
  }

private:
  int fd_{-1};
};

std::string JoinTargets(const std::vector<std::string>& targets) {
  if (targets.empty()) {
    return "all";
  }
  std::string out;
  for (const auto& t : targets) {
    if (!out.empty()) {
      out += ',';
    }
    out += t;
  }
  return out;
}

}  // namespace

RPCClient::RPCClient(std::filesystem::path socket_path, std::chrono::seconds timeout)
    : socket_path_(std::move(socket_path)), timeout_(timeout) {}

std::string RPCClient::Call(const std::string& method, const std::vector<std::string>& params) {
  nlohmann::json request{{"method", method}};
  if (!params.empty()) {
    request["params"] = params;
  }
  Connection conn(socket_path_, timeout_);
  conn.SendAll(request.dump() + "\n");
  return conn.ReadAll();
}

nlohmann::json RPCClient::CallJson(const std::string& method, const std::vector<std::string>& params) {
  const std::string text = Call(method, params);
  nlohmann::json reply = nlohmann::json::parse(text, nullptr, false);
  if (reply.is_discarded()) {
    throw std::runtime_error("malformed reply to " + method);
  }
  if (reply.is_object() && reply.contains("error") && reply["error"].is_string()) {
    const std::string message = reply["error"].get<std::string>();
    if (auto it = reply.find("code"); it != reply.end() && it->is_string()) {
      if (auto code = ParseErrorCode(it->get<std::string>())) {
        throw CoreError(*code, message);
      }
    }
    throw std::runtime_error(message);
  }
  return reply;
}

nlohmann::json RPCClient::GetInfo() {
  return CallJson("getinfo");
}

void RPCClient::Stop() {
  CallJson("stop");
}

nlohmann::json RPCClient::ListPeers() {
  return CallJson("listpeers");
}

nlohmann::json RPCClient::AddPeer(const std::string& ip, const std::string& name, uint16_t port) {
  std::vector<std::string> params{ip, name};
  if (port != 0) {
    params.push_back(std::to_string(port));
  }
  return CallJson("addpeer", params);
}

bool RPCClient::RemovePeer(const std::string& peer_id) {
  return CallJson("removepeer", {peer_id}).value("removed", false);
}

bool RPCClient::CheckPeer(const std::string& peer_id) {
  return CallJson("checkpeer", {peer_id}).value("online", false);
}

nlohmann::json RPCClient::Fanout(const std::string& op, const std::vector<std::string>& targets,
                                 const std::string& payload, const std::vector<std::string>& extra) {
  std::vector<std::string> params{op, JoinTargets(targets), payload};
  params.insert(params.end(), extra.begin(), extra.end());
  return CallJson("fanout", params);
}

nlohmann::json RPCClient::ApplyConfig(const std::vector<std::string>& targets, const nlohmann::json& config) {
  if (!config.is_object()) {
    throw CoreError(ErrorCode::ValidationError, "config must be a JSON object");
  }
  return Fanout("apply-config", targets, config.dump());
}

nlohmann::json RPCClient::UploadMedia(const std::vector<std::string>& targets, const std::filesystem::path& file) {
  // The node reads the file, so hand it an absolute path
  return Fanout("upload-media", targets, std::filesystem::absolute(file).string());
}

nlohmann::json RPCClient::PushUpdate(const std::vector<std::string>& targets, const std::filesystem::path& package,
                                     bool restart_pc) {
  return Fanout("push-update", targets, std::filesystem::absolute(package).string(),
                {restart_pc ? "true" : "false"});
}

nlohmann::json RPCClient::ListAddons() {
  return CallJson("listaddons");
}

nlohmann::json RPCClient::SetAddonConfig(const std::string& addon_id, const nlohmann::json& patch) {
  return CallJson("setaddonconfig", {addon_id, patch.dump()});
}

nlohmann::json RPCClient::ReloadAddons() {
  return CallJson("reloadaddons");
}

}  // namespace rpc
}  // namespace signage
