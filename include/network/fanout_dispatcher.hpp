// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "network/http_client.hpp"
#include "network/peer_registry.hpp"
#include "util/error.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace signage {
namespace network {

enum class FanoutOperation {
  ApplyConfig,  // POST /api/config
  UploadMedia,  // POST /api/media/receive?filename=
  PushUpdate,   // POST /api/update/receive?restartPC=
};

const char* OperationName(FanoutOperation op);
std::optional<FanoutOperation> ParseOperation(const std::string& name);

struct FanoutPayload {
  nlohmann::json config;       // ApplyConfig
  std::filesystem::path file;  // UploadMedia / PushUpdate, streamed per peer
  std::string filename;        // UploadMedia: name on the receiving device
  bool restart_pc{false};      // PushUpdate
};

struct TargetResult {
  std::string target_id;
  bool success{false};
  std::string error;
  std::optional<ErrorCode> code;
};

struct FanoutResult {
  size_t success_count{0};
  size_t fail_count{0};
  std::vector<TargetResult> results;  // in request order

  nlohmann::json ToJson() const;
};

// FanoutDispatcher - sends one operation to many devices at once
//
// Every remote target gets its own worker thread and its own timeout; one
// slow or dead peer never delays another. The "local" target is handed to
// the injected local handler. Unknown and offline targets fail fast without
// a request.
class FanoutDispatcher {
public:
  // Applies an operation to this device. Throws to report failure.
  using LocalHandler = std::function<void(FanoutOperation, const FanoutPayload&)>;

  explicit FanoutDispatcher(PeerRegistry& registry, std::shared_ptr<HttpClient> http = nullptr);

  void SetLocalHandler(LocalHandler handler);

  // Throws std::invalid_argument for an empty target list or a payload that
  // does not fit the operation. Never throws for per-target failures.
  FanoutResult Dispatch(const std::vector<std::string>& target_ids, FanoutOperation op, const FanoutPayload& payload,
                        std::optional<std::chrono::milliseconds> per_request_timeout = std::nullopt);

  static std::chrono::milliseconds DefaultTimeout(FanoutOperation op);

  // Builds the HTTP request for one peer (exposed for tests)
  static HttpRequest BuildRequest(const Peer& peer, FanoutOperation op, const FanoutPayload& payload,
                                  std::chrono::milliseconds timeout);

private:
  TargetResult SendToPeer(const Peer& peer, FanoutOperation op, const FanoutPayload& payload,
                          std::chrono::milliseconds timeout);
  TargetResult ApplyLocally(FanoutOperation op, const FanoutPayload& payload);

  PeerRegistry& registry_;
  std::shared_ptr<HttpClient> http_;

  std::mutex handler_mutex_;
  LocalHandler local_handler_;
};

}  // namespace network
}  // namespace signage
