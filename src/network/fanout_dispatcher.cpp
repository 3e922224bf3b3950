// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/fanout_dispatcher.hpp"

#include "util/logging.hpp"
#include "util/thread_joiner.hpp"

#include <set>
#include <stdexcept>
#include <thread>

namespace signage {
namespace network {

const char* OperationName(FanoutOperation op) {
  switch (op) {
  case FanoutOperation::ApplyConfig:
    return "apply-config";
  case FanoutOperation::UploadMedia:
    return "upload-media";
  case FanoutOperation::PushUpdate:
    return "push-update";
  }
  return "unknown";
}

std::optional<FanoutOperation> ParseOperation(const std::string& name) {
  if (name == "apply-config")
    return FanoutOperation::ApplyConfig;
  if (name == "upload-media")
    return FanoutOperation::UploadMedia;
  if (name == "push-update")
    return FanoutOperation::PushUpdate;
  return std::nullopt;
}

nlohmann::json FanoutResult::ToJson() const {
  nlohmann::json j;
  j["successCount"] = success_count;
  j["failCount"] = fail_count;
  j["results"] = nlohmann::json::array();
  for (const auto& r : results) {
    nlohmann::json entry{{"target", r.target_id}, {"success", r.success}};
    if (!r.success) {
      entry["error"] = r.error;
    }
    j["results"].push_back(std::move(entry));
  }
  return j;
}

FanoutDispatcher::FanoutDispatcher(PeerRegistry& registry, std::shared_ptr<HttpClient> http)
    : registry_(registry), http_(http ? std::move(http) : std::make_shared<HttplibClient>()) {}

void FanoutDispatcher::SetLocalHandler(LocalHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  local_handler_ = std::move(handler);
}

std::chrono::milliseconds FanoutDispatcher::DefaultTimeout(FanoutOperation op) {
  switch (op) {
  case FanoutOperation::ApplyConfig:
    return std::chrono::seconds(10);
  case FanoutOperation::UploadMedia:
    return std::chrono::seconds(30);
  case FanoutOperation::PushUpdate:
    return std::chrono::seconds(60);
  }
  return std::chrono::seconds(10);
}

HttpRequest FanoutDispatcher::BuildRequest(const Peer& peer, FanoutOperation op, const FanoutPayload& payload,
                                           std::chrono::milliseconds timeout) {
  HttpRequest request;
  request.method = "POST";
  request.host = peer.ip;
  request.port = peer.port;
  request.timeout = timeout;

  switch (op) {
  case FanoutOperation::ApplyConfig:
    request.target = "/api/config";
    request.content_type = "application/json";
    request.body = payload.config.dump();
    break;
  case FanoutOperation::UploadMedia:
    request.target = "/api/media/receive?filename=" + UrlEncode(payload.filename);
    request.content_type = "application/octet-stream";
    request.body_file = payload.file;
    break;
  case FanoutOperation::PushUpdate:
    request.target = std::string("/api/update/receive?restartPC=") + (payload.restart_pc ? "true" : "false");
    request.content_type = "application/octet-stream";
    request.body_file = payload.file;
    break;
  }
  return request;
}

FanoutResult FanoutDispatcher::Dispatch(const std::vector<std::string>& target_ids, FanoutOperation op,
                                        const FanoutPayload& payload,
                                        std::optional<std::chrono::milliseconds> per_request_timeout) {
  if (target_ids.empty()) {
    throw std::invalid_argument("no target devices selected");
  }
  switch (op) {
  case FanoutOperation::ApplyConfig:
    if (!payload.config.is_object()) {
      throw std::invalid_argument("apply-config needs a JSON object");
    }
    break;
  case FanoutOperation::UploadMedia:
    if (payload.filename.empty()) {
      throw std::invalid_argument("upload-media needs a filename");
    }
    [[fallthrough]];
  case FanoutOperation::PushUpdate:
    if (payload.file.empty() || !std::filesystem::is_regular_file(payload.file)) {
      throw std::invalid_argument(std::string(OperationName(op)) + " needs an existing file");
    }
    break;
  }

  const auto timeout = per_request_timeout.value_or(DefaultTimeout(op));

  // Duplicate ids collapse onto the first occurrence
  std::vector<std::string> targets;
  std::set<std::string> seen;
  for (const auto& id : target_ids) {
    if (seen.insert(id).second) {
      targets.push_back(id);
    }
  }

  FanoutResult batch;
  batch.results.resize(targets.size());
  std::vector<std::thread> workers;
  util::ThreadJoiner joiner(workers);
  workers.reserve(targets.size());

  for (size_t i = 0; i < targets.size(); ++i) {
    const std::string& id = targets[i];
    TargetResult& slot = batch.results[i];
    slot.target_id = id;

    if (id == kLocalPeerId) {
      workers.emplace_back([this, &slot, op, &payload]() {
        auto r = ApplyLocally(op, payload);
        r.target_id = slot.target_id;
        slot = std::move(r);
      });
      continue;
    }

    auto peer = registry_.Get(id);
    if (!peer) {
      slot.error = "unknown peer";
      slot.code = ErrorCode::NotFound;
      continue;
    }
    if (!peer->online) {
      slot.error = "peer offline";
      slot.code = ErrorCode::Unreachable;
      continue;
    }

    workers.emplace_back([this, &slot, peer = *peer, op, &payload, timeout]() {
      slot = SendToPeer(peer, op, payload, timeout);
    });
  }

  joiner.JoinAll();

  for (const auto& r : batch.results) {
    if (r.success) {
      ++batch.success_count;
    } else {
      ++batch.fail_count;
    }
  }
  LOG_NET_INFO("{} fan-out: {} succeeded, {} failed", OperationName(op), batch.success_count, batch.fail_count);
  return batch;
}

TargetResult FanoutDispatcher::SendToPeer(const Peer& peer, FanoutOperation op, const FanoutPayload& payload,
                                          std::chrono::milliseconds timeout) {
  TargetResult r;
  r.target_id = peer.id;
  try {
    HttpResult result = http_->Perform(BuildRequest(peer, op, payload, timeout));
    if (!result.ok) {
      r.error = result.error;
      r.code = ErrorCode::Unreachable;
    } else if (!result.response.is_success()) {
      // The peer is up but refused the request
      r.error = "HTTP " + std::to_string(result.response.status);
      r.code = ErrorCode::ValidationError;
    } else {
      r.success = true;
    }
  } catch (const std::exception& e) {
    r.error = e.what();
    r.code = ErrorCode::Unreachable;
  }

  if (!r.success) {
    LOG_NET_WARN("{} to {} ({}) failed: {}", OperationName(op), peer.name, peer.id, r.error);
  }
  return r;
}

TargetResult FanoutDispatcher::ApplyLocally(FanoutOperation op, const FanoutPayload& payload) {
  TargetResult r;
  r.target_id = kLocalPeerId;

  LocalHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = local_handler_;
  }
  if (!handler) {
    r.error = "local device handling not available";
    r.code = ErrorCode::NotFound;
    return r;
  }

  try {
    handler(op, payload);
    r.success = true;
  } catch (const CoreError& e) {
    r.error = e.what();
    r.code = e.code();
  } catch (const std::exception& e) {
    r.error = e.what();
    r.code = ErrorCode::LifecycleError;
  }
  if (!r.success) {
    LOG_NET_WARN("{} on this device failed: {}", OperationName(op), r.error);
  }
  return r;
}

}  // namespace network
}  // namespace signage
