// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include "network/http_client.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace signage {
namespace test {

// Scripted HttpClient. Each host:port gets a behavior; unknown endpoints
// refuse the connection.
class FakeHttpClient : public network::HttpClient {
public:
  struct Behavior {
    enum class Kind { Respond, Refuse, Hang };
    Kind kind{Kind::Refuse};
    int status{200};
    std::string body;
    std::chrono::milliseconds delay{0};  // before responding
  };

  // 200 with {"displayName": name} (what /api/config returns)
  static Behavior Online(const std::string& name);
  static Behavior Status(int status, const std::string& body = "");
  static Behavior Refused();
  // Never answers; Perform returns timed_out after the request's timeout
  static Behavior Hang();

  void SetBehavior(const std::string& host, uint16_t port, Behavior behavior);
  void SetDefault(Behavior behavior);

  network::HttpResult Perform(const network::HttpRequest& request) override;

  std::vector<network::HttpRequest> requests() const;
  size_t request_count() const;
  size_t request_count(const std::string& host, uint16_t port) const;
  void ClearRequests();

private:
  mutable std::mutex mutex_;
  std::map<std::string, Behavior> behaviors_;
  Behavior default_{};
  std::vector<network::HttpRequest> requests_;
};

}  // namespace test
}  // namespace signage
