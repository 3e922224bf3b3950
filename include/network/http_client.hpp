// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace signage {
namespace network {

struct HttpRequest {
  std::string method{"GET"};
  std::string host;
  uint16_t port{80};
  std::string target{"/"};  // path + query, already escaped
  std::string content_type;
  std::string body;
  // When set, the body is streamed from this file instead of `body`
  std::filesystem::path body_file;
  std::chrono::milliseconds timeout{10000};  // bounds connect, each read and write, and the body transfer
};

struct HttpResponse {
  int status{0};
  std::map<std::string, std::string> headers;  // lower-cased names
  std::string body;

  bool is_success() const { return status >= 200 && status < 300; }
};

struct HttpResult {
  bool ok{false};  // a response was received (any status)
  bool timed_out{false};
  HttpResponse response;
  std::string error;  // set when !ok
};

// HTTP/1.1 client interface.
// Implementations must be callable from several threads at once; each call
// blocks the calling thread until the exchange finishes or times out.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResult Perform(const HttpRequest& request) = 0;
};

// cpp-httplib client. Every call opens its own connection on the calling
// thread, so a slow peer never holds up the shared reactor. Connect, read and
// write are each bounded by the request timeout, and an upload or download
// that runs past it is cancelled.
class HttplibClient : public HttpClient {
public:
  HttplibClient() = default;
  HttpResult Perform(const HttpRequest& request) override;
};

// Percent-encode a query-string component
std::string UrlEncode(const std::string& value);

}  // namespace network
}  // namespace signage
