// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/http_client.hpp"

#include "util/logging.hpp"
#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <vector>

#include <httplib.h>

namespace signage {
namespace network {

namespace {

constexpr size_t kUploadChunkSize = 64 * 1024;

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Streams a file in chunks; stops the request once the deadline has passed
class FileBodyProvider {
public:
  FileBodyProvider(const std::filesystem::path& path, std::chrono::steady_clock::time_point deadline)
      : in_(std::make_shared<std::ifstream>(path, std::ios::binary)), deadline_(deadline) {}

  bool is_open() const { return in_->is_open(); }

  bool operator()(size_t offset, size_t length, httplib::DataSink& sink) const {
    if (std::chrono::steady_clock::now() >= deadline_) {
      return false;
    }
    std::vector<char> buffer(std::min(length, kUploadChunkSize));
    in_->seekg(static_cast<std::streamoff>(offset));
    in_->read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = in_->gcount();
    if (got <= 0) {
      return false;
    }
    return sink.write(buffer.data(), static_cast<size_t>(got));
  }

private:
  std::shared_ptr<std::ifstream> in_;
  std::chrono::steady_clock::time_point deadline_;
};

}  // namespace

HttpResult HttplibClient::Perform(const HttpRequest& request) {
  HttpResult result;
  const auto start = std::chrono::steady_clock::now();
  const auto deadline = start + request.timeout;

  httplib::Client client(request.host, request.port);
  client.set_keep_alive(false);
  client.set_url_encode(false);  // targets arrive escaped
  client.set_connection_timeout(request.timeout);
  client.set_read_timeout(request.timeout);
  client.set_write_timeout(request.timeout);

  httplib::Headers headers{{"User-Agent", "signage-node/" + GetVersionString()}};
  const std::string content_type = request.content_type.empty() ? "application/octet-stream" : request.content_type;

  if (request.method != "GET" && request.method != "POST") {
    result.error = "unsupported method " + request.method;
    return result;
  }

  std::optional<FileBodyProvider> provider;
  uintmax_t body_size = 0;
  if (request.method == "POST" && !request.body_file.empty()) {
    std::error_code ec;
    body_size = std::filesystem::file_size(request.body_file, ec);
    provider.emplace(request.body_file, deadline);
    if (ec || !provider->is_open()) {
      result.error = "cannot read " + request.body_file.string() + (ec ? ": " + ec.message() : "");
      return result;
    }
  }

  auto res = [&]() -> httplib::Result {
    if (request.method == "GET") {
      return client.Get(request.target, headers,
                        [deadline](uint64_t, uint64_t) { return std::chrono::steady_clock::now() < deadline; });
    }
    if (provider) {
      return client.Post(request.target, headers, static_cast<size_t>(body_size), *provider, content_type);
    }
    return client.Post(request.target, headers, request.body, content_type);
  }();

  if (!res) {
    result.timed_out = std::chrono::steady_clock::now() >= deadline;
    result.error = result.timed_out ? "timeout after " + std::to_string(request.timeout.count()) + "ms"
                                    : httplib::to_string(res.error());
    LOG_NET_DEBUG("{} http://{}:{}{} failed: {}", request.method, request.host, request.port, request.target,
                  result.error);
    return result;
  }

  result.ok = true;
  result.response.status = res->status;
  for (const auto& [name, value] : res->headers) {
    result.response.headers[ToLower(name)] = value;
  }
  result.response.body = res->body;
  return result;
}

std::string UrlEncode(const std::string& value) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

}  // namespace network
}  // namespace signage
