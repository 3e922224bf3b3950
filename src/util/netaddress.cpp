// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include "util/logging.hpp"

#include <charconv>

#include <asio/ip/address.hpp>

namespace signage {
namespace util {

namespace {

std::optional<asio::ip::address> ParseAddress(const std::string& address) {
  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec)
    return std::nullopt;

  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    return asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
  }
  return ip;
}

}  // namespace

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    auto ip = ParseAddress(address);
    if (!ip) {
      return std::nullopt;
    }
    return ip->to_string();
  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

std::optional<std::string> NormalizePeerHost(const std::string& host) {
  if (host == "localhost") {
    return host;
  }
  return ValidateAndNormalizeIP(host);
}

bool IsLoopback(const std::string& address) {
  auto ip = ParseAddress(address);
  if (!ip)
    return false;
  return ip->is_loopback();
}

std::optional<std::string> SubnetBroadcastV4(const std::string& address) {
  auto ip = ParseAddress(address);
  if (!ip || !ip->is_v4())
    return std::nullopt;

  auto bytes = ip->to_v4().to_bytes();
  bytes[3] = 255;
  return asio::ip::address_v4(bytes).to_string();
}

std::optional<uint16_t> ParsePort(const std::string& str) {
  if (str.empty() || str.size() > 5) {
    return std::nullopt;
  }
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  if (value == 0 || value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port) {
  if (host_port.empty()) {
    return false;
  }

  std::string host;
  std::string port_str;
  if (host_port[0] == '[') {
    size_t bracket_end = host_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2)
      return false;
    if (bracket_end + 1 >= host_port.size() || host_port[bracket_end + 1] != ':')
      return false;
    host = host_port.substr(1, bracket_end - 1);
    port_str = host_port.substr(bracket_end + 2);
  } else {
    size_t colon = host_port.find(':');
    // More than one colon is unbracketed IPv6
    if (colon == std::string::npos || host_port.find(':', colon + 1) != std::string::npos)
      return false;
    host = host_port.substr(0, colon);
    port_str = host_port.substr(colon + 1);
  }

  auto port = ParsePort(port_str);
  auto normalized = NormalizePeerHost(host);
  if (!port || !normalized) {
    return false;
  }
  out_host = *normalized;
  out_port = *port;
  return true;
}

}  // namespace util
}  // namespace signage
