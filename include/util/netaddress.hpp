// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings coming from config, RPC and
   UDP datagrams
 - Loopback detection for the discovery source-address remap
 - IPv4 /24 broadcast address for the static-IP announce target
*/

#include <cstdint>
#include <optional>
#include <string>

namespace signage {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps asio::ip::make_address() and normalizes IPv4-mapped IPv6 addresses
 * to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4), so a peer reached over a dual-stack
 * socket gets the same id as one reached over IPv4.
 *
 * Hostnames are rejected; only numeric addresses are accepted.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

/**
 * Host accepted for a peer: a numeric IP (normalized) or the literal
 * "localhost". Returns std::nullopt otherwise.
 */
std::optional<std::string> NormalizePeerHost(const std::string& host);

// True for 127.0.0.0/8, ::1 and IPv4-mapped loopback
bool IsLoopback(const std::string& address);

/**
 * Broadcast address of the /24 containing an IPv4 address
 * ("192.168.1.20" -> "192.168.1.255"). std::nullopt for IPv6 or invalid input.
 */
std::optional<std::string> SubnetBroadcastV4(const std::string& address);

/**
 * Parse a decimal port. Rejects empty strings, signs, whitespace, trailing
 * characters and values outside 1..65535.
 */
std::optional<uint16_t> ParsePort(const std::string& str);

/**
 * Parse "IP:port" (IPv4) or "[IPv6]:port". "localhost:port" is accepted.
 */
bool ParseHostPort(const std::string& host_port, std::string& out_host, uint16_t& out_port);

}  // namespace util
}  // namespace signage
