// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace signage {
namespace network {

// Discovery datagram: {"type":"announce","id":s,"name":s,"port":int}
struct Announcement {
  std::string id;    // sender's display name
  std::string name;  // sender's display name
  uint16_t port{0};  // sender's HTTP API port
};

// Largest datagram we accept or send
inline constexpr size_t kMaxAnnouncementSize = 2048;

std::string EncodeAnnouncement(const Announcement& msg);

// Returns std::nullopt for anything that is not a well-formed announcement
// (not JSON, not an object, other type, wrong field types, port out of range).
std::optional<Announcement> DecodeAnnouncement(std::string_view data);

}  // namespace network
}  // namespace signage
