// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "network/announcement.hpp"

#include <nlohmann/json.hpp>

namespace signage {
namespace network {

std::string EncodeAnnouncement(const Announcement& msg) {
  nlohmann::json j;
  j["type"] = "announce";
  j["id"] = msg.id;
  j["name"] = msg.name;
  j["port"] = msg.port;
  return j.dump();
}

std::optional<Announcement> DecodeAnnouncement(std::string_view data) {
  if (data.empty() || data.size() > kMaxAnnouncementSize) {
    return std::nullopt;
  }

  auto j = nlohmann::json::parse(data, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }

  auto type = j.find("type");
  if (type == j.end() || !type->is_string() || type->get<std::string>() != "announce") {
    return std::nullopt;
  }

  auto id = j.find("id");
  auto port = j.find("port");
  if (id == j.end() || !id->is_string() || id->get<std::string>().empty()) {
    return std::nullopt;
  }
  if (port == j.end() || !port->is_number_integer()) {
    return std::nullopt;
  }
  int64_t port_value = port->get<int64_t>();
  if (port_value <= 0 || port_value > 65535) {
    return std::nullopt;
  }

  Announcement msg;
  msg.id = id->get<std::string>();
  msg.port = static_cast<uint16_t>(port_value);

  // Older senders omit name; the display name doubles as id
  auto name = j.find("name");
  if (name == j.end() || name->is_null()) {
    msg.name = msg.id;
  } else if (name->is_string()) {
    msg.name = name->get<std::string>();
  } else {
    return std::nullopt;
  }
  return msg;
}

}  // namespace network
}  // namespace signage
