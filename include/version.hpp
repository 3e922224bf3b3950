// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <string>

#define SIGNAGE_VERSION_MAJOR 1
#define SIGNAGE_VERSION_MINOR 3
#define SIGNAGE_VERSION_PATCH 0

namespace signage {

inline std::string GetVersionString() {
  return std::to_string(SIGNAGE_VERSION_MAJOR) + "." + std::to_string(SIGNAGE_VERSION_MINOR) + "." +
         std::to_string(SIGNAGE_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "Signage Node version v" + GetVersionString();
}

}  // namespace signage
