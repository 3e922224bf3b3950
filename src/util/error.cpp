// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "util/error.hpp"

#include <cerrno>

namespace signage {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::Unreachable:
    return "Unreachable";
  case ErrorCode::ValidationError:
    return "ValidationError";
  case ErrorCode::LifecycleError:
    return "LifecycleError";
  case ErrorCode::TransientIO:
    return "TransientIO";
  }
  return "Unknown";
}

std::optional<ErrorCode> ParseErrorCode(const std::string& name) {
  for (ErrorCode code : {ErrorCode::NotFound, ErrorCode::Unreachable, ErrorCode::ValidationError,
                         ErrorCode::LifecycleError, ErrorCode::TransientIO}) {
    if (name == ErrorCodeName(code)) {
      return code;
    }
  }
  return std::nullopt;
}

bool IsTransientIOError(const std::error_code& ec) {
  if (!ec)
    return false;
  return ec == std::errc::io_error || ec == std::errc::broken_pipe;
}

bool IsTransientIOError(const std::exception& e) {
  if (auto* core = dynamic_cast<const CoreError*>(&e)) {
    return core->code() == ErrorCode::TransientIO;
  }
  if (auto* sys = dynamic_cast<const std::system_error*>(&e)) {
    return IsTransientIOError(sys->code());
  }
  return false;
}

}  // namespace signage
