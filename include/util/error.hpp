// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace signage {

enum class ErrorCode {
  NotFound,         // unknown peer or addon id
  Unreachable,      // peer did not answer (per fan-out target)
  ValidationError,  // bad manifest, bad setting value, bad address
  LifecycleError,   // addon hook failed
  TransientIO,      // EIO/EPIPE while stdout or a pipe is going away
};

const char* ErrorCodeName(ErrorCode code);
// Inverse of ErrorCodeName; nullopt for an unknown name
std::optional<ErrorCode> ParseErrorCode(const std::string& name);

class CoreError : public std::runtime_error {
public:
  CoreError(ErrorCode code, const std::string& message) : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

// EIO / EPIPE: the other end of a stream is gone (usually during shutdown).
bool IsTransientIOError(const std::error_code& ec);
bool IsTransientIOError(const std::exception& e);

}  // namespace signage
