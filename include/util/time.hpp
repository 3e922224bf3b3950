// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace signage {
namespace util {

// Wall-clock time in milliseconds since the epoch (mockable).
int64_t GetTimeMillis();

// Steady clock that follows mock time while it is set.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock wall-clock time in milliseconds. 0 disables mocking.
void SetMockTime(int64_t time_ms);

// Current mock time (0 = disabled).
int64_t GetMockTime();

// Format a millisecond timestamp as "YYYY-MM-DD HH:MM:SS UTC".
std::string FormatTime(int64_t time_ms);

// ISO 8601 UTC with milliseconds, e.g. "2025-03-01T12:00:00.250Z"
std::string FormatIsoTime(int64_t time_ms);

// RAII helper for tests: sets mock time, restores real time on scope exit.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time_ms) { SetMockTime(time_ms); }
  ~MockTimeScope() { SetMockTime(0); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

  void Advance(std::chrono::milliseconds delta) { SetMockTime(GetMockTime() + delta.count()); }
};

}  // namespace util
}  // namespace signage
