// Copyright (c) 2025 The Signage Node Developers
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace signage {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time_ms{0};

// Steady clock reference captured when mock time is first read, so that
// GetSteadyTime() advances by exactly the mock delta afterwards
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference{0};
static bool g_steady_initialized{false};

int64_t GetTimeMillis() {
  int64_t mock = g_mock_time_ms.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time_ms.load(std::memory_order_relaxed);
  if (mock != 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    if (!g_steady_initialized) {
      g_real_steady_reference = std::chrono::steady_clock::now();
      g_mock_steady_reference = mock;
      g_steady_initialized = true;
    }
    return g_real_steady_reference + std::chrono::milliseconds(mock - g_mock_steady_reference);
  }
  return std::chrono::steady_clock::now();
}

void SetMockTime(int64_t time_ms) {
  g_mock_time_ms.store(time_ms, std::memory_order_relaxed);

  // Keep the steady reference while mock time moves so deltas stay correct;
  // drop it only when mocking is switched off
  if (time_ms == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time_ms.load(std::memory_order_relaxed);
}

std::string FormatTime(int64_t time_ms) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{time_ms / 1000}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-" << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << "-" << std::setw(2) << static_cast<unsigned>(ymd.day()) << " "
      << std::setw(2) << hms.hours().count() << ":" << std::setw(2) << hms.minutes().count() << ":" << std::setw(2)
      << hms.seconds().count() << " UTC";
  return oss.str();
}

std::string FormatIsoTime(int64_t time_ms) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{time_ms / 1000}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-" << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << "-" << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
      << std::setw(2) << hms.hours().count() << ":" << std::setw(2) << hms.minutes().count() << ":" << std::setw(2)
      << hms.seconds().count() << "." << std::setw(3) << (time_ms % 1000) << "Z";
  return oss.str();
}

}  // namespace util
}  // namespace signage
