// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace parley {
namespace util {

// 0 means mock time is disabled
static std::atomic<int64_t> g_mock_time_ms{0};

// Steady-clock anchor for mock mode, guarded by g_steady_mutex.
// Set on the first mock value, cleared when mocking is turned off.
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference_ms{0};
static bool g_steady_initialized{false};

int64_t GetTimeMillis() {
  int64_t mock = g_mock_time_ms.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time_ms.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_steady_initialized) {
    g_real_steady_reference = std::chrono::steady_clock::now();
    g_mock_steady_reference_ms = mock;
    g_steady_initialized = true;
  }
  return g_real_steady_reference +
         std::chrono::milliseconds(mock - g_mock_steady_reference_ms);
}

void SetMockTimeMillis(int64_t time_ms) {
  std::lock_guard<std::mutex> lock(g_steady_mutex);
  g_mock_time_ms.store(time_ms, std::memory_order_relaxed);
  if (time_ms == 0) {
    g_steady_initialized = false;
  }
}

void SetMockTime(int64_t time) { SetMockTimeMillis(time * 1000); }

void AdvanceMockTimeMillis(int64_t delta_ms) {
  std::lock_guard<std::mutex> lock(g_steady_mutex);
  int64_t current = g_mock_time_ms.load(std::memory_order_relaxed);
  if (current != 0) {
    g_mock_time_ms.store(current + delta_ms, std::memory_order_relaxed);
  }
}

int64_t GetMockTimeMillis() {
  return g_mock_time_ms.load(std::memory_order_relaxed);
}

std::string FormatTime(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_utc;
  if (!gmtime_r(&t, &tm_utc)) {
    return "invalid";
  }
  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

} // namespace util
} // namespace parley
