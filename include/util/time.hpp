// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace parley {
namespace util {

/**
 * Mockable clock
 *
 * Session timers (idle, ping, handshake) read time only through these
 * functions, so tests can move the clock forward without sleeping.
 * A mock value of 0 means real time.
 */

/** Unix time in milliseconds (mocked when set). */
int64_t GetTimeMillis();

/**
 * Steady clock. While mock time is active this is a fixed real reference
 * point plus the distance the mock clock moved since it was first set, so
 * advancing the mock advances steady time by the same amount.
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/** Set mock time in seconds (0 disables mocking). */
void SetMockTime(int64_t time);

/** Set mock time in milliseconds (0 disables mocking). */
void SetMockTimeMillis(int64_t time_ms);

/** Move an active mock clock forward. No-op when mocking is off. */
void AdvanceMockTimeMillis(int64_t delta_ms);

/** Current mock setting in milliseconds, 0 when disabled. */
int64_t GetMockTimeMillis();

/**
 * Format a Unix timestamp as "YYYY-MM-DD HH:MM:SS UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_ms_(GetMockTimeMillis()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTimeMillis(previous_ms_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;
  MockTimeScope(MockTimeScope &&) = delete;
  MockTimeScope &operator=(MockTimeScope &&) = delete;

private:
  const int64_t previous_ms_;
};

} // namespace util
} // namespace parley
