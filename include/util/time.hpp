// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace notekeep {
namespace util {

/**
 * Mockable wall clock for testing
 *
 * Usage:
 * - Production code calls GetTime() instead of reading the system clock
 * - Tests call SetMockTime() (or use MockTimeScope) to pin the current time
 * - When mock time is 0 (default), GetTime() returns real system time
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled (using real time)
 */
int64_t GetMockTime();

/**
 * Format a Unix timestamp as a human-readable UTC string
 *
 * Example: FormatTime(1729857600) -> "2024-10-25 12:00:00 UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;
  MockTimeScope(MockTimeScope &&) = delete;
  MockTimeScope &operator=(MockTimeScope &&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace notekeep
