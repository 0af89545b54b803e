// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_UTIL_TIME_HPP
#define CODL3_UTIL_TIME_HPP

#include <cstdint>
#include <string>

namespace codl3 {
namespace util {

/**
 * Mockable time source
 *
 * Production code calls GetTime() instead of reading the system clock
 * directly. Tests call SetMockTime() to pin the current time, which makes
 * challenge windows and bridge timestamps deterministic.
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
 *
 * Time does not advance automatically while mocked.
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled (using real time)
 */
int64_t GetMockTime();

// "YYYY-MM-DD HH:MM:SS UTC"
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

private:
  int64_t previous_time_;
};

} // namespace util
} // namespace codl3

#endif // CODL3_UTIL_TIME_HPP
