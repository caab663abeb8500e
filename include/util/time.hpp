// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace topowatch {
namespace util {

/**
 * Mockable wall-clock time
 *
 * Observation timestamps and the device/link lifecycle (grace and retention
 * periods) are expressed in Unix seconds obtained through GetTime(). Tests call
 * SetMockTime() to move time without sleeping.
 *
 * Probe deadlines and backoff use std::chrono::steady_clock directly and are
 * not affected by mock time.
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise real system time
 */
int64_t GetTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting (0 if disabled)
 */
int64_t GetMockTime();

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace topowatch
