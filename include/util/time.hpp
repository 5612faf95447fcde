// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace peernet {
namespace util {

// Steady clock used for connection ages and log rate limiting. While mock
// time is set it advances exactly as the mock value does.
std::chrono::steady_clock::time_point GetSteadyTime();

// Mock time in seconds; 0 returns to the real clock.
void SetMockTime(int64_t seconds);
int64_t GetMockTime();

// Enables mock time for a scope (tests)
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t seconds) : previous_(GetMockTime()) { SetMockTime(seconds); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace peernet
