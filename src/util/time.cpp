// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <mutex>
#include <optional>
#include <utility>

namespace peernet {
namespace util {

namespace {

// Mock clock: the first mocked value is pinned to the real steady time at
// that moment, later values are offsets from it.
struct MockClock {
  std::mutex mutex;
  int64_t seconds{0};
  std::optional<std::pair<int64_t, std::chrono::steady_clock::time_point>> anchor;
};

MockClock& Clock() {
  static MockClock clock;
  return clock;
}

}  // namespace

std::chrono::steady_clock::time_point GetSteadyTime() {
  auto& clock = Clock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  if (clock.seconds == 0)
    return std::chrono::steady_clock::now();

  if (!clock.anchor)
    clock.anchor.emplace(clock.seconds, std::chrono::steady_clock::now());
  return clock.anchor->second + std::chrono::seconds(clock.seconds - clock.anchor->first);
}

void SetMockTime(int64_t seconds) {
  auto& clock = Clock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  clock.seconds = seconds;
  if (seconds == 0)
    clock.anchor.reset();
}

int64_t GetMockTime() {
  auto& clock = Clock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  return clock.seconds;
}

}  // namespace util
}  // namespace peernet
