// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace peernet {
namespace network {

// BandwidthLimiter - byte budget for one direction of one connection
//
// rate bytes are credited per window, accumulating up to bucket_size bytes
// (the burst a quiet connection may send at once). Consume() debits a
// completed transfer and returns how long the caller waits before starting
// the next one. Frames are never split: a frame larger than the remaining
// budget still goes through and the debt is paid off by the following wait,
// so the long-run rate stays at rate/window.
//
// rate == 0 disables limiting. Not thread-safe; owned by a connection strand.
class BandwidthLimiter {
public:
  BandwidthLimiter(uint64_t rate, std::chrono::milliseconds window, uint64_t bucket_size);

  bool enabled() const { return bytes_per_ms_ > 0.0; }

  std::chrono::milliseconds Consume(uint64_t bytes);

  // Current budget; negative while in debt
  double budget() const { return budget_; }

private:
  void refill(std::chrono::steady_clock::time_point now);

  double bytes_per_ms_{0.0};
  double capacity_{0.0};
  double budget_{0.0};
  std::chrono::steady_clock::time_point refilled_at_;
};

}  // namespace network
}  // namespace peernet
