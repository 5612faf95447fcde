// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/bandwidth_limiter.hpp"

#include "util/time.hpp"

#include <algorithm>
#include <cmath>

namespace peernet {
namespace network {

BandwidthLimiter::BandwidthLimiter(uint64_t rate, std::chrono::milliseconds window, uint64_t bucket_size) {
  if (rate == 0 || window.count() <= 0) {
    return;  // Unlimited
  }
  bytes_per_ms_ = static_cast<double>(rate) / static_cast<double>(window.count());
  // Bucket size 0 means one window's worth
  capacity_ = static_cast<double>(bucket_size == 0 ? rate : bucket_size);
  budget_ = capacity_;
  refilled_at_ = util::GetSteadyTime();
}

void BandwidthLimiter::refill(std::chrono::steady_clock::time_point now) {
  if (now <= refilled_at_) {
    return;
  }
  const double elapsed_ms = std::chrono::duration<double, std::milli>(now - refilled_at_).count();
  budget_ = std::min(capacity_, budget_ + elapsed_ms * bytes_per_ms_);
  refilled_at_ = now;
}

std::chrono::milliseconds BandwidthLimiter::Consume(uint64_t bytes) {
  if (!enabled()) {
    return std::chrono::milliseconds{0};
  }
  refill(util::GetSteadyTime());
  budget_ -= static_cast<double>(bytes);
  if (budget_ >= 0.0) {
    return std::chrono::milliseconds{0};
  }
  return std::chrono::milliseconds{static_cast<int64_t>(std::ceil(-budget_ / bytes_per_ms_))};
}

}  // namespace network
}  // namespace peernet
