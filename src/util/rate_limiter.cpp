// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include "util/time.hpp"

#include <algorithm>

namespace peernet {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  if (tokens_per_period <= 0)
    return false;

  const auto now = GetSteadyTime();
  const double capacity = static_cast<double>(tokens_per_period);

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(callsite_key, Bucket{capacity, now});
  Bucket& bucket = it->second;

  if (!inserted && now > bucket.refilled_at) {
    const double elapsed = std::chrono::duration<double>(now - bucket.refilled_at).count();
    const double per_second = period_seconds > 0 ? capacity / period_seconds : capacity;
    bucket.tokens = std::min(capacity, bucket.tokens + elapsed * per_second);
    bucket.refilled_at = now;
  }

  if (bucket.tokens < 1.0)
    return false;
  bucket.tokens -= 1.0;
  return true;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace peernet
