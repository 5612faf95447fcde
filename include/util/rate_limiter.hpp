// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace peernet {
namespace util {

// RateLimiter - token bucket per log callsite
//
// Remote peers decide how often handshake failures, oversized frames and
// accept errors happen; the *_RL logging macros consult this limiter so a
// flood from one host cannot fill the log. A callsite starts with a full
// bucket of tokens_per_period and regains them linearly over period_seconds.
class RateLimiter {
public:
  // True if the callsite may log now (consumes one token)
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Shared limiter used by the logging macros
  static RateLimiter& instance();

private:
  struct Bucket {
    double tokens;
    std::chrono::steady_clock::time_point refilled_at;
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

}  // namespace util
}  // namespace peernet
