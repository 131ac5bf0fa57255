// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license
// Per-callsite token bucket used by the *_RL logging macros

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lanscan {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Each callsite key owns a bucket holding up to tokens_per_period tokens.
 * A fresh bucket starts full (burst), refills continuously at
 * tokens_per_period / period_seconds and each logged line costs one token.
 *
 * Used for messages emitted once per probe, where a large subnet would
 * otherwise produce one log line per candidate address.
 */
class RateLimiter {
public:
  using Clock = std::chrono::steady_clock;

  // Returns true if a message at callsite_key may be logged now.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Same as should_log() with an explicit clock reading (tests).
  bool should_log_at(const std::string& callsite_key, int tokens_per_period, int period_seconds,
                     Clock::time_point now);

  // Number of messages dropped since construction or the last Reset().
  size_t suppressed() const;

  // Forget all buckets.
  void Reset();

  // Process-wide instance used by the logging macros.
  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    Clock::time_point last_refill{};
    bool initialized{false};
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
  size_t suppressed_{0};
};

}  // namespace util
}  // namespace lanscan
