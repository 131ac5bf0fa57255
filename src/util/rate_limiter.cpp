// Copyright (c) 2025 The Lanscan Developers
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace lanscan {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  return should_log_at(callsite_key, tokens_per_period, period_seconds, Clock::now());
}

bool RateLimiter::should_log_at(const std::string& callsite_key, int tokens_per_period, int period_seconds,
                                Clock::time_point now) {
  if (tokens_per_period <= 0 || period_seconds <= 0) {
    return true;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto& bucket = buckets_[callsite_key];
  const double capacity = static_cast<double>(tokens_per_period);

  if (!bucket.initialized) {
    bucket.tokens = capacity;
    bucket.last_refill = now;
    bucket.initialized = true;
  }

  // Continuous refill; time going backwards (mixed clock readings in tests) adds nothing
  if (now > bucket.last_refill) {
    const double elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
    bucket.tokens = std::min(capacity, bucket.tokens + elapsed * capacity / period_seconds);
    bucket.last_refill = now;
  }

  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    return true;
  }

  ++suppressed_;
  return false;
}

size_t RateLimiter::suppressed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suppressed_;
}

void RateLimiter::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
  suppressed_ = 0;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace lanscan
