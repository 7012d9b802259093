// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include "util/time.hpp"

#include <algorithm>

namespace netsnmp {
namespace util {

RateLimiter::Admission RateLimiter::Admit(const std::string& callsite, int burst, std::chrono::seconds period) {
  if (burst <= 0 || period.count() <= 0) {
    return {true, 0};
  }

  const auto now = GetSteadyTime();
  const double capacity = static_cast<double>(burst);

  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = buckets_.try_emplace(callsite);
  Bucket& bucket = it->second;
  if (inserted) {
    bucket.tokens = capacity;
    bucket.refilled_at = now;
  } else if (now > bucket.refilled_at) {
    const std::chrono::duration<double> elapsed = now - bucket.refilled_at;
    const double per_second = capacity / static_cast<double>(period.count());
    bucket.tokens = std::min(capacity, bucket.tokens + elapsed.count() * per_second);
    bucket.refilled_at = now;
  }

  if (bucket.tokens < 1.0) {
    ++bucket.dropped;
    ++suppressed_total_;
    return {false, 0};
  }

  bucket.tokens -= 1.0;
  Admission admission{true, bucket.dropped};
  bucket.dropped = 0;
  return admission;
}

uint64_t RateLimiter::SuppressedTotal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suppressed_total_;
}

void RateLimiter::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.clear();
  suppressed_total_ = 0;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter limiter;
  return limiter;
}

}  // namespace util
}  // namespace netsnmp
