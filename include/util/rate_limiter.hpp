// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace netsnmp {
namespace util {

/**
 * RateLimiter - per-callsite throttle for repeated scan warnings
 *
 * A worker that hits the same failure for every address of a range (agent
 * down, snmpget missing, ICMP blocked) would otherwise print one identical
 * line per address. Each callsite (file:line) gets a bucket of `burst`
 * admissions that refills continuously over `period`. Rejected messages are
 * counted so the next admitted one can say how many were dropped, and the
 * CLI can report the total at the end of a batch.
 */
class RateLimiter {
public:
  struct Admission {
    bool allowed{false};
    // Messages dropped at this callsite since the previous admission.
    uint64_t suppressed{0};
  };

  Admission Admit(const std::string& callsite, int burst, std::chrono::seconds period);

  // Messages dropped across all callsites since construction or Reset().
  uint64_t SuppressedTotal() const;

  void Reset();

  static RateLimiter& instance();

private:
  struct Bucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point refilled_at;
    uint64_t dropped{0};
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
  uint64_t suppressed_total_{0};
};

}  // namespace util
}  // namespace netsnmp
