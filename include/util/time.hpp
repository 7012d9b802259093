// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace netsnmp {
namespace util {

// Unix seconds, or the mock time while one is set. Cache timestamps and TTL
// checks read this clock.
int64_t GetTime();

// Monotonic clock for batch durations and log throttling. While mock time is
// set it advances with the mock value instead of the wall.
std::chrono::steady_clock::time_point GetSteadyTime();

// Milliseconds of GetSteadyTime() elapsed since start.
std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point start);

// 0 disables mocking. Tests only.
void SetMockTime(int64_t time);
int64_t GetMockTime();

// "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

// Compact age for cache listings: "just now", "42s ago", "17m ago",
// "3h 05m ago", "2d 4h ago". Negative ages print as "just now".
std::string FormatAge(int64_t seconds);

class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace netsnmp
