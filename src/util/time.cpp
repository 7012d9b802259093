// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace netsnmp {
namespace util {

namespace {

struct MockClock {
  std::mutex mutex;
  int64_t now{0};  // 0: disabled
  // Steady instant that corresponds to `origin` mock seconds
  std::chrono::steady_clock::time_point anchor;
  int64_t origin{0};
};

MockClock& Mock() {
  static MockClock clock;
  return clock;
}

}  // namespace

int64_t GetTime() {
  if (const int64_t mock = GetMockTime(); mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  MockClock& clock = Mock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  if (clock.now == 0) {
    return std::chrono::steady_clock::now();
  }
  return clock.anchor + std::chrono::seconds(clock.now - clock.origin);
}

std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(GetSteadyTime() - start);
}

void SetMockTime(int64_t time) {
  MockClock& clock = Mock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  // Anchor on the transition into mock mode so steady time stays monotonic
  // while a test moves the mock value around.
  if (clock.now == 0 && time != 0) {
    clock.anchor = std::chrono::steady_clock::now();
    clock.origin = time;
  }
  clock.now = time;
}

int64_t GetMockTime() {
  MockClock& clock = Mock();
  std::lock_guard<std::mutex> lock(clock.mutex);
  return clock.now;
}

std::string FormatTime(int64_t unix_time) {
  const std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm utc{};
  if (gmtime_r(&t, &utc) == nullptr) {
    return "@" + std::to_string(unix_time);
  }
  char buf[32];
  const size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &utc);
  return std::string(buf, len);
}

std::string FormatAge(int64_t seconds) {
  constexpr int64_t kMinute = 60;
  constexpr int64_t kHour = 60 * kMinute;
  constexpr int64_t kDay = 24 * kHour;

  if (seconds < 5) {
    return "just now";
  }
  std::ostringstream oss;
  if (seconds < kMinute) {
    oss << seconds << "s";
  } else if (seconds < kHour) {
    oss << seconds / kMinute << "m";
  } else if (seconds < kDay) {
    oss << seconds / kHour << "h " << std::setfill('0') << std::setw(2) << (seconds % kHour) / kMinute << "m";
  } else {
    oss << seconds / kDay << "d " << (seconds % kDay) / kHour << "h";
  }
  oss << " ago";
  return oss.str();
}

}  // namespace util
}  // namespace netsnmp
