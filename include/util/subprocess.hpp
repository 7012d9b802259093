// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace netsnmp {
namespace util {

struct CommandResult {
  bool spawned{false};    // false if the program could not be started
  bool timed_out{false};  // killed after the deadline
  int exit_code{-1};      // valid when spawned && !timed_out
  std::string out;
  std::string err;

  bool ok() const { return spawned && !timed_out && exit_code == 0; }
};

// Run argv[0] (looked up in PATH) with the given arguments, no shell
// involved. stdout and stderr are captured (each capped at MAX_CAPTURE_BYTES).
// The child is killed with SIGKILL if it runs past the deadline.
CommandResult RunCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

// True if program is an executable found in PATH.
bool IsCommandAvailable(const std::string& program);

inline constexpr size_t MAX_CAPTURE_BYTES = 8 * 1024 * 1024;

}  // namespace util
}  // namespace netsnmp
