// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/net_snmp_transport.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/subprocess.hpp"

#include <algorithm>

namespace netsnmp {
namespace scan {

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  for (auto& line : util::Split(text, '\n')) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!util::Trim(line).empty()) {
      lines.push_back(std::move(line));
    }
  }
  return lines;
}

}  // namespace

NetSnmpTransport::NetSnmpTransport(std::string get_program, std::string walk_program)
    : get_program_(std::move(get_program)), walk_program_(std::move(walk_program)) {}

bool NetSnmpTransport::Available() const {
  return util::IsCommandAvailable(get_program_) && util::IsCommandAvailable(walk_program_);
}

std::vector<std::string> NetSnmpTransport::BuildArgs(const std::string& program, const SnmpRequest& request,
                                                     const std::vector<std::string>& oids) {
  std::vector<std::string> argv = {
      program,
      "-v2c",
      "-c",
      request.community,
      "-On",
      "-t",
      std::to_string(std::max<int64_t>(1, request.timeout.count())),
      "-r",
      std::to_string(std::max(0, request.retries)),
      request.address,
  };
  argv.insert(argv.end(), oids.begin(), oids.end());
  return argv;
}

TransportReply NetSnmpTransport::Get(const SnmpRequest& request, const std::vector<std::string>& oids) {
  if (oids.empty()) {
    return TransportReply::Error("no OIDs requested");
  }
  return Run(BuildArgs(get_program_, request, oids), request);
}

TransportReply NetSnmpTransport::Walk(const SnmpRequest& request, const std::string& root) {
  return Run(BuildArgs(walk_program_, request, {root}), request);
}

TransportReply NetSnmpTransport::Run(const std::vector<std::string>& argv, const SnmpRequest& request) {
  // The tool enforces its own timeout; the deadline only catches a hung child
  auto budget = request.timeout * (std::max(0, request.retries) + 1) + KILL_GRACE;
  auto result = util::RunCommand(argv, std::chrono::duration_cast<std::chrono::milliseconds>(budget));

  if (!result.spawned) {
    return TransportReply::Error("cannot run " + argv.front() + ": " + result.err);
  }
  if (result.timed_out) {
    LOG_SNMP_DEBUG("{} {} killed after {}s", argv.front(), request.address, budget.count());
    return TransportReply::NoResponse();
  }

  std::string err = util::Trim(result.err);
  if (err.find("Timeout") != std::string::npos && err.find("No Response") != std::string::npos) {
    return TransportReply::NoResponse();
  }
  if (result.exit_code != 0) {
    return TransportReply::Error(err.empty() ? argv.front() + " exited with status " + std::to_string(result.exit_code)
                                             : err);
  }
  if (!err.empty()) {
    // MIB loading noise; the reply on stdout is still usable
    LOG_SNMP_TRACE("{} {} stderr: {}", argv.front(), request.address, err);
  }
  return TransportReply::Ok(SplitLines(result.out));
}

}  // namespace scan
}  // namespace netsnmp
