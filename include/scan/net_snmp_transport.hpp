// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "scan/snmp_transport.hpp"

#include <string>
#include <vector>

namespace netsnmp {
namespace scan {

// NetSnmpTransport - SnmpTransport backed by the net-snmp command line tools.
// Runs snmpget/snmpwalk without a shell, with numeric OID output (-On).
class NetSnmpTransport : public SnmpTransport {
public:
  // Grace period on top of timeout * (retries + 1) before the child is killed
  static constexpr std::chrono::seconds KILL_GRACE{2};

  explicit NetSnmpTransport(std::string get_program = "snmpget", std::string walk_program = "snmpwalk");

  TransportReply Get(const SnmpRequest& request, const std::vector<std::string>& oids) override;
  TransportReply Walk(const SnmpRequest& request, const std::string& root) override;

  // True if both programs are found on PATH
  bool Available() const;

  // Argument vector for a request (exposed for tests)
  static std::vector<std::string> BuildArgs(const std::string& program, const SnmpRequest& request,
                                            const std::vector<std::string>& oids);

private:
  TransportReply Run(const std::vector<std::string>& argv, const SnmpRequest& request);

  std::string get_program_;
  std::string walk_program_;
};

}  // namespace scan
}  // namespace netsnmp
