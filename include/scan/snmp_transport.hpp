// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 SnmpTransport - abstract interface for SNMPv2c GET and WALK

 The scanner never encodes PDUs itself. A transport takes one logical request
 (address, community, timeout, retries) and returns the agent's answer as raw
 text lines, which scan::ParseVarBinds turns into typed VarBinds.

 Status
 - OK           the agent answered (lines may still carry "no such" markers)
 - NO_RESPONSE  nothing answered within timeout * (retries + 1)
 - ERROR        the request could not be made or the reply was unusable
*/

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace netsnmp {
namespace scan {

enum class TransportStatus : uint8_t {
  OK,
  NO_RESPONSE,
  ERROR,
};

const char* TransportStatusName(TransportStatus status);

struct SnmpRequest {
  static constexpr int DEFAULT_RETRIES = 1;

  std::string address;
  std::string community;
  std::chrono::seconds timeout{2};
  int retries{DEFAULT_RETRIES};
};

struct TransportReply {
  TransportStatus status{TransportStatus::NO_RESPONSE};
  std::vector<std::string> lines;
  std::string error;

  bool ok() const { return status == TransportStatus::OK; }

  static TransportReply Ok(std::vector<std::string> lines) {
    return TransportReply{TransportStatus::OK, std::move(lines), {}};
  }
  static TransportReply NoResponse() { return TransportReply{TransportStatus::NO_RESPONSE, {}, {}}; }
  static TransportReply Error(std::string error) { return TransportReply{TransportStatus::ERROR, {}, std::move(error)}; }
};

class SnmpTransport {
public:
  virtual ~SnmpTransport() = default;

  // One round trip carrying every OID in oids
  virtual TransportReply Get(const SnmpRequest& request, const std::vector<std::string>& oids) = 0;

  // Every VarBind under root, in one walk
  virtual TransportReply Walk(const SnmpRequest& request, const std::string& root) = 0;
};

}  // namespace scan
}  // namespace netsnmp
