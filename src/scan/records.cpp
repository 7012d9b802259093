// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/records.hpp"

#include "util/string_parsing.hpp"

namespace netsnmp {
namespace scan {

const char* ProtocolName(DiscoveryProtocol protocol) {
  switch (protocol) {
  case DiscoveryProtocol::CDP:
    return "CDP";
  case DiscoveryProtocol::LLDP:
    return "LLDP";
  }
  return "UNKNOWN";
}

std::optional<DiscoveryProtocol> ParseProtocol(std::string_view name) {
  auto lower = util::ToLower(name);
  if (lower == "cdp") {
    return DiscoveryProtocol::CDP;
  }
  if (lower == "lldp") {
    return DiscoveryProtocol::LLDP;
  }
  return std::nullopt;
}

}  // namespace scan
}  // namespace netsnmp
