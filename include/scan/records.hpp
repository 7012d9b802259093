// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace netsnmp {
namespace scan {

// Neighbor address sentinel: the protocol table describes the neighbor but
// exposes no management address for it. Not a parse failure.
inline constexpr const char* UNKNOWN_ADDRESS = "unknown";

enum class DiscoveryProtocol : uint8_t {
  CDP,
  LLDP,
};

const char* ProtocolName(DiscoveryProtocol protocol);

// Case-insensitive ("cdp", "LLDP")
std::optional<DiscoveryProtocol> ParseProtocol(std::string_view name);

// Identity of one SNMP-speaking host. A record only exists for a successful
// probe, so hostname is never empty. serial_number == "" means no serial OID
// answered, which is still a success.
struct HostRecord {
  std::string address;
  std::string hostname;
  std::string serial_number;
  std::string mac_address;
  std::string description;

  bool HasSerial() const { return !serial_number.empty(); }
  bool operator==(const HostRecord&) const = default;
};

// One row of a switch's CDP/LLDP neighbor table
struct NeighborRecord {
  std::string neighbor_address;   // dotted quad or UNKNOWN_ADDRESS
  std::string neighbor_hostname;  // CDP device-id / LLDP system name
  std::string platform;           // CDP platform (or version) / LLDP system description
  std::string local_port;         // switch side: CDP ifIndex / LLDP local port number
  std::string remote_port;        // neighbor side port label
  std::string source_switch;      // address of the switch whose table was walked
  DiscoveryProtocol protocol{DiscoveryProtocol::CDP};
  int64_t discovered_at{0};       // Unix seconds

  bool HasAddress() const { return neighbor_address != UNKNOWN_ADDRESS; }
  bool operator==(const NeighborRecord&) const = default;
};

}  // namespace scan
}  // namespace netsnmp
