// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 NeighborTableDecoder - CDP/LLDP neighbor tables into NeighborRecords

 One walk per (switch, credential, protocol). The walk returns one VarBind per
 table cell; cells are grouped by the index in their OID and each group that
 carries enough columns becomes one record.

 CDP (cdpCacheEntry, 1.3.6.1.4.1.9.9.23.1.2.1.1)
   suffix = column.ifIndex.deviceIndex
   4 address (hex IPv4)   5 version   6 device-id   7 device port   8 platform
   Emitted when address and device-id are both present. Platform wins over
   version.

 LLDP (lldpRemoteSystemsData, 1.0.8802.1.1.2.1.4)
   lldpRemTable columns 7 port id, 9 system name, 10 system description,
   suffix = timeMark.localPort.index
   lldpRemManAddrEntry, suffix = column.timeMark.localPort.index.subtype.len.addr
   Emitted when the system name is present. The management address is taken
   from the index tail when it is IPv4 (subtype 1, length 4), else "unknown".

 Record order is unspecified.
*/

#include "scan/records.hpp"
#include "scan/snmp_transport.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace netsnmp {
namespace scan {

class NeighborTableDecoder {
public:
  explicit NeighborTableDecoder(SnmpTransport& transport, int retries = SnmpRequest::DEFAULT_RETRIES);

  // Walk the table for protocol on switch_address. Empty result means no
  // neighbors (or no answer); status (if non-null) tells which.
  std::vector<NeighborRecord> Decode(const std::string& switch_address, const std::string& credential,
                                     DiscoveryProtocol protocol, std::chrono::seconds timeout,
                                     TransportStatus* status = nullptr);

  // Pure decoders over raw walk output. source_switch is left empty.
  static std::vector<NeighborRecord> DecodeCdp(const std::vector<std::string>& lines);
  static std::vector<NeighborRecord> DecodeLldp(const std::vector<std::string>& lines);

  // Walk root for a protocol
  static const char* TableRoot(DiscoveryProtocol protocol);

private:
  SnmpTransport& transport_;
  const int retries_;
};

}  // namespace scan
}  // namespace netsnmp
