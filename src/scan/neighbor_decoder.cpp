// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/neighbor_decoder.hpp"

#include "scan/oids.hpp"
#include "scan/snmp_response.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"

#include <map>
#include <optional>
#include <utility>

namespace netsnmp {
namespace scan {

namespace {

using IndexKey = std::pair<uint32_t, uint32_t>;

struct CdpFragments {
  std::optional<std::string> address;
  std::optional<std::string> device_id;
  std::string version;
  std::string platform;
  std::string port;
};

enum class LldpColumn { PORT_ID, SYS_NAME, SYS_DESC };

struct LldpFragments {
  std::optional<std::string> sys_name;
  std::string sys_desc;
  std::string port_id;
  std::string address;
};

std::string OneLine(std::string value) {
  for (char& c : value) {
    if (c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return value;
}

// cdpCacheAddress is an OCTET STRING. net-snmp prints it as Hex-STRING, or
// as STRING when all four bytes happen to be printable.
std::optional<std::string> DecodeCdpAddress(const VarBind& vb) {
  if (vb.type == "IpAddress") {
    if (util::IsValidIPv4(vb.value)) {
      return vb.value;
    }
    return std::nullopt;
  }
  if (vb.type == "STRING" && vb.value.size() == 4) {
    return util::RawBytesToIPv4(vb.value);
  }
  return util::HexToIPv4(vb.value);
}

}  // namespace

NeighborTableDecoder::NeighborTableDecoder(SnmpTransport& transport, int retries)
    : transport_(transport), retries_(retries) {}

const char* NeighborTableDecoder::TableRoot(DiscoveryProtocol protocol) {
  return protocol == DiscoveryProtocol::CDP ? oids::CDP_CACHE_TABLE : oids::LLDP_REM_SYSTEMS_DATA;
}

std::vector<NeighborRecord> NeighborTableDecoder::Decode(const std::string& switch_address,
                                                         const std::string& credential, DiscoveryProtocol protocol,
                                                         std::chrono::seconds timeout, TransportStatus* status) {
  SnmpRequest request{switch_address, credential, timeout, retries_};
  TransportReply reply = transport_.Walk(request, TableRoot(protocol));
  if (status) {
    *status = reply.status;
  }

  if (!reply.ok()) {
    if (reply.status == TransportStatus::ERROR) {
      LOG_SNMP_WARN_RL("{}: {} walk failed: {}", switch_address, ProtocolName(protocol), reply.error);
    } else {
      LOG_SNMP_DEBUG("{}: no response to {} walk", switch_address, ProtocolName(protocol));
    }
    return {};
  }

  auto records = protocol == DiscoveryProtocol::CDP ? DecodeCdp(reply.lines) : DecodeLldp(reply.lines);
  for (auto& record : records) {
    record.source_switch = switch_address;
  }
  LOG_SNMP_DEBUG("{}: {} neighbors via {}", switch_address, records.size(), ProtocolName(protocol));
  return records;
}

std::vector<NeighborRecord> NeighborTableDecoder::DecodeCdp(const std::vector<std::string>& lines) {
  std::map<IndexKey, CdpFragments> entries;

  for (const auto& vb : ParseVarBinds(lines)) {
    if (!vb.HasValue()) {
      continue;
    }
    auto suffix = OidSuffix(vb.oid, oids::CDP_CACHE_ENTRY);
    if (!suffix || suffix->size() != 3) {
      continue;
    }
    const uint32_t column = (*suffix)[0];
    CdpFragments& entry = entries[{(*suffix)[1], (*suffix)[2]}];

    switch (column) {
    case oids::CDP_COL_ADDRESS:
      if (auto address = DecodeCdpAddress(vb)) {
        entry.address = *address;
      } else {
        LOG_SNMP_TRACE("Ignoring undecodable CDP address '{}' at {}", vb.value, vb.oid);
      }
      break;
    case oids::CDP_COL_VERSION:
      entry.version = OneLine(vb.value);
      break;
    case oids::CDP_COL_DEVICE_ID:
      if (!vb.value.empty()) {
        entry.device_id = vb.value;
      }
      break;
    case oids::CDP_COL_DEVICE_PORT:
      entry.port = vb.value;
      break;
    case oids::CDP_COL_PLATFORM:
      entry.platform = OneLine(vb.value);
      break;
    default:
      break;
    }
  }

  const int64_t now = util::GetTime();
  std::vector<NeighborRecord> records;
  for (const auto& [key, entry] : entries) {
    if (!entry.address || !entry.device_id) {
      continue;
    }
    NeighborRecord record;
    record.neighbor_address = *entry.address;
    record.neighbor_hostname = *entry.device_id;
    record.platform = entry.platform.empty() ? entry.version : entry.platform;
    record.local_port = std::to_string(key.first);
    record.remote_port = entry.port;
    record.protocol = DiscoveryProtocol::CDP;
    record.discovered_at = now;
    records.push_back(std::move(record));
  }
  return records;
}

std::vector<NeighborRecord> NeighborTableDecoder::DecodeLldp(const std::vector<std::string>& lines) {
  std::map<IndexKey, LldpFragments> entries;

  for (const auto& vb : ParseVarBinds(lines)) {
    if (!vb.HasValue()) {
      continue;
    }

    // Management address: the address lives in the index, not the value
    if (auto suffix = OidSuffix(vb.oid, oids::LLDP_REM_MAN_ADDR_ENTRY)) {
      const auto& s = *suffix;
      if (s.size() < 4) {
        continue;
      }
      LldpFragments& entry = entries[{s[2], s[3]}];
      if (s.size() == 10 && s[4] == oids::LLDP_MAN_ADDR_IPV4 && s[5] == 4 && s[6] <= 255 && s[7] <= 255 &&
          s[8] <= 255 && s[9] <= 255) {
        entry.address = util::FormatIPv4({static_cast<uint8_t>(s[6]), static_cast<uint8_t>(s[7]),
                                          static_cast<uint8_t>(s[8]), static_cast<uint8_t>(s[9])});
      }
      continue;
    }

    std::optional<std::vector<uint32_t>> suffix;
    LldpColumn column = LldpColumn::PORT_ID;
    if ((suffix = OidSuffix(vb.oid, oids::LLDP_REM_SYS_NAME))) {
      column = LldpColumn::SYS_NAME;
    } else if ((suffix = OidSuffix(vb.oid, oids::LLDP_REM_SYS_DESC))) {
      column = LldpColumn::SYS_DESC;
    } else if ((suffix = OidSuffix(vb.oid, oids::LLDP_REM_PORT_ID))) {
      column = LldpColumn::PORT_ID;
    } else {
      continue;
    }
    if (suffix->size() != 3) {
      continue;
    }

    LldpFragments& entry = entries[{(*suffix)[1], (*suffix)[2]}];
    switch (column) {
    case LldpColumn::SYS_NAME:
      if (!vb.value.empty()) {
        entry.sys_name = vb.value;
      }
      break;
    case LldpColumn::SYS_DESC:
      entry.sys_desc = OneLine(vb.value);
      break;
    case LldpColumn::PORT_ID:
      entry.port_id = vb.IsHex() ? FormatMacAddress(vb.value) : vb.value;
      break;
    }
  }

  const int64_t now = util::GetTime();
  std::vector<NeighborRecord> records;
  for (const auto& [key, entry] : entries) {
    if (!entry.sys_name) {
      continue;
    }
    NeighborRecord record;
    record.neighbor_address = entry.address.empty() ? UNKNOWN_ADDRESS : entry.address;
    record.neighbor_hostname = *entry.sys_name;
    record.platform = entry.sys_desc;
    record.local_port = std::to_string(key.first);
    record.remote_port = entry.port_id;
    record.protocol = DiscoveryProtocol::LLDP;
    record.discovered_at = now;
    records.push_back(std::move(record));
  }
  return records;
}

}  // namespace scan
}  // namespace netsnmp
