// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/snmp_probe.hpp"

#include "scan/oids.hpp"
#include "scan/snmp_response.hpp"
#include "util/logging.hpp"

namespace netsnmp {
namespace scan {

OidSet OidSet::Default() {
  OidSet set;
  set.hostname_oid = oids::SYS_NAME;
  set.serial_oids = {
      oids::ENT_PHYSICAL_SERIAL_1,
      oids::CISCO_CHASSIS_SERIAL,
      oids::JUNIPER_BOX_SERIAL,
      oids::HP_SERIAL,
  };
  set.description_oid = oids::SYS_DESCR;
  set.mac_oid = oids::IF_PHYS_ADDRESS_1;
  return set;
}

std::vector<std::string> OidSet::Flatten() const {
  std::vector<std::string> out;
  out.reserve(serial_oids.size() + 3);
  out.push_back(hostname_oid);
  out.insert(out.end(), serial_oids.begin(), serial_oids.end());
  if (!description_oid.empty()) {
    out.push_back(description_oid);
  }
  if (!mac_oid.empty()) {
    out.push_back(mac_oid);
  }
  return out;
}

SnmpProbe::SnmpProbe(SnmpTransport& transport, OidSet oids, int retries)
    : transport_(transport), oids_(std::move(oids)), request_oids_(oids_.Flatten()), retries_(retries) {}

std::optional<HostRecord> SnmpProbe::Query(const std::string& address, const std::vector<std::string>& credentials,
                                           std::chrono::seconds timeout) {
  for (size_t i = 0; i < credentials.size(); ++i) {
    if (auto record = QueryOne(address, credentials[i], timeout)) {
      LOG_SNMP_DEBUG("{}: hostname '{}' with credential #{}", address, record->hostname, i + 1);
      return record;
    }
  }
  LOG_SNMP_TRACE("{}: no credential answered", address);
  return std::nullopt;
}

std::optional<HostRecord> SnmpProbe::QueryOne(const std::string& address, const std::string& credential,
                                              std::chrono::seconds timeout) {
  SnmpRequest request{address, credential, timeout, retries_};
  stats_.attempts.fetch_add(1, std::memory_order_relaxed);

  TransportReply reply = transport_.Get(request, request_oids_);
  if (!reply.ok()) {
    NoteFailure(address, reply);
    return std::nullopt;
  }

  auto aligned = AlignToRequest(ParseVarBinds(reply.lines), request_oids_);

  // Positions follow OidSet::Flatten()
  size_t pos = 0;
  const auto& hostname = aligned[pos++];
  if (!hostname || !hostname->HasValue() || hostname->value.empty()) {
    return std::nullopt;
  }

  HostRecord record;
  record.address = address;
  record.hostname = hostname->value;

  bool serial_found = false;
  for (size_t i = 0; i < oids_.serial_oids.size(); ++i, ++pos) {
    const auto& vb = aligned[pos];
    if (!serial_found && vb && vb->HasValue()) {
      record.serial_number = vb->value;
      serial_found = true;
    }
  }

  if (!oids_.description_oid.empty()) {
    const auto& vb = aligned[pos++];
    if (vb && vb->HasValue()) {
      // Multi-line sysDescr is kept on one line
      std::string description = vb->value;
      for (char& c : description) {
        if (c == '\n' || c == '\r') {
          c = ' ';
        }
      }
      record.description = std::move(description);
    }
  }

  if (!oids_.mac_oid.empty()) {
    const auto& vb = aligned[pos++];
    if (vb && vb->HasValue()) {
      record.mac_address = FormatMacAddress(vb->value);
    }
  }

  return record;
}

std::optional<std::string> SnmpProbe::QueryHostname(const std::string& address, const std::string& credential,
                                                    std::chrono::seconds timeout, TransportReply* reply_out) {
  SnmpRequest request{address, credential, timeout, retries_};
  stats_.attempts.fetch_add(1, std::memory_order_relaxed);

  TransportReply reply = transport_.Get(request, {oids_.hostname_oid});
  std::optional<std::string> hostname;
  if (reply.ok()) {
    auto aligned = AlignToRequest(ParseVarBinds(reply.lines), {oids_.hostname_oid});
    if (aligned[0] && aligned[0]->HasValue() && !aligned[0]->value.empty()) {
      hostname = aligned[0]->value;
    }
  } else {
    NoteFailure(address, reply);
  }

  if (reply_out) {
    *reply_out = std::move(reply);
  }
  return hostname;
}

void SnmpProbe::NoteFailure(const std::string& address, const TransportReply& reply) {
  if (reply.status == TransportStatus::NO_RESPONSE) {
    stats_.no_response.fetch_add(1, std::memory_order_relaxed);
    LOG_SNMP_TRACE("{}: no response", address);
  } else {
    stats_.transport_errors.fetch_add(1, std::memory_order_relaxed);
    LOG_SNMP_WARN_RL("{}: transport error: {}", address, reply.error);
  }
}

}  // namespace scan
}  // namespace netsnmp
