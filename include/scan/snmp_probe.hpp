// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 SnmpProbe - identity query for one host

 Per credential, exactly one GET carries the whole OidSet:
   [sysName, serial candidates..., sysDescr?, ifPhysAddress?]

 - sysName is mandatory; a missing value or a "no such" marker fails the
   credential and the next one is tried
 - serial is the first candidate answered with a value, even an empty one;
   later candidates are not consulted. No candidate -> "" (still a success)
 - the first credential that yields a hostname wins; later credentials are
   never tried

 Thread-safety: Query may be called concurrently. Stats are atomic.
*/

#include "scan/records.hpp"
#include "scan/snmp_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netsnmp {
namespace scan {

struct OidSet {
  std::string hostname_oid;
  std::vector<std::string> serial_oids;  // priority order
  std::string description_oid;           // empty = not requested
  std::string mac_oid;                   // empty = not requested

  // sysName, vendor serial candidates, sysDescr, ifPhysAddress.1
  static OidSet Default();

  std::vector<std::string> Flatten() const;
};

struct ProbeStats {
  std::atomic<uint64_t> attempts{0};         // GET round trips issued
  std::atomic<uint64_t> no_response{0};      // timed out
  std::atomic<uint64_t> transport_errors{0}; // TransportStatus::ERROR
};

class SnmpProbe {
public:
  explicit SnmpProbe(SnmpTransport& transport, OidSet oids = OidSet::Default(),
                     int retries = SnmpRequest::DEFAULT_RETRIES);

  SnmpProbe(const SnmpProbe&) = delete;
  SnmpProbe& operator=(const SnmpProbe&) = delete;

  // Try credentials in order. std::nullopt means no credential produced a
  // hostname (the expected outcome for most addresses).
  std::optional<HostRecord> Query(const std::string& address, const std::vector<std::string>& credentials,
                                  std::chrono::seconds timeout);

  // Single credential, sysName only. Used by connectivity diagnostics.
  // reply (if non-null) receives the raw transport outcome.
  std::optional<std::string> QueryHostname(const std::string& address, const std::string& credential,
                                           std::chrono::seconds timeout, TransportReply* reply = nullptr);

  const ProbeStats& stats() const { return stats_; }
  const OidSet& oids() const { return oids_; }

private:
  std::optional<HostRecord> QueryOne(const std::string& address, const std::string& credential,
                                     std::chrono::seconds timeout);

  // Record a non-OK reply in stats and the log
  void NoteFailure(const std::string& address, const TransportReply& reply);

  SnmpTransport& transport_;
  const OidSet oids_;
  const std::vector<std::string> request_oids_;
  const int retries_;
  ProbeStats stats_;
};

}  // namespace scan
}  // namespace netsnmp
