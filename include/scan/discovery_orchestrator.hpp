// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 DiscoveryOrchestrator - host pass and neighbor pass

 Host pass
 1. Expand every network spec (bad specs are reported, siblings proceed)
 2. In ICMP mode with a liveness probe, keep only addresses that answer
 3. SnmpProbe every candidate, at most scan_workers at a time
 4. Hand each HostRecord to the sink exactly once

 Neighbor pass
 - Per switch: protocols in configured order, credentials in order within
   each protocol; the first non-empty neighbor table wins

 Both passes run on one WorkerPool. A failing host never aborts the batch;
 a batch with no successes is reported (BatchReport::Exhausted), not thrown.
 Only malformed input throws std::invalid_argument, before any task starts.
*/

#include "scan/config.hpp"
#include "scan/liveness_probe.hpp"
#include "scan/result_sink.hpp"
#include "scan/snmp_transport.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace netsnmp {
namespace scan {

struct BatchReport {
  size_t addresses{0};         // expanded from valid specs (host pass) / switches given (neighbor pass)
  size_t alive{0};             // candidates after the liveness pass
  size_t attempted{0};         // probes or decodes run
  size_t succeeded{0};         // hosts found / switches with neighbors
  size_t records{0};           // records handed to the sink
  size_t transport_errors{0};  // TransportStatus::ERROR replies
  size_t peak_in_flight{0};
  bool liveness_used{false};
  std::vector<std::string> rejected_specs;
  std::chrono::milliseconds elapsed{0};

  // Ran to completion and found nothing
  bool Exhausted() const { return succeeded == 0; }
};

class DiscoveryOrchestrator {
public:
  // Throws std::invalid_argument for empty communities, no discovery
  // protocols or scan_workers <= 0. liveness may be null.
  DiscoveryOrchestrator(const ScanConfig& config, SnmpTransport& transport, LivenessProbe* liveness = nullptr);

  DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
  DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

  // Host pass over config().networks
  BatchReport DiscoverHosts(ResultSink& sink);

  // Host pass over specs. Throws std::invalid_argument if specs is empty or
  // none of them parses.
  BatchReport DiscoverHosts(const std::vector<std::string>& specs, ResultSink& sink);

  // Neighbor pass over switch addresses
  BatchReport DiscoverNeighbors(const std::vector<std::string>& switches, ResultSink& sink);

  const ScanConfig& config() const { return config_; }

private:
  // Addresses that answered the liveness probe, in expansion order
  std::vector<std::string> FilterAlive(const std::vector<std::string>& addresses);

  const ScanConfig config_;
  SnmpTransport& transport_;
  LivenessProbe* liveness_;
};

}  // namespace scan
}  // namespace netsnmp
