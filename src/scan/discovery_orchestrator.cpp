// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/discovery_orchestrator.hpp"

#include "scan/address_range.hpp"
#include "scan/neighbor_decoder.hpp"
#include "scan/snmp_probe.hpp"
#include "scan/worker_pool.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

namespace netsnmp {
namespace scan {

DiscoveryOrchestrator::DiscoveryOrchestrator(const ScanConfig& config, SnmpTransport& transport,
                                             LivenessProbe* liveness)
    : config_(config), transport_(transport), liveness_(liveness) {
  if (config_.communities.empty()) {
    throw std::invalid_argument("no SNMP communities configured");
  }
  if (config_.scan_workers <= 0) {
    throw std::invalid_argument("scan_workers must be positive, got " + std::to_string(config_.scan_workers));
  }
  if (config_.discovery_protocols.empty()) {
    throw std::invalid_argument("no discovery protocols configured");
  }
}

BatchReport DiscoveryOrchestrator::DiscoverHosts(ResultSink& sink) {
  return DiscoverHosts(config_.networks, sink);
}

BatchReport DiscoveryOrchestrator::DiscoverHosts(const std::vector<std::string>& specs, ResultSink& sink) {
  if (specs.empty()) {
    throw std::invalid_argument("no network specs given");
  }

  const auto start = util::GetSteadyTime();
  BatchReport report;

  std::vector<std::string> addresses = ExpandAll(specs, &report.rejected_specs);
  if (report.rejected_specs.size() == specs.size()) {
    throw std::invalid_argument("none of the " + std::to_string(specs.size()) + " network specs is valid");
  }
  report.addresses = addresses.size();

  std::vector<std::string> candidates;
  if (config_.scan_mode == ScanMode::ICMP && liveness_ != nullptr) {
    LOG_SCAN_INFO("Checking {} addresses for liveness", addresses.size());
    candidates = FilterAlive(addresses);
    report.liveness_used = true;
  } else {
    if (config_.scan_mode == ScanMode::ICMP) {
      LOG_SCAN_INFO("No liveness probe available, querying all {} addresses over SNMP", addresses.size());
    }
    candidates = std::move(addresses);
  }
  report.alive = candidates.size();

  LOG_SCAN_INFO("Querying {} candidates over SNMP ({} workers, {} communities)", candidates.size(),
                config_.scan_workers, config_.communities.size());

  SnmpProbe probe(transport_, OidSet::Default(), config_.snmp_retries);
  std::atomic<size_t> succeeded{0};
  {
    WorkerPool pool(static_cast<size_t>(config_.scan_workers));
    for (const auto& address : candidates) {
      pool.Post([this, &probe, &sink, &succeeded, address]() {
        auto record = probe.Query(address, config_.communities, config_.snmp_timeout);
        if (record) {
          sink.OnHost(*record);
          succeeded.fetch_add(1, std::memory_order_relaxed);
        }
      });
    }
    pool.Wait();
    report.peak_in_flight = pool.peak_in_flight();
  }

  report.attempted = candidates.size();
  report.succeeded = succeeded.load();
  report.records = report.succeeded;
  report.transport_errors = probe.stats().transport_errors.load();
  report.elapsed = util::ElapsedSince(start);

  LOG_SCAN_INFO("Host discovery: {} of {} candidates answered in {} ms ({} transport errors)", report.succeeded,
                report.attempted, report.elapsed.count(), report.transport_errors);
  return report;
}

std::vector<std::string> DiscoveryOrchestrator::FilterAlive(const std::vector<std::string>& addresses) {
  // One slot per address; each task writes only its own slot
  std::vector<uint8_t> alive(addresses.size(), 0);
  const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.ping_timeout);

  {
    WorkerPool pool(static_cast<size_t>(config_.scan_workers));
    for (size_t i = 0; i < addresses.size(); ++i) {
      pool.Post([this, &alive, &addresses, timeout, i]() {
        if (config_.scan_delay.count() > 0) {
          std::this_thread::sleep_for(config_.scan_delay);
        }
        alive[i] = liveness_->IsAlive(addresses[i], timeout) ? 1 : 0;
      });
    }
    pool.Wait();
  }

  std::vector<std::string> live;
  for (size_t i = 0; i < addresses.size(); ++i) {
    if (alive[i]) {
      live.push_back(addresses[i]);
    }
  }
  LOG_SCAN_INFO("{} of {} addresses answered ICMP", live.size(), addresses.size());
  return live;
}

BatchReport DiscoveryOrchestrator::DiscoverNeighbors(const std::vector<std::string>& switches, ResultSink& sink) {
  const auto start = util::GetSteadyTime();
  BatchReport report;
  report.addresses = switches.size();
  report.alive = switches.size();

  NeighborTableDecoder decoder(transport_, config_.snmp_retries);
  std::atomic<size_t> succeeded{0};
  std::atomic<size_t> records{0};
  std::atomic<size_t> transport_errors{0};

  {
    WorkerPool pool(static_cast<size_t>(config_.scan_workers));
    for (const auto& address : switches) {
      pool.Post([this, &decoder, &sink, &succeeded, &records, &transport_errors, address]() {
        for (DiscoveryProtocol protocol : config_.discovery_protocols) {
          for (const auto& community : config_.communities) {
            TransportStatus status = TransportStatus::OK;
            auto neighbors = decoder.Decode(address, community, protocol, config_.snmp_timeout, &status);
            if (status == TransportStatus::ERROR) {
              transport_errors.fetch_add(1, std::memory_order_relaxed);
            }
            if (neighbors.empty()) {
              continue;
            }

            const int64_t now = util::GetTime();
            for (auto& neighbor : neighbors) {
              neighbor.source_switch = address;
              neighbor.protocol = protocol;
              neighbor.discovered_at = now;
              sink.OnNeighbor(neighbor);
            }
            records.fetch_add(neighbors.size(), std::memory_order_relaxed);
            succeeded.fetch_add(1, std::memory_order_relaxed);
            LOG_SCAN_INFO("{}: {} neighbors via {}", address, neighbors.size(), ProtocolName(protocol));
            return;
          }
        }
        LOG_SCAN_DEBUG("{}: no neighbor data", address);
      });
    }
    pool.Wait();
    report.peak_in_flight = pool.peak_in_flight();
  }

  report.attempted = switches.size();
  report.succeeded = succeeded.load();
  report.records = records.load();
  report.transport_errors = transport_errors.load();
  report.elapsed = util::ElapsedSince(start);

  LOG_SCAN_INFO("Neighbor discovery: {} of {} switches reported {} neighbors in {} ms", report.succeeded,
                report.attempted, report.records, report.elapsed.count());
  return report;
}

}  // namespace scan
}  // namespace netsnmp
