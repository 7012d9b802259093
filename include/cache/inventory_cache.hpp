// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 InventoryCache - persisted hosts and neighbors

 Purpose
 - Receive discovery results (it is a scan::ResultSink)
 - Persist them as hosts.json and neighbors.json in the cache directory
 - Answer lookups from the CLI without touching the network

 Merge rules
 - Hosts are keyed by address: a known address is updated in place, a new
   one is appended
 - Neighbors are keyed by (source switch, local port, neighbor hostname);
   ClearNeighbors() before a discovery run replaces the table

 Thread-safety: all methods lock an internal mutex; OnHost/OnNeighbor may be
 called from scan workers.
*/

#include "scan/records.hpp"
#include "scan/result_sink.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netsnmp {
namespace cache {

class InventoryCache : public scan::ResultSink {
public:
  static constexpr int CURRENT_VERSION = 1;
  static constexpr const char* HOSTS_FILE = "hosts.json";
  static constexpr const char* NEIGHBORS_FILE = "neighbors.json";

  struct MergeCounts {
    size_t added{0};
    size_t updated{0};
  };

  struct Stats {
    size_t hosts{0};
    size_t hosts_with_serial{0};
    size_t neighbors{0};
    size_t neighbors_without_address{0};
    int64_t hosts_updated_at{0};      // Unix seconds, 0 if never saved
    int64_t neighbors_updated_at{0};
  };

  explicit InventoryCache(std::string cache_dir);

  InventoryCache(const InventoryCache&) = delete;
  InventoryCache& operator=(const InventoryCache&) = delete;

  // Load both files. Missing files are not an error. Returns false if a file
  // exists but cannot be parsed (the in-memory table is left empty).
  bool Load();

  // Write both files atomically
  bool Save();
  bool SaveHosts();
  bool SaveNeighbors();

  // ResultSink
  void OnHost(const scan::HostRecord& host) override;
  void OnNeighbor(const scan::NeighborRecord& neighbor) override;

  MergeCounts MergeHosts(const std::vector<scan::HostRecord>& hosts);

  // Counts accumulated by OnHost/MergeHosts since the last reset
  MergeCounts merge_counts() const;
  void ResetMergeCounts();

  void ClearNeighbors();

  // Host cache exists, is non-empty and younger than ttl_seconds
  bool IsValid(int64_t ttl_seconds) const;

  std::vector<scan::HostRecord> Hosts() const;
  std::vector<scan::NeighborRecord> Neighbors() const;

  // Case-insensitive substring match over every field. Empty pattern matches all.
  std::vector<scan::HostRecord> SearchHosts(const std::string& pattern) const;
  std::vector<scan::NeighborRecord> SearchNeighbors(const std::string& pattern) const;

  std::vector<scan::HostRecord> HostsWithSerial() const;

  // Addresses worth walking for neighbors: hosts that reported a serial
  std::vector<std::string> SwitchCandidates() const;

  // Drop both tables and delete the files
  bool Clear();

  Stats GetStats() const;

  std::string hosts_path() const;
  std::string neighbors_path() const;

private:
  // Must be called with mutex_ held
  void UpsertHostLocked(const scan::HostRecord& host);
  bool SaveHostsLocked();
  bool SaveNeighborsLocked();

  std::string cache_dir_;

  mutable std::mutex mutex_;
  std::vector<scan::HostRecord> hosts_;
  std::unordered_map<std::string, size_t> host_index_;  // address -> position in hosts_
  std::vector<scan::NeighborRecord> neighbors_;
  MergeCounts merge_counts_;
  int64_t hosts_updated_at_{0};
  int64_t neighbors_updated_at_{0};
};

}  // namespace cache
}  // namespace netsnmp
