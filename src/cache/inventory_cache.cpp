// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cache/inventory_cache.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace netsnmp {
namespace cache {

using scan::HostRecord;
using scan::NeighborRecord;

namespace {

json HostToJson(const HostRecord& host) {
  return {{"address", host.address},
          {"hostname", host.hostname},
          {"serial_number", host.serial_number},
          {"mac_address", host.mac_address},
          {"description", host.description}};
}

HostRecord HostFromJson(const json& j) {
  HostRecord host;
  host.address = j.value("address", "");
  host.hostname = j.value("hostname", "");
  host.serial_number = j.value("serial_number", "");
  host.mac_address = j.value("mac_address", "");
  host.description = j.value("description", "");
  return host;
}

json NeighborToJson(const NeighborRecord& n) {
  return {{"neighbor_address", n.neighbor_address},
          {"neighbor_hostname", n.neighbor_hostname},
          {"platform", n.platform},
          {"local_port", n.local_port},
          {"remote_port", n.remote_port},
          {"source_switch", n.source_switch},
          {"protocol", scan::ProtocolName(n.protocol)},
          {"discovered_at", n.discovered_at}};
}

NeighborRecord NeighborFromJson(const json& j) {
  NeighborRecord n;
  n.neighbor_address = j.value("neighbor_address", std::string(scan::UNKNOWN_ADDRESS));
  n.neighbor_hostname = j.value("neighbor_hostname", "");
  n.platform = j.value("platform", "");
  n.local_port = j.value("local_port", "");
  n.remote_port = j.value("remote_port", "");
  n.source_switch = j.value("source_switch", "");
  n.protocol = scan::ParseProtocol(j.value("protocol", "CDP")).value_or(scan::DiscoveryProtocol::CDP);
  n.discovered_at = j.value("discovered_at", int64_t(0));
  return n;
}

bool SameNeighbor(const NeighborRecord& a, const NeighborRecord& b) {
  return a.source_switch == b.source_switch && a.local_port == b.local_port &&
         a.neighbor_hostname == b.neighbor_hostname;
}

bool HostMatches(const HostRecord& h, const std::string& pattern) {
  return util::ContainsIgnoreCase(h.address, pattern) || util::ContainsIgnoreCase(h.hostname, pattern) ||
         util::ContainsIgnoreCase(h.serial_number, pattern) || util::ContainsIgnoreCase(h.mac_address, pattern) ||
         util::ContainsIgnoreCase(h.description, pattern);
}

bool NeighborMatches(const NeighborRecord& n, const std::string& pattern) {
  return util::ContainsIgnoreCase(n.neighbor_address, pattern) ||
         util::ContainsIgnoreCase(n.neighbor_hostname, pattern) || util::ContainsIgnoreCase(n.platform, pattern) ||
         util::ContainsIgnoreCase(n.local_port, pattern) || util::ContainsIgnoreCase(n.remote_port, pattern) ||
         util::ContainsIgnoreCase(n.source_switch, pattern) ||
         util::ContainsIgnoreCase(scan::ProtocolName(n.protocol), pattern);
}

// Parse a cache file. nullopt = present but unusable; a missing file is an
// empty object.
std::optional<json> ReadCacheFile(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_CACHE_DEBUG("No cache file at {}", path);
    return json::object();
  }
  try {
    return json::parse(util::read_file_string(path));
  } catch (const json::exception& e) {
    LOG_CACHE_ERROR("Failed to parse {}: {}", path, e.what());
    return std::nullopt;
  }
}

}  // namespace

InventoryCache::InventoryCache(std::string cache_dir) : cache_dir_(std::move(cache_dir)) {}

std::string InventoryCache::hosts_path() const {
  return (std::filesystem::path(cache_dir_) / HOSTS_FILE).string();
}

std::string InventoryCache::neighbors_path() const {
  return (std::filesystem::path(cache_dir_) / NEIGHBORS_FILE).string();
}

bool InventoryCache::Load() {
  std::lock_guard<std::mutex> lock(mutex_);
  hosts_.clear();
  host_index_.clear();
  neighbors_.clear();
  hosts_updated_at_ = 0;
  neighbors_updated_at_ = 0;

  bool ok = true;

  if (auto j = ReadCacheFile(hosts_path())) {
    try {
      hosts_updated_at_ = j->value("updated_at", int64_t(0));
      if (j->contains("hosts")) {
        for (const auto& entry : j->at("hosts")) {
          HostRecord host = HostFromJson(entry);
          if (host.address.empty() || host.hostname.empty()) {
            continue;
          }
          UpsertHostLocked(host);
        }
      }
    } catch (const json::exception& e) {
      LOG_CACHE_ERROR("Malformed host cache {}: {}", hosts_path(), e.what());
      hosts_.clear();
      host_index_.clear();
      ok = false;
    }
  } else {
    ok = false;
  }

  if (auto j = ReadCacheFile(neighbors_path())) {
    try {
      neighbors_updated_at_ = j->value("updated_at", int64_t(0));
      if (j->contains("neighbors")) {
        for (const auto& entry : j->at("neighbors")) {
          neighbors_.push_back(NeighborFromJson(entry));
        }
      }
    } catch (const json::exception& e) {
      LOG_CACHE_ERROR("Malformed neighbor cache {}: {}", neighbors_path(), e.what());
      neighbors_.clear();
      ok = false;
    }
  } else {
    ok = false;
  }

  merge_counts_ = {};
  LOG_CACHE_DEBUG("Loaded {} hosts and {} neighbors from {}", hosts_.size(), neighbors_.size(), cache_dir_);
  return ok;
}

bool InventoryCache::Save() {
  std::lock_guard<std::mutex> lock(mutex_);
  bool hosts_ok = SaveHostsLocked();
  bool neighbors_ok = SaveNeighborsLocked();
  return hosts_ok && neighbors_ok;
}

bool InventoryCache::SaveHosts() {
  std::lock_guard<std::mutex> lock(mutex_);
  return SaveHostsLocked();
}

bool InventoryCache::SaveNeighbors() {
  std::lock_guard<std::mutex> lock(mutex_);
  return SaveNeighborsLocked();
}

bool InventoryCache::SaveHostsLocked() {
  try {
    const int64_t now = util::GetTime();
    json j;
    j["version"] = CURRENT_VERSION;
    j["updated_at"] = now;
    j["hosts"] = json::array();
    for (const auto& host : hosts_) {
      j["hosts"].push_back(HostToJson(host));
    }

    if (!util::atomic_write_file(hosts_path(), j.dump(2))) {
      LOG_CACHE_ERROR("Failed to save {}", hosts_path());
      return false;
    }
    hosts_updated_at_ = now;
    LOG_CACHE_DEBUG("Saved {} hosts to {}", hosts_.size(), hosts_path());
    return true;
  } catch (const std::exception& e) {
    LOG_CACHE_ERROR("Failed to save {}: {}", hosts_path(), e.what());
    return false;
  }
}

bool InventoryCache::SaveNeighborsLocked() {
  try {
    const int64_t now = util::GetTime();
    json j;
    j["version"] = CURRENT_VERSION;
    j["updated_at"] = now;
    j["neighbors"] = json::array();
    for (const auto& neighbor : neighbors_) {
      j["neighbors"].push_back(NeighborToJson(neighbor));
    }

    if (!util::atomic_write_file(neighbors_path(), j.dump(2))) {
      LOG_CACHE_ERROR("Failed to save {}", neighbors_path());
      return false;
    }
    neighbors_updated_at_ = now;
    LOG_CACHE_DEBUG("Saved {} neighbors to {}", neighbors_.size(), neighbors_path());
    return true;
  } catch (const std::exception& e) {
    LOG_CACHE_ERROR("Failed to save {}: {}", neighbors_path(), e.what());
    return false;
  }
}

void InventoryCache::UpsertHostLocked(const HostRecord& host) {
  auto it = host_index_.find(host.address);
  if (it != host_index_.end()) {
    hosts_[it->second] = host;
    ++merge_counts_.updated;
    return;
  }
  host_index_.emplace(host.address, hosts_.size());
  hosts_.push_back(host);
  ++merge_counts_.added;
}

void InventoryCache::OnHost(const HostRecord& host) {
  std::lock_guard<std::mutex> lock(mutex_);
  UpsertHostLocked(host);
}

void InventoryCache::OnNeighbor(const NeighborRecord& neighbor) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& existing : neighbors_) {
    if (SameNeighbor(existing, neighbor)) {
      existing = neighbor;
      return;
    }
  }
  neighbors_.push_back(neighbor);
}

InventoryCache::MergeCounts InventoryCache::MergeHosts(const std::vector<HostRecord>& hosts) {
  std::lock_guard<std::mutex> lock(mutex_);
  MergeCounts before = merge_counts_;
  for (const auto& host : hosts) {
    UpsertHostLocked(host);
  }
  return MergeCounts{merge_counts_.added - before.added, merge_counts_.updated - before.updated};
}

InventoryCache::MergeCounts InventoryCache::merge_counts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return merge_counts_;
}

void InventoryCache::ResetMergeCounts() {
  std::lock_guard<std::mutex> lock(mutex_);
  merge_counts_ = {};
}

void InventoryCache::ClearNeighbors() {
  std::lock_guard<std::mutex> lock(mutex_);
  neighbors_.clear();
}

bool InventoryCache::IsValid(int64_t ttl_seconds) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (hosts_.empty() || hosts_updated_at_ == 0) {
    return false;
  }
  return util::GetTime() - hosts_updated_at_ < ttl_seconds;
}

std::vector<HostRecord> InventoryCache::Hosts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hosts_;
}

std::vector<NeighborRecord> InventoryCache::Neighbors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return neighbors_;
}

std::vector<HostRecord> InventoryCache::SearchHosts(const std::string& pattern) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<HostRecord> out;
  for (const auto& host : hosts_) {
    if (pattern.empty() || HostMatches(host, pattern)) {
      out.push_back(host);
    }
  }
  return out;
}

std::vector<NeighborRecord> InventoryCache::SearchNeighbors(const std::string& pattern) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<NeighborRecord> out;
  for (const auto& neighbor : neighbors_) {
    if (pattern.empty() || NeighborMatches(neighbor, pattern)) {
      out.push_back(neighbor);
    }
  }
  return out;
}

std::vector<HostRecord> InventoryCache::HostsWithSerial() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<HostRecord> out;
  for (const auto& host : hosts_) {
    if (host.HasSerial()) {
      out.push_back(host);
    }
  }
  return out;
}

std::vector<std::string> InventoryCache::SwitchCandidates() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto& host : hosts_) {
    if (host.HasSerial()) {
      out.push_back(host.address);
    }
  }
  return out;
}

bool InventoryCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  hosts_.clear();
  host_index_.clear();
  neighbors_.clear();
  merge_counts_ = {};
  hosts_updated_at_ = 0;
  neighbors_updated_at_ = 0;

  bool ok = true;
  for (const auto& path : {hosts_path(), neighbors_path()}) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
      LOG_CACHE_ERROR("Failed to remove {}: {}", path, ec.message());
      ok = false;
    }
  }
  LOG_CACHE_INFO("Cache cleared ({})", cache_dir_);
  return ok;
}

InventoryCache::Stats InventoryCache::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Stats stats;
  stats.hosts = hosts_.size();
  stats.neighbors = neighbors_.size();
  for (const auto& host : hosts_) {
    if (host.HasSerial()) {
      ++stats.hosts_with_serial;
    }
  }
  for (const auto& neighbor : neighbors_) {
    if (!neighbor.HasAddress()) {
      ++stats.neighbors_without_address;
    }
  }
  stats.hosts_updated_at = hosts_updated_at_;
  stats.neighbors_updated_at = neighbors_updated_at_;
  return stats;
}

}  // namespace cache
}  // namespace netsnmp
