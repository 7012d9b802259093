// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ScanConfig - immutable scan settings

 Loaded once from a key="value" file and CLI overrides, then passed by const
 reference into the orchestrator. Nothing reads configuration from globals.

 File format
   # comment
   subnets="10.0.0.0/24 10.0.1.20-40"
   communities="public private"
 Values may be double or single quoted. Unknown keys are ignored with a
 warning; a malformed value rejects the whole file.
*/

#include "scan/records.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netsnmp {
namespace scan {

enum class ScanMode : uint8_t {
  ICMP,  // ping first, SNMP only live hosts
  SNMP,  // SNMP every expanded address
};

const char* ScanModeName(ScanMode mode);

struct ScanConfig {
  std::vector<std::string> networks{"192.168.1.0/24"};
  std::vector<std::string> communities{"public"};
  std::chrono::seconds ping_timeout{1};
  std::chrono::seconds snmp_timeout{2};
  int snmp_retries{1};
  int scan_workers{25};
  int64_t cache_ttl{3600};                  // seconds
  std::chrono::milliseconds scan_delay{20}; // pause before each ping, 0 disables
  bool enable_logging{true};                // also log to the log file
  std::vector<DiscoveryProtocol> discovery_protocols{DiscoveryProtocol::CDP, DiscoveryProtocol::LLDP};
  ScanMode scan_mode{ScanMode::ICMP};

  // Check ranges and non-empty lists. On failure error names the field.
  bool Validate(std::string* error = nullptr) const;
};

// Apply one key/value pair. Returns false (with error) for a malformed value.
// Unknown keys set *unknown (if non-null) and return true.
bool ApplyConfigValue(ScanConfig& config, std::string_view key, std::string_view value, std::string* error = nullptr,
                      bool* unknown = nullptr);

// Parse file contents on top of base
std::optional<ScanConfig> ParseConfig(std::string_view contents, const ScanConfig& base = ScanConfig{},
                                      std::string* error = nullptr);

// Load path on top of the defaults. A missing file yields the defaults.
std::optional<ScanConfig> LoadConfigFile(const std::string& path, std::string* error = nullptr);

// Render in the file format (ParseConfig(FormatConfig(c)) == c)
std::string FormatConfig(const ScanConfig& config);

bool SaveConfigFile(const ScanConfig& config, const std::string& path);

}  // namespace scan
}  // namespace netsnmp
