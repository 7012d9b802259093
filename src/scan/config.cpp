// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/config.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

#include <filesystem>
#include <limits>
#include <sstream>

namespace netsnmp {
namespace scan {

namespace {

constexpr int MAX_TIMEOUT_SEC = 300;
constexpr int MAX_RETRIES = 10;
constexpr int MAX_WORKERS = 1024;
constexpr int MAX_SCAN_DELAY_MS = 60000;

bool SetError(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
  return false;
}

std::string Unquote(std::string_view raw) {
  std::string value = util::Trim(raw);
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                            (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

std::optional<bool> ParseBool(std::string_view value) {
  std::string lower = util::ToLower(value);
  if (lower == "true" || lower == "yes" || lower == "1" || lower == "on")
    return true;
  if (lower == "false" || lower == "no" || lower == "0" || lower == "off")
    return false;
  return std::nullopt;
}

std::string Join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += item;
  }
  return out;
}

}  // namespace

const char* ScanModeName(ScanMode mode) {
  return mode == ScanMode::ICMP ? "icmp" : "snmp";
}

bool ScanConfig::Validate(std::string* error) const {
  if (networks.empty()) {
    return SetError(error, "subnets: no networks configured");
  }
  if (communities.empty()) {
    return SetError(error, "communities: no community strings configured");
  }
  if (discovery_protocols.empty()) {
    return SetError(error, "discovery_protocols: no protocols configured");
  }
  if (scan_workers <= 0 || scan_workers > MAX_WORKERS) {
    return SetError(error, "scan_workers must be between 1 and " + std::to_string(MAX_WORKERS));
  }
  if (ping_timeout.count() <= 0 || snmp_timeout.count() <= 0) {
    return SetError(error, "timeouts must be positive");
  }
  if (snmp_retries < 0 || snmp_retries > MAX_RETRIES) {
    return SetError(error, "snmp_retries must be between 0 and " + std::to_string(MAX_RETRIES));
  }
  if (cache_ttl < 0) {
    return SetError(error, "cache_ttl must not be negative");
  }
  return true;
}

bool ApplyConfigValue(ScanConfig& config, std::string_view key, std::string_view raw_value, std::string* error,
                      bool* unknown) {
  const std::string value = Unquote(raw_value);
  const std::string name(key);

  auto parse_int = [&](int min, int max) -> std::optional<int> {
    auto parsed = util::SafeParseInt(value, min, max);
    if (!parsed) {
      SetError(error, name + ": expected an integer in [" + std::to_string(min) + ", " + std::to_string(max) +
                          "], got '" + value + "'");
    }
    return parsed;
  };

  if (key == "subnets" || key == "networks") {
    auto items = util::SplitWhitespace(value);
    if (items.empty()) {
      return SetError(error, name + ": empty");
    }
    config.networks = std::move(items);
  } else if (key == "communities") {
    auto items = util::SplitWhitespace(value);
    if (items.empty()) {
      return SetError(error, name + ": empty");
    }
    config.communities = std::move(items);
  } else if (key == "ping_timeout") {
    auto v = parse_int(1, MAX_TIMEOUT_SEC);
    if (!v)
      return false;
    config.ping_timeout = std::chrono::seconds(*v);
  } else if (key == "snmp_timeout") {
    auto v = parse_int(1, MAX_TIMEOUT_SEC);
    if (!v)
      return false;
    config.snmp_timeout = std::chrono::seconds(*v);
  } else if (key == "snmp_retries") {
    auto v = parse_int(0, MAX_RETRIES);
    if (!v)
      return false;
    config.snmp_retries = *v;
  } else if (key == "scan_workers") {
    auto v = parse_int(1, MAX_WORKERS);
    if (!v)
      return false;
    config.scan_workers = *v;
  } else if (key == "cache_ttl") {
    auto v = parse_int(0, std::numeric_limits<int>::max());
    if (!v)
      return false;
    config.cache_ttl = *v;
  } else if (key == "scan_delay") {
    auto v = parse_int(0, MAX_SCAN_DELAY_MS);
    if (!v)
      return false;
    config.scan_delay = std::chrono::milliseconds(*v);
  } else if (key == "enable_logging") {
    auto v = ParseBool(value);
    if (!v) {
      return SetError(error, name + ": expected true or false, got '" + value + "'");
    }
    config.enable_logging = *v;
  } else if (key == "discovery_protocols") {
    std::vector<DiscoveryProtocol> protocols;
    for (const auto& item : util::SplitWhitespace(value)) {
      auto protocol = ParseProtocol(item);
      if (!protocol) {
        return SetError(error, name + ": unknown protocol '" + item + "'");
      }
      protocols.push_back(*protocol);
    }
    if (protocols.empty()) {
      return SetError(error, name + ": empty");
    }
    config.discovery_protocols = std::move(protocols);
  } else if (key == "scan_mode") {
    std::string mode = util::ToLower(value);
    if (mode == "icmp") {
      config.scan_mode = ScanMode::ICMP;
    } else if (mode == "snmp") {
      config.scan_mode = ScanMode::SNMP;
    } else {
      return SetError(error, name + ": expected icmp or snmp, got '" + value + "'");
    }
  } else if (unknown) {
    *unknown = true;
  }
  return true;
}

std::optional<ScanConfig> ParseConfig(std::string_view contents, const ScanConfig& base, std::string* error) {
  ScanConfig config = base;
  int line_no = 0;

  for (const auto& raw : util::Split(contents, '\n')) {
    ++line_no;
    std::string line = util::Trim(raw);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      SetError(error, "line " + std::to_string(line_no) + ": expected key=\"value\"");
      return std::nullopt;
    }
    std::string key = util::Trim(std::string_view(line).substr(0, eq));
    std::string_view value = std::string_view(line).substr(eq + 1);

    std::string value_error;
    bool unknown = false;
    if (!ApplyConfigValue(config, key, value, &value_error, &unknown)) {
      SetError(error, "line " + std::to_string(line_no) + ": " + value_error);
      return std::nullopt;
    }
    if (unknown) {
      LOG_WARN("Config line {}: ignoring unknown key '{}'", line_no, key);
    }
  }
  return config;
}

std::optional<ScanConfig> LoadConfigFile(const std::string& path, std::string* error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_DEBUG("No config file at {}, using defaults", path);
    return ScanConfig{};
  }

  std::string parse_error;
  auto config = ParseConfig(util::read_file_string(path), ScanConfig{}, &parse_error);
  if (!config) {
    SetError(error, path + ": " + parse_error);
    return std::nullopt;
  }
  LOG_DEBUG("Config loaded from {} (scan mode {})", path, ScanModeName(config->scan_mode));
  return config;
}

std::string FormatConfig(const ScanConfig& config) {
  std::vector<std::string> protocols;
  for (auto protocol : config.discovery_protocols) {
    protocols.push_back(util::ToLower(ProtocolName(protocol)));
  }

  std::ostringstream out;
  out << "# Networks to scan (space-separated: /24 CIDR, A.B.C.start-end ranges, single IPs)\n"
      << "subnets=\"" << Join(config.networks) << "\"\n\n"
      << "# SNMP v2c communities, tried in order\n"
      << "communities=\"" << Join(config.communities) << "\"\n\n"
      << "ping_timeout=\"" << config.ping_timeout.count() << "\"\n\n"
      << "snmp_timeout=\"" << config.snmp_timeout.count() << "\"\n\n"
      << "snmp_retries=\"" << config.snmp_retries << "\"\n\n"
      << "scan_workers=\"" << config.scan_workers << "\"\n\n"
      << "cache_ttl=\"" << config.cache_ttl << "\"\n\n"
      << "# Delay in milliseconds before each ping to reduce network noise (0 to disable)\n"
      << "scan_delay=\"" << config.scan_delay.count() << "\"\n\n"
      << "enable_logging=\"" << (config.enable_logging ? "true" : "false") << "\"\n\n"
      << "# Neighbor discovery protocols, in priority order\n"
      << "discovery_protocols=\"" << Join(protocols) << "\"\n\n"
      << "# Scan strategy: \"icmp\" (ping first) or \"snmp\" (direct SNMP query)\n"
      << "scan_mode=\"" << ScanModeName(config.scan_mode) << "\"\n";
  return out.str();
}

bool SaveConfigFile(const ScanConfig& config, const std::string& path) {
  std::string contents = "# netsnmp configuration\n# Generated on " + util::FormatTime(util::GetTime()) + "\n\n" +
                         FormatConfig(config);
  if (!util::atomic_write_file(path, contents)) {
    LOG_ERROR("Failed to write config file {}", path);
    return false;
  }
  return true;
}

}  // namespace scan
}  // namespace netsnmp
