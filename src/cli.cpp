// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cache/inventory_cache.hpp"
#include "scan/config.hpp"
#include "scan/discovery_orchestrator.hpp"
#include "scan/liveness_probe.hpp"
#include "scan/net_snmp_transport.hpp"
#include "scan/snmp_probe.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace netsnmp;

namespace {

enum class Command {
  SEARCH,
  UPDATE,
  DISCOVER_APS,
  TEST_SNMP,
  APS,
  SERIALS,
  INFO,
  CLEAR,
  CONFIG,
  INIT_CONFIG,
};

void PrintUsage(const char *program_name) {
  std::cout
      << GetFullVersionString() << "\n\n"
      << "Usage: " << program_name << " [command] [options] [pattern]\n\n"
      << "Commands:\n"
      << "  --update                     Scan configured networks and update the cache\n"
      << "  --discover-aps               Walk CDP/LLDP tables of cached switches\n"
      << "  search [pattern]             Search cached devices (default command)\n"
      << "\n"
      << "Cache & Information:\n"
      << "  -i, --info                   Show cache statistics and status\n"
      << "  -c, --clear                  Clear all discovery caches\n"
      << "  --aps [pattern]              Show discovered neighbors\n"
      << "  --serials [pattern]          Show devices with a serial number\n"
      << "\n"
      << "Configuration:\n"
      << "  --config                     Show the effective configuration\n"
      << "  --init-config                Write the effective configuration to the config file\n"
      << "  -S, --networks \"...\"         Override networks for this run\n"
      << "  -C, --communities \"...\"      Override SNMP communities for this run\n"
      << "\n"
      << "Debugging:\n"
      << "  -v, --verbose                Verbose output\n"
      << "  -vv, --debug                 Debug output\n"
      << "  --test-snmp <IP>             Test SNMP connectivity to one device\n"
      << "\n"
      << "  --version                    Show version information\n"
      << "  -h, --help                   Show this help message\n\n"
      << "Examples:\n"
      << "  sudo " << program_name << " --update\n"
      << "  sudo " << program_name << " --discover-aps\n"
      << "  " << program_name << " switch-core-01\n"
      << "  " << program_name << " --aps cisco\n"
      << std::endl;
}

void PrintHosts(const std::vector<scan::HostRecord> &hosts) {
  std::printf("%-16s %-32s %-20s %s\n", "IP ADDRESS", "HOSTNAME", "SERIAL NUMBER", "MAC ADDRESS");
  std::printf("%-16s %-32s %-20s %s\n", "----------------", "--------------------------------",
              "--------------------", "-----------------");
  for (const auto &host : hosts) {
    std::printf("%-16s %-32s %-20s %s\n", host.address.c_str(), host.hostname.c_str(),
                host.serial_number.empty() ? "-" : host.serial_number.c_str(),
                host.mac_address.empty() ? "-" : host.mac_address.c_str());
  }
}

void PrintNeighbors(const std::vector<scan::NeighborRecord> &neighbors) {
  std::printf("%-16s %-28s %-16s %-6s %-18s %-5s %s\n", "ADDRESS", "NAME", "SWITCH", "IFIDX", "REMOTE PORT",
              "PROTO", "PLATFORM");
  for (const auto &n : neighbors) {
    std::printf("%-16s %-28s %-16s %-6s %-18s %-5s %s\n", n.neighbor_address.c_str(), n.neighbor_hostname.c_str(),
                n.source_switch.c_str(), n.local_port.c_str(), n.remote_port.c_str(), scan::ProtocolName(n.protocol),
                n.platform.c_str());
  }
}

void PrintTroubleshooting(const scan::ScanConfig &config) {
  std::cerr << "\nNo SNMP devices answered. Things to check:\n"
            << "  - Connectivity: can you ping an address from " << config.networks.front() << "?\n"
            << "  - Credentials: are the communities (" << config.communities.size()
            << " configured) correct? Try --test-snmp <IP>\n"
            << "  - Firewall: is UDP/161 allowed between this host and the devices?\n"
            << "  - ICMP: if ping is blocked, set scan_mode=\"snmp\" in the config file\n";
}

int RunUpdate(const scan::ScanConfig &config, cache::InventoryCache &inventory) {
  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Error: invalid configuration: " << error << "\n";
    return 1;
  }

  scan::NetSnmpTransport transport;
  if (!transport.Available()) {
    std::cerr << "Error: snmpget/snmpwalk not found in PATH. Install the net-snmp tools.\n";
    return 1;
  }

  std::unique_ptr<scan::IcmpLivenessProbe> liveness;
  if (config.scan_mode == scan::ScanMode::ICMP) {
    liveness = scan::IcmpLivenessProbe::Create();
    if (!liveness) {
      std::cerr << "Warning: ICMP needs root or CAP_NET_RAW; querying every address over SNMP\n";
    }
  }

  scan::DiscoveryOrchestrator orchestrator(config, transport, liveness.get());
  inventory.ResetMergeCounts();
  scan::BatchReport report = orchestrator.DiscoverHosts(inventory);

  for (const auto &spec : report.rejected_specs) {
    std::cerr << "Skipped invalid network spec: " << spec << "\n";
  }

  auto counts = inventory.merge_counts();
  std::cout << "Scanned " << report.addresses << " addresses";
  if (report.liveness_used) {
    std::cout << " (" << report.alive << " alive)";
  }
  std::cout << ": " << report.succeeded << " SNMP devices, " << counts.added << " new, " << counts.updated
            << " updated, in " << report.elapsed.count() / 1000.0 << "s\n";

  if (report.Exhausted()) {
    PrintTroubleshooting(config);
    return 1;
  }
  if (!inventory.SaveHosts()) {
    std::cerr << "Error: failed to write " << inventory.hosts_path() << "\n";
    return 1;
  }
  return 0;
}

int RunDiscoverAps(const scan::ScanConfig &config, cache::InventoryCache &inventory) {
  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Error: invalid configuration: " << error << "\n";
    return 1;
  }

  auto switches = inventory.SwitchCandidates();
  if (switches.empty()) {
    std::cerr << "Error: no switch candidates in the cache. Run --update first.\n";
    return 1;
  }

  scan::NetSnmpTransport transport;
  if (!transport.Available()) {
    std::cerr << "Error: snmpget/snmpwalk not found in PATH. Install the net-snmp tools.\n";
    return 1;
  }

  std::cout << "Walking neighbor tables of " << switches.size() << " switches...\n";
  scan::DiscoveryOrchestrator orchestrator(config, transport);
  inventory.ClearNeighbors();
  scan::BatchReport report = orchestrator.DiscoverNeighbors(switches, inventory);

  std::cout << report.succeeded << " of " << report.attempted << " switches reported " << report.records
            << " neighbors\n";
  if (!inventory.SaveNeighbors()) {
    std::cerr << "Error: failed to write " << inventory.neighbors_path() << "\n";
    return 1;
  }
  if (report.Exhausted()) {
    std::cerr << "No CDP or LLDP data returned. Check that CDP/LLDP is enabled on the switches.\n";
    return 1;
  }
  PrintNeighbors(inventory.Neighbors());
  return 0;
}

int RunTestSnmp(const scan::ScanConfig &config, const std::string &address) {
  if (!util::IsValidIPv4(address)) {
    std::cerr << "Error: '" << address << "' is not a valid IPv4 address\n";
    return 1;
  }

  scan::NetSnmpTransport transport;
  scan::SnmpProbe probe(transport, scan::OidSet::Default(), config.snmp_retries);

  std::cout << "Testing SNMP to: " << address << "\n";
  for (const auto &community : config.communities) {
    std::cout << "  Trying community '" << community << "'... " << std::flush;
    scan::TransportReply reply;
    auto hostname = probe.QueryHostname(address, community, config.snmp_timeout, &reply);
    if (hostname) {
      std::cout << "OK: " << *hostname << "\n\nSNMP connectivity successful.\n";
      return 0;
    }
    std::cout << "failed (" << scan::TransportStatusName(reply.status);
    if (!reply.error.empty()) {
      std::cout << ": " << reply.error;
    }
    std::cout << ")\n";
  }
  std::cout << "\nAll SNMP attempts failed.\n";
  return 1;
}

int RunInfo(const scan::ScanConfig &config, const cache::InventoryCache &inventory) {
  auto stats = inventory.GetStats();
  std::cout << "--- netsnmp cache information ---\n";
  if (stats.hosts == 0) {
    std::cerr << "Device cache is empty. Run '--update' to build it.\n";
    return 1;
  }

  std::cout << "Device cache: " << inventory.hosts_path() << "\n"
            << "  Devices:       " << stats.hosts << " (" << stats.hosts_with_serial << " with serial)\n"
            << "  Last updated:  " << util::FormatTime(stats.hosts_updated_at) << " ("
            << util::FormatAge(util::GetTime() - stats.hosts_updated_at) << ")\n"
            << "  Status:        " << (inventory.IsValid(config.cache_ttl) ? "valid" : "stale, run --update")
            << "\n\n";

  if (stats.neighbors == 0) {
    std::cout << "Neighbor cache is empty. Run '--discover-aps' after an update.\n";
  } else {
    std::cout << "Neighbor cache: " << inventory.neighbors_path() << "\n"
              << "  Neighbors:     " << stats.neighbors << " (" << stats.neighbors_without_address
              << " without address)\n"
              << "  Last updated:  " << util::FormatTime(stats.neighbors_updated_at) << " ("
              << util::FormatAge(util::GetTime() - stats.neighbors_updated_at) << ")\n";
  }
  return 0;
}

int RunSearch(const scan::ScanConfig &config, const cache::InventoryCache &inventory, const std::string &pattern) {
  if (inventory.GetStats().hosts == 0) {
    std::cerr << "Cache is empty. Run '--update' first.\n";
    return 1;
  }
  if (!inventory.IsValid(config.cache_ttl)) {
    std::cerr << "Warning: cache is older than " << config.cache_ttl << "s, consider running --update\n";
  }

  auto results = inventory.SearchHosts(pattern);
  if (results.empty()) {
    std::cerr << "No devices found matching '" << pattern << "'.\n";
    return 1;
  }
  std::cout << "Search results (" << results.size() << " found)\n";
  PrintHosts(results);
  return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
  try {
    Command command = Command::SEARCH;
    bool command_set = false;
    std::string pattern;
    std::string test_address;
    std::string networks_override;
    std::string communities_override;
    std::string log_level = "warn";

    auto set_command = [&](Command c) {
      if (command_set) {
        std::cerr << "Error: only one command may be given\n";
        return false;
      }
      command = c;
      command_set = true;
      return true;
    };

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << GetFullVersionString() << std::endl;
        std::cout << GetCopyrightString() << std::endl;
        return 0;
      } else if (arg == "-v" || arg == "--verbose") {
        log_level = "info";
      } else if (arg == "-vv" || arg == "--debug") {
        log_level = "debug";
      } else if (arg == "-S" || arg == "--networks" || arg == "-C" || arg == "--communities") {
        if (i + 1 >= argc) {
          std::cerr << "Error: " << arg << " requires a value\n";
          return 1;
        }
        (arg == "-S" || arg == "--networks" ? networks_override : communities_override) = argv[++i];
      } else if (arg == "--test-snmp") {
        if (i + 1 >= argc) {
          std::cerr << "Error: --test-snmp requires an IP address\n";
          return 1;
        }
        if (!set_command(Command::TEST_SNMP))
          return 1;
        test_address = argv[++i];
      } else if (arg == "--update") {
        if (!set_command(Command::UPDATE))
          return 1;
      } else if (arg == "--discover-aps") {
        if (!set_command(Command::DISCOVER_APS))
          return 1;
      } else if (arg == "--aps") {
        if (!set_command(Command::APS))
          return 1;
      } else if (arg == "--serials") {
        if (!set_command(Command::SERIALS))
          return 1;
      } else if (arg == "-i" || arg == "--info") {
        if (!set_command(Command::INFO))
          return 1;
      } else if (arg == "-c" || arg == "--clear") {
        if (!set_command(Command::CLEAR))
          return 1;
      } else if (arg == "--config") {
        if (!set_command(Command::CONFIG))
          return 1;
      } else if (arg == "--init-config") {
        if (!set_command(Command::INIT_CONFIG))
          return 1;
      } else if (arg == "search" && !command_set) {
        set_command(Command::SEARCH);
      } else if (arg.starts_with("-")) {
        std::cerr << "Error: unknown option " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      } else if (pattern.empty()) {
        pattern = arg;
      } else {
        std::cerr << "Error: unexpected argument " << arg << "\n";
        return 1;
      }
    }

    // Console only until the config says whether to write a log file
    util::LogManager::Initialize(log_level);

    util::RuntimePaths paths = util::get_runtime_paths();
    if (paths.conf_dir.empty()) {
      std::cerr << "Error: HOME environment variable not set.\n"
                << "Cannot determine configuration and cache directories.\n";
      return 1;
    }

    std::string error;
    auto loaded = scan::LoadConfigFile(paths.config_file.string(), &error);
    if (!loaded) {
      std::cerr << "Error: " << error << "\n";
      return 1;
    }
    scan::ScanConfig config = *loaded;
    if (!networks_override.empty() && !scan::ApplyConfigValue(config, "subnets", networks_override, &error)) {
      std::cerr << "Error: -S: " << error << "\n";
      return 1;
    }
    if (!communities_override.empty() &&
        !scan::ApplyConfigValue(config, "communities", communities_override, &error)) {
      std::cerr << "Error: -C: " << error << "\n";
      return 1;
    }

    if (config.enable_logging) {
      util::LogManager::Initialize(log_level, true, paths.log_file.string());
    }

    cache::InventoryCache inventory(paths.cache_dir.string());
    if (!inventory.Load()) {
      std::cerr << "Warning: cache files in " << paths.cache_dir.string() << " are unreadable, starting empty\n";
    }

    int rc = 0;
    switch (command) {
    case Command::UPDATE:
      rc = RunUpdate(config, inventory);
      break;
    case Command::DISCOVER_APS:
      rc = RunDiscoverAps(config, inventory);
      break;
    case Command::TEST_SNMP:
      rc = RunTestSnmp(config, test_address);
      break;
    case Command::APS: {
      auto neighbors = inventory.SearchNeighbors(pattern);
      if (neighbors.empty()) {
        std::cerr << "No neighbors found. Run '--discover-aps' after an update.\n";
        rc = 1;
      } else {
        PrintNeighbors(neighbors);
      }
      break;
    }
    case Command::SERIALS: {
      std::vector<scan::HostRecord> hosts;
      for (const auto &host : inventory.SearchHosts(pattern)) {
        if (host.HasSerial()) {
          hosts.push_back(host);
        }
      }
      if (hosts.empty()) {
        std::cerr << "No devices with a serial number found.\n";
        rc = 1;
      } else {
        PrintHosts(hosts);
      }
      break;
    }
    case Command::INFO:
      rc = RunInfo(config, inventory);
      break;
    case Command::CLEAR:
      rc = inventory.Clear() ? 0 : 1;
      if (rc == 0) {
        std::cout << "All caches cleared.\n";
      }
      break;
    case Command::CONFIG:
      std::cout << "# Loaded from: " << paths.config_file.string() << "\n" << scan::FormatConfig(config);
      break;
    case Command::INIT_CONFIG:
      if (scan::SaveConfigFile(config, paths.config_file.string())) {
        std::cout << "Configuration written to " << paths.config_file.string() << "\n";
      } else {
        std::cerr << "Error: failed to write " << paths.config_file.string() << "\n";
        rc = 1;
      }
      break;
    case Command::SEARCH:
      rc = RunSearch(config, inventory, pattern);
      break;
    }

    if (const uint64_t dropped = util::RateLimiter::instance().SuppressedTotal(); dropped > 0) {
      std::cerr << dropped << " repeated warnings were suppressed\n";
    }
    util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
