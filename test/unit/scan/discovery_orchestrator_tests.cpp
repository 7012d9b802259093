// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for DiscoveryOrchestrator (host pass and neighbor pass)

#include <catch2/catch_test_macros.hpp>
#include "common/fake_liveness_probe.hpp"
#include "common/fake_snmp_transport.hpp"
#include "scan/discovery_orchestrator.hpp"
#include "scan/oids.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <stdexcept>

using namespace netsnmp::scan;
using netsnmp::test::FakeLivenessProbe;
using netsnmp::test::FakeSnmpTransport;
using namespace std::chrono_literals;

namespace {

const std::string CDP = ".1.3.6.1.4.1.9.9.23.1.2.1.1.";
const std::string LLDP_REM = ".1.0.8802.1.1.2.1.4.1.1.";

ScanConfig TestConfig() {
    ScanConfig config;
    config.communities = {"public"};
    config.scan_mode = ScanMode::SNMP;
    config.scan_workers = 8;
    config.snmp_timeout = 1s;
    config.scan_delay = 0ms;
    return config;
}

void AddHost(FakeSnmpTransport& transport, const std::string& address, const std::string& community,
             const std::string& hostname, const std::string& serial = "") {
    std::map<std::string, std::string> values = {{oids::SYS_NAME, "STRING: \"" + hostname + "\""}};
    if (!serial.empty()) {
        values[oids::ENT_PHYSICAL_SERIAL_1] = "STRING: \"" + serial + "\"";
    }
    transport.AddAgent(address, community, std::move(values));
}

std::vector<std::string> SortedAddresses(const std::vector<HostRecord>& hosts) {
    std::vector<std::string> out;
    for (const auto& host : hosts) {
        out.push_back(host.address);
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace

TEST_CASE("DiscoveryOrchestrator: constructor rejects unusable config", "[discovery_orchestrator]") {
    FakeSnmpTransport transport;

    auto config = TestConfig();
    config.communities.clear();
    REQUIRE_THROWS_AS(DiscoveryOrchestrator(config, transport), std::invalid_argument);

    config = TestConfig();
    config.scan_workers = 0;
    REQUIRE_THROWS_AS(DiscoveryOrchestrator(config, transport), std::invalid_argument);

    config = TestConfig();
    config.discovery_protocols.clear();
    REQUIRE_THROWS_AS(DiscoveryOrchestrator(config, transport), std::invalid_argument);
}

TEST_CASE("DiscoveryOrchestrator: host pass", "[discovery_orchestrator]") {
    netsnmp::util::LogManager::Initialize("off", false, "");
    netsnmp::util::LogManager::SetLogLevel("off");
    FakeSnmpTransport transport;
    CollectingSink sink;

    SECTION("Every answering host reaches the sink exactly once") {
        AddHost(transport, "10.0.0.2", "public", "sw-a", "SN-A");
        AddHost(transport, "10.0.0.7", "public", "sw-b");
        AddHost(transport, "10.0.0.9", "private", "sw-c", "SN-C");

        auto config = TestConfig();
        config.communities = {"public", "private"};
        DiscoveryOrchestrator orchestrator(config, transport);
        auto report = orchestrator.DiscoverHosts({"10.0.0.1-10"}, sink);

        REQUIRE(report.addresses == 10);
        REQUIRE(report.attempted == 10);
        REQUIRE(report.succeeded == 3);
        REQUIRE(report.records == 3);
        REQUIRE_FALSE(report.Exhausted());
        REQUIRE_FALSE(report.liveness_used);
        REQUIRE(SortedAddresses(sink.hosts()) == std::vector<std::string>{"10.0.0.2", "10.0.0.7", "10.0.0.9"});

        // sw-a answered on the first community, so the second was never used
        REQUIRE(transport.CallCount("10.0.0.2", "private") == 0);
        // silent addresses were asked with every community
        REQUIRE(transport.CallCount("10.0.0.1") == 2);
    }

    SECTION("Zero live candidates is a report, not an exception") {
        auto config = TestConfig();
        config.scan_mode = ScanMode::ICMP;
        FakeLivenessProbe liveness;  // nobody answers
        DiscoveryOrchestrator orchestrator(config, transport, &liveness);

        BatchReport report;
        REQUIRE_NOTHROW(report = orchestrator.DiscoverHosts({"10.0.0.0/24"}, sink));
        REQUIRE(report.Exhausted());
        REQUIRE(report.liveness_used);
        REQUIRE(report.addresses == 254);
        REQUIRE(report.alive == 0);
        REQUIRE(report.attempted == 0);
        REQUIRE(liveness.calls() == 254);
        REQUIRE(transport.calls().empty());
        REQUIRE(sink.hosts().empty());
    }

    SECTION("ICMP mode only queries live addresses") {
        AddHost(transport, "10.0.0.3", "public", "sw-live");
        AddHost(transport, "10.0.0.4", "public", "sw-hidden");

        auto config = TestConfig();
        config.scan_mode = ScanMode::ICMP;
        FakeLivenessProbe liveness({"10.0.0.3", "10.0.0.5"});
        DiscoveryOrchestrator orchestrator(config, transport, &liveness);
        auto report = orchestrator.DiscoverHosts({"10.0.0.1-6"}, sink);

        REQUIRE(report.alive == 2);
        REQUIRE(report.attempted == 2);
        REQUIRE(report.succeeded == 1);
        REQUIRE(sink.hosts().size() == 1);
        REQUIRE(sink.hosts()[0].hostname == "sw-live");
        REQUIRE(transport.CallCount("10.0.0.4") == 0);
    }

    SECTION("ICMP mode without a probe falls back to querying everything") {
        auto config = TestConfig();
        config.scan_mode = ScanMode::ICMP;
        DiscoveryOrchestrator orchestrator(config, transport, nullptr);
        auto report = orchestrator.DiscoverHosts({"10.0.0.1-4"}, sink);
        REQUIRE_FALSE(report.liveness_used);
        REQUIRE(report.attempted == 4);
    }

    SECTION("SNMP mode ignores the liveness probe") {
        FakeLivenessProbe liveness;
        DiscoveryOrchestrator orchestrator(TestConfig(), transport, &liveness);
        auto report = orchestrator.DiscoverHosts({"10.0.0.1-4"}, sink);
        REQUIRE(liveness.calls() == 0);
        REQUIRE(report.attempted == 4);
    }

    SECTION("A bad spec does not abort its siblings") {
        AddHost(transport, "10.0.0.8", "public", "sw");
        DiscoveryOrchestrator orchestrator(TestConfig(), transport);
        auto report = orchestrator.DiscoverHosts({"10.0.0.50-10", "10.0.0.8"}, sink);
        REQUIRE(report.rejected_specs == std::vector<std::string>{"10.0.0.50-10"});
        REQUIRE(report.succeeded == 1);
    }

    SECTION("No valid spec at all is malformed input") {
        DiscoveryOrchestrator orchestrator(TestConfig(), transport);
        REQUIRE_THROWS_AS(orchestrator.DiscoverHosts({"10.0.0.0/16"}, sink), std::invalid_argument);
        REQUIRE_THROWS_AS(orchestrator.DiscoverHosts(std::vector<std::string>{}, sink), std::invalid_argument);
        REQUIRE(transport.calls().empty());
    }

    SECTION("Configured networks are the default input") {
        AddHost(transport, "192.168.5.5", "public", "cfg-host");
        auto config = TestConfig();
        config.networks = {"192.168.5.5"};
        DiscoveryOrchestrator orchestrator(config, transport);
        auto report = orchestrator.DiscoverHosts(sink);
        REQUIRE(report.succeeded == 1);
    }

    SECTION("Transport errors are counted") {
        transport.AddAgent("10.0.0.1", "public");
        transport.SetStatus("10.0.0.1", "public", TransportStatus::ERROR, "snmpget: Unknown host");
        DiscoveryOrchestrator orchestrator(TestConfig(), transport);
        auto report = orchestrator.DiscoverHosts({"10.0.0.1"}, sink);
        REQUIRE(report.transport_errors == 1);
        REQUIRE(report.Exhausted());
    }
}

TEST_CASE("DiscoveryOrchestrator: worker cap bounds in-flight probes", "[discovery_orchestrator]") {
    netsnmp::util::LogManager::Initialize("off", false, "");
    netsnmp::util::LogManager::SetLogLevel("off");

    constexpr auto DELAY = 100ms;
    FakeSnmpTransport transport;
    transport.set_delay(DELAY);
    for (int i = 1; i <= 12; ++i) {
        AddHost(transport, "10.9.9." + std::to_string(i), "public", "h" + std::to_string(i));
    }

    auto config = TestConfig();
    config.scan_workers = 5;
    DiscoveryOrchestrator orchestrator(config, transport);
    CollectingSink sink;

    auto start = std::chrono::steady_clock::now();
    auto report = orchestrator.DiscoverHosts({"10.9.9.1-12"}, sink);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(report.succeeded == 12);
    REQUIRE(transport.peak_in_flight() <= 5);
    REQUIRE(report.peak_in_flight <= 5);
    REQUIRE(elapsed >= 3 * DELAY);
    REQUIRE(elapsed < 8 * DELAY);
}

TEST_CASE("DiscoveryOrchestrator: neighbor pass", "[discovery_orchestrator]") {
    netsnmp::util::LogManager::Initialize("off", false, "");
    netsnmp::util::LogManager::SetLogLevel("off");
    FakeSnmpTransport transport;
    CollectingSink sink;
    const std::string sw = "10.0.0.1";

    SECTION("Empty CDP table falls through to LLDP") {
        transport.AddAgent(sw, "public", {{LLDP_REM + "9.0.3.1", "STRING: \"dist-01\""}});
        DiscoveryOrchestrator orchestrator(TestConfig(), transport);
        auto report = orchestrator.DiscoverNeighbors({sw}, sink);

        auto neighbors = sink.neighbors();
        REQUIRE(neighbors.size() == 1);
        REQUIRE(neighbors[0].protocol == DiscoveryProtocol::LLDP);
        REQUIRE(neighbors[0].neighbor_hostname == "dist-01");
        REQUIRE(neighbors[0].source_switch == sw);
        REQUIRE(report.succeeded == 1);
        REQUIRE(report.records == 1);
    }

    SECTION("First non-empty table wins") {
        transport.AddAgent(sw, "public", {{CDP + "4.1.2", "Hex-STRING: C0 A8 01 01"},
                                          {CDP + "6.1.2", "STRING: \"switch-a\""},
                                          {LLDP_REM + "9.0.3.1", "STRING: \"dist-01\""}});
        DiscoveryOrchestrator orchestrator(TestConfig(), transport);
        orchestrator.DiscoverNeighbors({sw}, sink);

        auto neighbors = sink.neighbors();
        REQUIRE(neighbors.size() == 1);
        REQUIRE(neighbors[0].protocol == DiscoveryProtocol::CDP);
        REQUIRE(neighbors[0].neighbor_address == "192.168.1.1");
        REQUIRE(transport.calls().size() == 1);
    }

    SECTION("Credentials are tried within a protocol before moving on") {
        transport.AddAgent(sw, "private", {{CDP + "4.1.2", "Hex-STRING: C0 A8 01 01"},
                                           {CDP + "6.1.2", "STRING: \"switch-a\""}});
        auto config = TestConfig();
        config.communities = {"public", "private"};
        DiscoveryOrchestrator orchestrator(config, transport);
        orchestrator.DiscoverNeighbors({sw}, sink);

        auto calls = transport.calls();
        REQUIRE(calls.size() == 2);
        REQUIRE(calls[0].community == "public");
        REQUIRE(calls[1].community == "private");
        REQUIRE(calls[1].oids[0] == oids::CDP_CACHE_TABLE);
        REQUIRE(sink.neighbors().size() == 1);
    }

    SECTION("Protocol order follows the config") {
        auto config = TestConfig();
        config.discovery_protocols = {DiscoveryProtocol::LLDP};
        DiscoveryOrchestrator orchestrator(config, transport);
        auto report = orchestrator.DiscoverNeighbors({sw}, sink);
        REQUIRE(report.Exhausted());
        auto calls = transport.calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].oids[0] == oids::LLDP_REM_SYSTEMS_DATA);
    }

    SECTION("Switches are independent") {
        transport.AddAgent("10.0.0.2", "public", {{LLDP_REM + "9.0.1.1", "STRING: \"ap-1\""}});
        transport.AddAgent("10.0.0.3", "public");
        transport.SetStatus("10.0.0.3", "public", TransportStatus::ERROR, "snmpwalk: failure");
        DiscoveryOrchestrator orchestrator(TestConfig(), transport);
        auto report = orchestrator.DiscoverNeighbors({"10.0.0.2", "10.0.0.3", "10.0.0.4"}, sink);
        REQUIRE(report.attempted == 3);
        REQUIRE(report.succeeded == 1);
        REQUIRE(report.transport_errors == 2);  // CDP and LLDP on 10.0.0.3
        REQUIRE(sink.neighbors().size() == 1);
    }

    SECTION("No switches") {
        DiscoveryOrchestrator orchestrator(TestConfig(), transport);
        auto report = orchestrator.DiscoverNeighbors({}, sink);
        REQUIRE(report.Exhausted());
        REQUIRE(transport.calls().empty());
    }
}
