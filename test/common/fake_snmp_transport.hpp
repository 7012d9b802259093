// Scripted SnmpTransport for scanner tests
#pragma once

#include "scan/snmp_transport.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace netsnmp {
namespace test {

// Simulated agents keyed by (address, community). Each agent holds OID ->
// rendered value ("STRING: \"core-sw1\"", "Hex-STRING: C0 A8 01 01").
// Replies use net-snmp's -On text format, so the real parser runs on them.
// An (address, community) pair with no agent does not answer.
class FakeSnmpTransport : public scan::SnmpTransport {
public:
    struct Call {
        enum class Kind { GET, WALK } kind;
        std::string address;
        std::string community;
        std::vector<std::string> oids;  // GET: requested OIDs, WALK: root
    };

    void AddAgent(const std::string& address, const std::string& community,
                  std::map<std::string, std::string> values = {});

    // Add or replace one value on an existing agent
    void SetValue(const std::string& address, const std::string& community, const std::string& oid,
                  const std::string& rendered);

    // Force a status for every request to (address, community)
    void SetStatus(const std::string& address, const std::string& community, scan::TransportStatus status,
                   std::string error = "");

    // Raw lines returned for a walk, bypassing agent values
    void SetWalkLines(const std::string& address, const std::string& community, const std::string& root,
                      std::vector<std::string> lines);

    // Every request sleeps this long (simulated network latency)
    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    scan::TransportReply Get(const scan::SnmpRequest& request, const std::vector<std::string>& oids) override;
    scan::TransportReply Walk(const scan::SnmpRequest& request, const std::string& root) override;

    std::vector<Call> calls() const;
    size_t CallCount(const std::string& address) const;
    size_t CallCount(const std::string& address, const std::string& community) const;
    size_t peak_in_flight() const { return peak_in_flight_.load(); }

private:
    using Key = std::pair<std::string, std::string>;

    struct Agent {
        std::map<std::string, std::string> values;
        std::optional<scan::TransportStatus> forced_status;
        std::string error;
        std::map<std::string, std::vector<std::string>> walk_lines;
    };

    void Enter();
    void Leave();

    mutable std::mutex mutex_;
    std::map<Key, Agent> agents_;
    std::vector<Call> calls_;
    std::chrono::milliseconds delay_{0};
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_in_flight_{0};
};

}  // namespace test
}  // namespace netsnmp
