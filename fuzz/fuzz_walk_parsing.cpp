// Fuzz target for SNMP response and neighbor table parsing
// Tests ParseVarBinds, OidSuffix, DecodeCdp and DecodeLldp
//
// Walk output is produced by devices we do not control. Bugs in this code can:
// - Crash a scan worker on a malformed or truncated reply
// - Emit neighbor records without a hostname
// - Emit CDP records without an address
//
// Target code:
// - src/scan/snmp_response.cpp
// - src/scan/neighbor_decoder.cpp

#include "fuzz_input.hpp"
#include "scan/neighbor_decoder.hpp"
#include "scan/snmp_response.hpp"
#include "util/netaddress.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

using namespace netsnmp;

namespace {

std::vector<std::string> SplitLines(const std::string &text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 2) return 0;

    FuzzInput input(data, size);
    uint8_t mode = input.read<uint8_t>();
    auto lines = SplitLines(input.read_remaining());

    try {
        if ((mode & 0x03) == 0) {
            for (const auto &vb : scan::ParseVarBinds(lines)) {
                // OIDs are normalized without a leading dot
                if (!vb.oid.empty() && vb.oid.front() == '.') __builtin_trap();
                // Markers never carry a value
                if (!vb.HasValue() && !vb.value.empty()) __builtin_trap();
            }
        }

        if ((mode & 0x03) == 1) {
            for (const auto &record : scan::NeighborTableDecoder::DecodeCdp(lines)) {
                if (record.neighbor_hostname.empty()) __builtin_trap();
                if (!util::IsValidIPv4(record.neighbor_address)) __builtin_trap();
                if (record.protocol != scan::DiscoveryProtocol::CDP) __builtin_trap();
            }
        }

        if ((mode & 0x03) == 2) {
            for (const auto &record : scan::NeighborTableDecoder::DecodeLldp(lines)) {
                if (record.neighbor_hostname.empty()) __builtin_trap();
                if (record.HasAddress() && !util::IsValidIPv4(record.neighbor_address)) __builtin_trap();
                if (record.protocol != scan::DiscoveryProtocol::LLDP) __builtin_trap();
            }
        }

        if ((mode & 0x03) == 3 && !lines.empty()) {
            // A suffix, when present, rebuilds the original OID
            std::string oid = scan::NormalizeOid(lines.front());
            std::string prefix = lines.size() > 1 ? scan::NormalizeOid(lines[1]) : "1.3.6.1";
            auto suffix = scan::OidSuffix(oid, prefix);
            if (suffix && !scan::OidHasPrefix(oid, prefix)) __builtin_trap();
        }
    } catch (...) {
        // Parsers report bad input by skipping it, never by throwing
        __builtin_trap();
    }

    return 0;
}
