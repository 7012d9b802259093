// Fuzz target for configuration file parsing
// Tests ParseConfig and FormatConfig
//
// The config file is user-editable. Bugs in this code can:
// - Accept values that later break the scan (zero workers, empty communities)
// - Produce output that does not parse back to the same configuration
//
// Target code:
// - src/scan/config.cpp

#include "fuzz_input.hpp"
#include "scan/config.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

using namespace netsnmp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    FuzzInput input(data, size);
    std::string contents = input.read_remaining();

    try {
        auto config = scan::ParseConfig(contents);
        if (!config) return 0;

        // Every accepted file yields a usable configuration
        if (!config->Validate()) __builtin_trap();

        // Format/parse is stable
        auto reparsed = scan::ParseConfig(scan::FormatConfig(*config));
        if (!reparsed) __builtin_trap();
        if (reparsed->networks != config->networks || reparsed->communities != config->communities ||
            reparsed->scan_workers != config->scan_workers || reparsed->scan_mode != config->scan_mode ||
            reparsed->discovery_protocols != config->discovery_protocols) {
            __builtin_trap();
        }
    } catch (...) {
        __builtin_trap();
    }

    return 0;
}
