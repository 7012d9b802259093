// Fuzz target for network spec expansion
// Tests AddressRange::Parse, ParseIPv4 and HexToIPv4
//
// Network specs come straight from the config file and the -S option.
// Bugs in this code can:
// - Expand a malformed spec into a wrong address list instead of rejecting it
// - Yield host octets 0 or 255 (network/broadcast) from a range or /24
// - Allocate without bound on hostile input
//
// Target code:
// - src/scan/address_range.cpp
// - src/util/netaddress.cpp

#include "fuzz_input.hpp"
#include "scan/address_range.hpp"
#include "util/netaddress.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

using namespace netsnmp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 2) return 0;

    FuzzInput input(data, size);
    uint8_t mode = input.read<uint8_t>();

    // TEST 1: AddressRange::Parse invariants on arbitrary strings
    if ((mode & 0x03) == 0) {
        std::string spec = input.read_remaining();

        try {
            std::string error;
            auto range = scan::AddressRange::Parse(spec, &error);
            if (!range) {
                // A rejection must say why
                if (error.empty()) __builtin_trap();
                return 0;
            }

            size_t count = 0;
            std::string first;
            for (const auto &address : *range) {
                if (!util::IsValidIPv4(address)) __builtin_trap();
                if (count == 0) first = address;
                ++count;
            }
            if (count != range->size() || count == 0 || count > 254) __builtin_trap();
            if (first != range->front()) __builtin_trap();

            // Ranges and /24 never produce .0 or .255
            if (range->size() > 1) {
                for (const auto &address : *range) {
                    auto octets = util::ParseIPv4(address);
                    if (!octets || (*octets)[3] == 0 || (*octets)[3] == 255) __builtin_trap();
                }
            }

            // Restartable: a second pass yields the same sequence
            if (range->ToVector() != range->ToVector()) __builtin_trap();
        } catch (...) {
            // Parse reports errors through its return value
            __builtin_trap();
        }
    }

    // TEST 2: ParseIPv4 / FormatIPv4 agree
    if ((mode & 0x03) == 1) {
        std::string address = input.read_remaining();

        try {
            auto octets = util::ParseIPv4(address);
            if (octets) {
                auto reparsed = util::ParseIPv4(util::FormatIPv4(*octets));
                if (!reparsed || *reparsed != *octets) __builtin_trap();
            }
        } catch (...) {
            __builtin_trap();
        }
    }

    // TEST 3: HexToIPv4 output is always a valid dotted quad
    if ((mode & 0x03) == 2) {
        std::string hex = input.read_remaining();

        try {
            auto address = util::HexToIPv4(hex);
            if (address && !util::IsValidIPv4(*address)) __builtin_trap();
        } catch (...) {
            __builtin_trap();
        }
    }

    // TEST 4: every single address round-trips through Parse
    if ((mode & 0x03) == 3 && input.has_bytes(4)) {
        uint8_t a = input.read<uint8_t>();
        uint8_t b = input.read<uint8_t>();
        uint8_t c = input.read<uint8_t>();
        uint8_t d = input.read<uint8_t>();
        std::string spec = util::FormatIPv4({a, b, c, d});

        auto range = scan::AddressRange::Parse(spec);
        if (!range || range->size() != 1 || range->front() != spec) __builtin_trap();
    }

    return 0;
}
