// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for network spec expansion

#include <catch2/catch_test_macros.hpp>
#include "scan/address_range.hpp"
#include "util/logging.hpp"

using namespace netsnmp::scan;

TEST_CASE("AddressRange: single address", "[address_range]") {
    auto range = AddressRange::Parse("10.0.0.7");
    REQUIRE(range.has_value());
    REQUIRE(range->size() == 1);
    REQUIRE(range->ToVector() == std::vector<std::string>{"10.0.0.7"});
    REQUIRE(range->spec() == "10.0.0.7");

    SECTION("Network and broadcast octets are taken literally") {
        REQUIRE(AddressRange::Parse("10.0.0.255")->front() == "10.0.0.255");
        REQUIRE(AddressRange::Parse("10.0.0.0")->front() == "10.0.0.0");
    }

    SECTION("Address text is passed through as written") {
        for (const char* text : {"010.001.000.007", "10.0.0.07", "192.168.001.1"}) {
            auto written = AddressRange::Parse(text);
            REQUIRE(written.has_value());
            REQUIRE(written->ToVector() == std::vector<std::string>{text});
            REQUIRE(written->front() == text);
            REQUIRE(written->back() == text);
        }
        REQUIRE(ExpandAll({"10.0.0.07", "10.0.0.1-2"}) ==
                std::vector<std::string>{"10.0.0.07", "10.0.0.1", "10.0.0.2"});
    }
}

TEST_CASE("AddressRange: last-octet range", "[address_range]") {
    SECTION("Ascending inclusive expansion") {
        auto range = AddressRange::Parse("192.168.1.10-20");
        REQUIRE(range.has_value());
        REQUIRE(range->size() == 11);
        auto addresses = range->ToVector();
        REQUIRE(addresses.size() == 11);
        REQUIRE(addresses.front() == "192.168.1.10");
        REQUIRE(addresses.back() == "192.168.1.20");
        for (size_t i = 0; i < addresses.size(); ++i) {
            REQUIRE(addresses[i] == "192.168.1." + std::to_string(10 + i));
        }
    }

    SECTION("Single-element range") {
        auto range = AddressRange::Parse("10.0.0.5-5");
        REQUIRE(range.has_value());
        REQUIRE(range->ToVector() == std::vector<std::string>{"10.0.0.5"});
    }

    SECTION("Full host range") {
        auto range = AddressRange::Parse("10.0.0.1-254");
        REQUIRE(range.has_value());
        REQUIRE(range->size() == 254);
    }

    SECTION("Reversed range is rejected") {
        std::string error;
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.50-10", &error));
        REQUIRE(error.find("10.0.0.50-10") != std::string::npos);
    }

    SECTION("Out-of-bounds octets are rejected") {
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.0-10"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.1-255"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.1-999"));
    }

    SECTION("Malformed ranges are rejected") {
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.1-"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.-5"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.1-5"));
        REQUIRE_FALSE(AddressRange::Parse("10-20"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.300.1-5"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.1-x"));
    }
}

TEST_CASE("AddressRange: CIDR", "[address_range]") {
    SECTION("/24 yields .1 through .254") {
        auto range = AddressRange::Parse("10.0.0.0/24");
        REQUIRE(range.has_value());
        REQUIRE(range->size() == 254);
        auto addresses = range->ToVector();
        REQUIRE(addresses.size() == 254);
        REQUIRE(addresses.front() == "10.0.0.1");
        REQUIRE(addresses.back() == "10.0.0.254");
        REQUIRE(range->front() == "10.0.0.1");
        REQUIRE(range->back() == "10.0.0.254");
    }

    SECTION("Other mask lengths are rejected") {
        std::string error;
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.0/16", &error));
        REQUIRE(error.find("/16") != std::string::npos);
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.0/25"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.0/32"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.0/"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.0/abc"));
    }

    SECTION("Base address must be the network address") {
        REQUIRE_FALSE(AddressRange::Parse("10.0.0.5/24"));
        REQUIRE_FALSE(AddressRange::Parse("10.0.0/24"));
    }
}

TEST_CASE("AddressRange: iteration is repeatable", "[address_range]") {
    auto range = AddressRange::Parse("172.16.5.100-103");
    REQUIRE(range.has_value());

    std::vector<std::string> first(range->begin(), range->end());
    std::vector<std::string> second;
    for (const auto& address : *range) {
        second.push_back(address);
    }
    REQUIRE(first == second);
    REQUIRE(first.size() == range->size());
}

TEST_CASE("AddressRange: garbage is rejected", "[address_range]") {
    std::string error;
    REQUIRE_FALSE(AddressRange::Parse("", &error));
    REQUIRE_FALSE(error.empty());
    REQUIRE_FALSE(AddressRange::Parse("switch.example.com"));
    REQUIRE_FALSE(AddressRange::Parse("10.0.0"));
    REQUIRE_FALSE(AddressRange::Parse("256.0.0.1"));
}

TEST_CASE("ExpandAll: concatenates in spec order and skips rejects", "[address_range]") {
    netsnmp::util::LogManager::Initialize("off", false, "");

    std::vector<std::string> rejected;
    auto addresses = ExpandAll({"10.0.0.9", "10.0.0.50-10", "10.0.1.1-3", "10.0.0.0/16"}, &rejected);

    REQUIRE(addresses == std::vector<std::string>{"10.0.0.9", "10.0.1.1", "10.0.1.2", "10.0.1.3"});
    REQUIRE(rejected == std::vector<std::string>{"10.0.0.50-10", "10.0.0.0/16"});

    SECTION("Rejected list is optional") {
        REQUIRE(ExpandAll({"bogus"}).empty());
    }
}
