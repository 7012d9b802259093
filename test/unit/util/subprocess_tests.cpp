// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for RunCommand (posix_spawn with captured output)

#include <catch2/catch_test_macros.hpp>
#include "util/subprocess.hpp"
#include <chrono>

using namespace netsnmp::util;
using namespace std::chrono_literals;

TEST_CASE("RunCommand: captures output and exit code", "[subprocess]") {
    SECTION("stdout captured") {
        auto result = RunCommand({"/bin/sh", "-c", "printf 'line1\\nline2\\n'"}, 5s);
        REQUIRE(result.spawned);
        REQUIRE_FALSE(result.timed_out);
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.ok());
        REQUIRE(result.out == "line1\nline2\n");
        REQUIRE(result.err.empty());
    }

    SECTION("stderr and exit status captured separately") {
        auto result = RunCommand({"/bin/sh", "-c", "echo 'Timeout: No Response from 10.0.0.1' >&2; exit 1"}, 5s);
        REQUIRE(result.spawned);
        REQUIRE(result.exit_code == 1);
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.out.empty());
        REQUIRE(result.err == "Timeout: No Response from 10.0.0.1\n");
    }

    SECTION("stdin is /dev/null") {
        auto result = RunCommand({"/bin/sh", "-c", "cat; echo done"}, 5s);
        REQUIRE(result.ok());
        REQUIRE(result.out == "done\n");
    }
}

TEST_CASE("RunCommand: failure modes", "[subprocess]") {
    SECTION("Empty argv") {
        auto result = RunCommand({}, 1s);
        REQUIRE_FALSE(result.spawned);
        REQUIRE_FALSE(result.ok());
    }

    SECTION("Missing program") {
        auto result = RunCommand({"netsnmp-no-such-program-xyz"}, 1s);
        REQUIRE_FALSE(result.spawned);
        REQUIRE_FALSE(result.ok());
    }

    SECTION("Deadline kills the child") {
        auto start = std::chrono::steady_clock::now();
        auto result = RunCommand({"/bin/sh", "-c", "sleep 10"}, 200ms);
        auto elapsed = std::chrono::steady_clock::now() - start;
        REQUIRE(result.spawned);
        REQUIRE(result.timed_out);
        REQUIRE_FALSE(result.ok());
        REQUIRE(elapsed < 5s);
    }
}

TEST_CASE("IsCommandAvailable", "[subprocess]") {
    REQUIRE(IsCommandAvailable("/bin/sh"));
    REQUIRE(IsCommandAvailable("sh"));
    REQUIRE_FALSE(IsCommandAvailable("netsnmp-no-such-program-xyz"));
    REQUIRE_FALSE(IsCommandAvailable("/nonexistent/bin/snmpget"));
}
