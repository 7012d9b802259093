// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for LogManager

#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"
#include "util/files.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace netsnmp::util;

// Initialize() rebuilds the loggers on every call, so each test sets the
// configuration it needs.

TEST_CASE("LogManager: GetLogger returns valid loggers", "[logging]") {
    LogManager::Initialize("debug", false, "");

    SECTION("Default logger") {
        auto logger = LogManager::GetLogger();
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "default");
    }

    SECTION("Named component loggers") {
        for (const char* name : {"scan", "snmp", "cache"}) {
            auto logger = LogManager::GetLogger(name);
            REQUIRE(logger != nullptr);
            REQUIRE(logger->name() == name);
        }
    }

    SECTION("Unknown component returns default logger") {
        auto unknown = LogManager::GetLogger("nonexistent");
        REQUIRE(unknown != nullptr);
        REQUIRE(unknown->name() == "default");
    }

    SECTION("Same logger returned for same component") {
        auto logger1 = LogManager::GetLogger("scan");
        auto logger2 = LogManager::GetLogger("scan");
        REQUIRE(logger1.get() == logger2.get());
    }
}

TEST_CASE("LogManager: SetLogLevel changes all loggers", "[logging]") {
    LogManager::Initialize("info", false, "");

    LogManager::SetLogLevel("trace");
    REQUIRE(LogManager::GetLogger()->level() == spdlog::level::trace);
    REQUIRE(LogManager::GetLogger("snmp")->level() == spdlog::level::trace);

    LogManager::SetLogLevel("info");
    REQUIRE(LogManager::GetLogger()->level() == spdlog::level::info);
    REQUIRE(LogManager::GetLogger("cache")->level() == spdlog::level::info);
}

TEST_CASE("LogManager: SetComponentLevel changes specific logger", "[logging]") {
    LogManager::Initialize("info", false, "");
    LogManager::SetLogLevel("info");

    LogManager::SetComponentLevel("snmp", "trace");

    REQUIRE(LogManager::GetLogger("snmp")->level() == spdlog::level::trace);
    REQUIRE(LogManager::GetLogger("scan")->level() == spdlog::level::info);

    // Unknown component is ignored
    LogManager::SetComponentLevel("nonexistent", "trace");
    REQUIRE(LogManager::GetLogger()->level() == spdlog::level::info);
}

TEST_CASE("LogManager: Logging macros work", "[logging]") {
    LogManager::Initialize("trace", false, "");
    // Suppress output - we're testing macros don't crash, not verifying output
    LogManager::SetLogLevel("off");

    SECTION("Default logger macros") {
        LOG_TRACE("Test trace message");
        LOG_DEBUG("Test debug message");
        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");
    }

    SECTION("Scan logger macros") {
        LOG_SCAN_TRACE("Scan trace");
        LOG_SCAN_DEBUG("Scan debug");
        LOG_SCAN_INFO("Scan info {}", "10.0.0.0/24");
        LOG_SCAN_WARN("Scan warn");
        LOG_SCAN_ERROR("Scan error");
    }

    SECTION("SNMP and cache logger macros") {
        LOG_SNMP_TRACE("SNMP trace");
        LOG_SNMP_DEBUG("SNMP debug {}", 161);
        LOG_SNMP_INFO("SNMP info");
        LOG_SNMP_WARN("SNMP warn");
        LOG_SNMP_ERROR("SNMP error");
        LOG_CACHE_DEBUG("Cache debug");
        LOG_CACHE_INFO("Cache info");
        LOG_CACHE_WARN("Cache warn");
        LOG_CACHE_ERROR("Cache error");
    }

    REQUIRE(true);
}

TEST_CASE("LogManager: Thread safety", "[logging][threading]") {
    LogManager::Initialize("info", false, "");
    // Suppress output during thread safety test
    LogManager::SetLogLevel("off");

    const int num_threads = 8;
    const int ops_per_thread = 100;
    std::atomic<int> success_count{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&success_count, ops_per_thread, t]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                auto logger = LogManager::GetLogger(t % 2 == 0 ? "scan" : "snmp");
                if (logger != nullptr) {
                    logger->trace("Thread {} iteration {}", t, i);
                    success_count++;
                }
                if (i % 20 == 0) {
                    LogManager::SetComponentLevel("scan", "off");
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(success_count == num_threads * ops_per_thread);
}

TEST_CASE("LogManager: Rate-limited logging macros", "[logging][rate_limiter]") {
    LogManager::Initialize("error", false, "");
    LogManager::SetLogLevel("off");

    RateLimiter::instance().Reset();

    SECTION("Each macro callsite drops past the burst") {
        for (int i = 0; i < 80; ++i) {
            LOG_SNMP_WARN_RL("10.0.0.{}: transport error: timeout", i);
        }
        REQUIRE(RateLimiter::instance().SuppressedTotal() == static_cast<uint64_t>(80 - kLogBurst));
    }

    SECTION("Every component macro compiles and throttles") {
        for (int i = 0; i < 100; ++i) {
            LOG_WARN_RL("Rate limited warn {}", i);
            LOG_SCAN_WARN_RL("Scan warn {}", i);
            LOG_SNMP_WARN_RL("SNMP warn {}", i);
            LOG_SNMP_ERROR_RL("SNMP error {}", i);
        }
        REQUIRE(RateLimiter::instance().SuppressedTotal() == static_cast<uint64_t>(4 * (100 - kLogBurst)));
    }

    RateLimiter::instance().Reset();
}

TEST_CASE("LogManager: Shutdown and re-initialization", "[logging]") {
    LogManager::Initialize("info", false, "");
    LogManager::Shutdown();

    // Loggers come back on first use after Shutdown
    auto logger = LogManager::GetLogger("cache");
    REQUIRE(logger != nullptr);
    REQUIRE(logger->name() == "cache");
}

TEST_CASE("LogManager: Log level parsing", "[logging]") {
    LogManager::Initialize("info", false, "");

    SECTION("Valid log levels") {
        LogManager::SetLogLevel("trace");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::trace);

        LogManager::SetLogLevel("debug");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::debug);

        LogManager::SetLogLevel("warn");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::warn);

        LogManager::SetLogLevel("error");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::err);

        LogManager::SetLogLevel("off");
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::off);
    }

    SECTION("Invalid log level defaults to off") {
        LogManager::SetLogLevel("invalid_level");
        // spdlog::level::from_str returns off for unknown levels
        REQUIRE(LogManager::GetLogger()->level() == spdlog::level::off);
    }
}

TEST_CASE("LogManager: Initialize after early logging applies settings", "[logging]") {
    // Config loading logs before the CLI knows the requested level
    LogManager::Shutdown();
    LOG_DEBUG("logged before Initialize");
    REQUIRE(LogManager::GetLogger("scan")->level() == spdlog::level::warn);

    auto dir = std::filesystem::temp_directory_path() / "netsnmp_logging_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    auto log_path = dir / "netsnmp.log";

    LogManager::Initialize("debug", true, log_path.string());
    REQUIRE(LogManager::GetLogger()->level() == spdlog::level::debug);
    REQUIRE(LogManager::GetLogger("scan")->level() == spdlog::level::debug);
    REQUIRE(LogManager::GetLogger("snmp")->level() == spdlog::level::debug);

    LOG_SCAN_WARN("written to the log file");
    LogManager::Shutdown();

    REQUIRE(std::filesystem::exists(log_path));
    auto contents = read_file_string(log_path);
    REQUIRE(contents.find("written to the log file") != std::string::npos);
    REQUIRE(contents.find("[scan]") != std::string::npos);

    LogManager::Initialize("off", false, "");
    std::filesystem::remove_all(dir);
}
