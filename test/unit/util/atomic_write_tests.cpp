// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for atomic file writes and runtime paths (files.cpp)

#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

using namespace netsnmp::util;

namespace {

std::filesystem::path FreshDir(const char* name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

std::string Slurp(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}  // namespace

TEST_CASE("Atomic write: O_NOFOLLOW symlink protection", "[atomic_write][security]") {
    auto test_dir = FreshDir("netsnmp_atomic_test_symlink");

    SECTION("Write through a symlink leaves the link target untouched") {
        auto real_file = test_dir / "real.txt";
        auto symlink = test_dir / "link.txt";
        {
            std::ofstream f(real_file);
            f << "original";
        }
        std::filesystem::create_symlink(real_file, symlink);

        // rename() replaces the link itself, never writes through it
        REQUIRE(atomic_write_file(symlink, std::string("replacement")));
        REQUIRE(Slurp(real_file) == "original");
        REQUIRE_FALSE(std::filesystem::is_symlink(symlink));
        REQUIRE(Slurp(symlink) == "replacement");
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: File permissions", "[atomic_write][permissions]") {
    auto test_dir = FreshDir("netsnmp_atomic_test_perms");

    SECTION("File created with specified mode") {
        auto file_path = test_dir / "test_0600.dat";
        std::vector<uint8_t> data = {0x01, 0x02, 0x03};

        REQUIRE(atomic_write_file(file_path, data, 0600));

        struct stat st;
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("String overload defaults to a readable file") {
        auto file_path = test_dir / "test_default.json";

        REQUIRE(atomic_write_file(file_path, std::string("{}")));

        struct stat st;
        REQUIRE(stat(file_path.c_str(), &st) == 0);
        // Mode might be affected by umask, but owner-read always survives
        REQUIRE((st.st_mode & 0400) != 0);
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: Overwrite safety", "[atomic_write][overwrite]") {
    auto test_dir = FreshDir("netsnmp_atomic_test_overwrite");
    auto file_path = test_dir / "hosts.json";

    REQUIRE(atomic_write_file(file_path, std::string("first version")));
    REQUIRE(Slurp(file_path) == "first version");

    REQUIRE(atomic_write_file(file_path, std::string("second")));
    REQUIRE(Slurp(file_path) == "second");

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: Temp file uniqueness", "[atomic_write][tempfile]") {
    auto test_dir = FreshDir("netsnmp_atomic_test_tempfile");

    SECTION("Concurrent writes to one target all succeed") {
        auto file_path = test_dir / "shared.json";
        std::vector<std::thread> threads;
        std::atomic<int> ok{0};
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&, i]() {
                if (atomic_write_file(file_path, "writer " + std::to_string(i))) {
                    ok++;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        REQUIRE(ok == 8);
        REQUIRE(Slurp(file_path).rfind("writer ", 0) == 0);
    }

    SECTION("No temp files left behind after successful write") {
        REQUIRE(atomic_write_file(test_dir / "a.json", std::string("a")));
        REQUIRE(atomic_write_file(test_dir / "b.json", std::string("b")));

        int count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(test_dir)) {
            REQUIRE(entry.path().string().find(".tmp.") == std::string::npos);
            ++count;
        }
        REQUIRE(count == 2);
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: Readonly directory", "[atomic_write][readonly]") {
    // root ignores directory permissions
    if (geteuid() == 0) {
        SKIP("running as root");
    }

    auto test_dir = FreshDir("netsnmp_atomic_test_readonly");
    std::filesystem::permissions(test_dir, std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec);

    REQUIRE_FALSE(atomic_write_file(test_dir / "blocked.json", std::string("x")));

    std::filesystem::permissions(test_dir, std::filesystem::perms::owner_all);
    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: Directory creation", "[atomic_write][mkdir]") {
    auto test_dir = FreshDir("netsnmp_atomic_test_mkdir");
    auto nested = test_dir / "cache" / "netsnmp" / "hosts.json";

    REQUIRE(atomic_write_file(nested, std::string("[]")));
    REQUIRE(std::filesystem::exists(nested));
    REQUIRE(ensure_directory(test_dir / "cache"));

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: read_file", "[atomic_write][read]") {
    auto test_dir = FreshDir("netsnmp_atomic_test_read");

    SECTION("Round trip through read_file_string") {
        auto path = test_dir / "netsnmp.conf";
        REQUIRE(atomic_write_file(path, std::string("subnets=\"10.0.0.0/24\"\n")));
        REQUIRE(read_file_string(path) == "subnets=\"10.0.0.0/24\"\n");
        REQUIRE(read_file(path).size() == 22);
    }

    SECTION("Empty file reads back empty") {
        auto path = test_dir / "empty";
        REQUIRE(atomic_write_file(path, std::string()));
        REQUIRE(read_file_string(path).empty());
    }

    SECTION("Missing file reads back empty") {
        REQUIRE(read_file(test_dir / "missing").empty());
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Atomic write: file_age_seconds", "[atomic_write][age]") {
    auto test_dir = FreshDir("netsnmp_atomic_test_age");
    auto path = test_dir / "hosts.json";

    REQUIRE_FALSE(file_age_seconds(path).has_value());

    REQUIRE(atomic_write_file(path, std::string("{}")));
    auto age = file_age_seconds(path);
    REQUIRE(age.has_value());
    REQUIRE(*age >= 0);
    REQUIRE(*age < 60);

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Runtime paths", "[atomic_write][paths]") {
    SECTION("System-wide layout") {
        auto paths = get_runtime_paths(true);
        REQUIRE(paths.conf_dir == "/etc/netsnmp");
        REQUIRE(paths.config_file == "/etc/netsnmp/netsnmp.conf");
        REQUIRE(paths.cache_dir == "/var/cache/netsnmp");
        REQUIRE(paths.log_file == "/var/log/netsnmp.log");
    }

    SECTION("Per-user layout lives under HOME") {
        const char* home = std::getenv("HOME");
        if (home == nullptr || *home == '\0') {
            SKIP("HOME not set");
        }
        auto paths = get_runtime_paths(false);
        std::filesystem::path home_dir(home);
        REQUIRE(paths.config_file == home_dir / ".config" / "netsnmp" / "netsnmp.conf");
        REQUIRE(paths.cache_dir == home_dir / ".cache" / "netsnmp");
    }
}
