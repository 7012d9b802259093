// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace netsnmp {
namespace util {

// Write data to path atomically: temp file in the same directory, fsync,
// rename over the target. Parent directories are created as needed.
bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode);
bool atomic_write_file(const std::filesystem::path& path, const std::string& data);

// Read whole file. Returns empty on error (logged).
std::vector<uint8_t> read_file(const std::filesystem::path& path);
std::string read_file_string(const std::filesystem::path& path);

bool ensure_directory(const std::filesystem::path& dir);

// Seconds since last modification, or nullopt if the file does not exist.
std::optional<int64_t> file_age_seconds(const std::filesystem::path& path);

// Filesystem locations used by the tool. System-wide when running as root,
// per-user (XDG-style under $HOME) otherwise.
struct RuntimePaths {
  std::filesystem::path conf_dir;
  std::filesystem::path config_file;
  std::filesystem::path cache_dir;
  std::filesystem::path log_file;
};

// Returns empty paths if not root and HOME is unset.
RuntimePaths get_runtime_paths();
RuntimePaths get_runtime_paths(bool system_wide);

}  // namespace util
}  // namespace netsnmp
