// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace netsnmp {
namespace util {

namespace {

bool sync_directory(const std::filesystem::path& dir) {
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

std::string random_suffix() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<uint64_t> dis;
  char buf[20];
  snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dis(gen)));
  return std::string(buf);
}

}  // anonymous namespace

bool atomic_write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    LOG_ERROR("atomic_write_file: cannot create directory {}", parent.string());
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  // O_EXCL|O_NOFOLLOW: /var/cache/netsnmp may be shared, never follow a planted link
  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW, mode);
  if (fd < 0) {
    LOG_ERROR("atomic_write_file: cannot create {}: {}", temp_path.string(), std::strerror(errno));
    return false;
  }

  auto fail = [&](const char* what) {
    LOG_ERROR("atomic_write_file: {} failed for {}: {}", what, temp_path.string(), std::strerror(errno));
    close(fd);
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return false;
  };

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n <= 0) {
      return fail("write");
    }
    written += static_cast<size_t>(n);
  }
  if (fsync(fd) != 0) {
    return fail("fsync");
  }
  close(fd);

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    LOG_ERROR("atomic_write_file: rename {} -> {} failed: {}", temp_path.string(), path.string(), ec.message());
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  // Rename is durable only once the directory entry is synced
  if (!parent.empty() && !sync_directory(parent)) {
    LOG_WARN("atomic_write_file: fsync of directory {} failed: {}", parent.string(), std::strerror(errno));
  }
  return true;
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data, int mode) {
  std::vector<uint8_t> vec(data.begin(), data.end());
  return atomic_write_file(path, vec, mode);
}

bool atomic_write_file(const std::filesystem::path& path, const std::string& data) {
  return atomic_write_file(path, data, 0644);
}

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file) {
    LOG_ERROR("read_file: cannot open {}: {}", path.string(), std::strerror(errno));
    return {};
  }

  std::streamsize size = static_cast<std::streamsize>(file.tellg());
  if (size < 0) {
    LOG_ERROR("read_file: cannot determine size of {}", path.string());
    return {};
  }

  // A cache of a few thousand devices is well under 1MB
  constexpr std::streamsize MAX_FILE_SIZE = 64 * 1024 * 1024;
  if (size > MAX_FILE_SIZE) {
    LOG_ERROR("read_file: {} is {}MB, refusing to read more than {}MB", path.string(), size / 1024 / 1024,
              MAX_FILE_SIZE / 1024 / 1024);
    return {};
  }

  std::vector<uint8_t> data(static_cast<size_t>(size));
  file.seekg(0);
  file.read(reinterpret_cast<char*>(data.data()), size);
  if (!file) {
    LOG_ERROR("read_file: short read on {}", path.string());
    return {};
  }
  return data;
}

std::string read_file_string(const std::filesystem::path& path) {
  auto data = read_file(path);
  return std::string(data.begin(), data.end());
}

bool ensure_directory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

std::optional<int64_t> file_age_seconds(const std::filesystem::path& path) {
  std::error_code ec;
  auto mtime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return std::nullopt;
  }
  auto age = std::filesystem::file_time_type::clock::now() - mtime;
  return std::chrono::duration_cast<std::chrono::seconds>(age).count();
}

RuntimePaths get_runtime_paths(bool system_wide) {
  RuntimePaths paths;
  if (system_wide) {
    paths.conf_dir = "/etc/netsnmp";
    paths.cache_dir = "/var/cache/netsnmp";
    paths.log_file = "/var/log/netsnmp.log";
  } else {
    const char* home = std::getenv("HOME");
    if (!home || *home == '\0') {
      LOG_ERROR("get_runtime_paths: HOME environment variable not set");
      return paths;
    }
    std::filesystem::path home_dir(home);
    paths.conf_dir = home_dir / ".config" / "netsnmp";
    paths.cache_dir = home_dir / ".cache" / "netsnmp";
    paths.log_file = home_dir / ".cache" / "netsnmp.log";
  }
  paths.config_file = paths.conf_dir / "netsnmp.conf";
  return paths;
}

RuntimePaths get_runtime_paths() {
  return get_runtime_paths(geteuid() == 0);
}

}  // namespace util
}  // namespace netsnmp
