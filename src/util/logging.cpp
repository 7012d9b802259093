// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <map>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace netsnmp {
namespace util {

namespace {

constexpr std::array<const char*, 4> COMPONENTS = {"default", "scan", "snmp", "cache"};

std::mutex g_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
bool g_initialized = false;

// Must be called with g_mutex held
void CreateLoggers(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  // An unwritable log file must not stop a scan; stderr still works
  std::string file_error;
  if (log_to_file && !log_file_path.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto level = spdlog::level::from_str(log_level);
  for (const char* name : COMPONENTS) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] [%n] %^%l%$: %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    g_loggers[name] = logger;
  }
  g_initialized = true;

  if (!file_error.empty()) {
    g_loggers["default"]->warn("Logging to stderr only, cannot open {}: {}", log_file_path, file_error);
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level, bool log_to_file, const std::string& log_file_path) {
  std::lock_guard<std::mutex> lock(g_mutex);
  CreateLoggers(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  g_initialized = false;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    // First use before Initialize(), or first use after Shutdown()
    CreateLoggers("warn", false, "");
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(lvl);
  }
}

void LogManager::SetComponentLevel(const std::string& component, const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it != g_loggers.end()) {
    it->second->set_level(lvl);
  }
}

}  // namespace util
}  // namespace netsnmp
