// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace netsnmp {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "scan", "snmp", "cache"). All loggers
 * share the same sinks: stderr, plus an optional append-only log file.
 *
 * Thread-safety: All methods are thread-safe. Logger access is protected
 * by a mutex for concurrent use from scan workers. Loggers created lazily
 * by an early LOG_* call are replaced by the next Initialize().
 */
class LogManager {
public:
  // (Re)build all component loggers with the given level and sinks. Each call
  // replaces the previous configuration, including the defaults picked by
  // GetLogger() when it runs first.
  static void Initialize(const std::string& log_level = "warn", bool log_to_file = false,
                         const std::string& log_file_path = "netsnmp.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component. Unknown components get the default logger.
  // Auto-initializes if not initialized.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component (scan, snmp, cache, default).
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace netsnmp

// Convenience macros for logging
#define LOG_TRACE(...) netsnmp::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) netsnmp::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) netsnmp::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) netsnmp::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) netsnmp::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_SCAN_TRACE(...) netsnmp::util::LogManager::GetLogger("scan")->trace(__VA_ARGS__)
#define LOG_SCAN_DEBUG(...) netsnmp::util::LogManager::GetLogger("scan")->debug(__VA_ARGS__)
#define LOG_SCAN_INFO(...) netsnmp::util::LogManager::GetLogger("scan")->info(__VA_ARGS__)
#define LOG_SCAN_WARN(...) netsnmp::util::LogManager::GetLogger("scan")->warn(__VA_ARGS__)
#define LOG_SCAN_ERROR(...) netsnmp::util::LogManager::GetLogger("scan")->error(__VA_ARGS__)

#define LOG_SNMP_TRACE(...) netsnmp::util::LogManager::GetLogger("snmp")->trace(__VA_ARGS__)
#define LOG_SNMP_DEBUG(...) netsnmp::util::LogManager::GetLogger("snmp")->debug(__VA_ARGS__)
#define LOG_SNMP_INFO(...) netsnmp::util::LogManager::GetLogger("snmp")->info(__VA_ARGS__)
#define LOG_SNMP_WARN(...) netsnmp::util::LogManager::GetLogger("snmp")->warn(__VA_ARGS__)
#define LOG_SNMP_ERROR(...) netsnmp::util::LogManager::GetLogger("snmp")->error(__VA_ARGS__)

#define LOG_CACHE_DEBUG(...) netsnmp::util::LogManager::GetLogger("cache")->debug(__VA_ARGS__)
#define LOG_CACHE_INFO(...) netsnmp::util::LogManager::GetLogger("cache")->info(__VA_ARGS__)
#define LOG_CACHE_WARN(...) netsnmp::util::LogManager::GetLogger("cache")->warn(__VA_ARGS__)
#define LOG_CACHE_ERROR(...) netsnmp::util::LogManager::GetLogger("cache")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// A /24 sweep against a subnet where snmpget misbehaves (wrong binary, broken
// agent, MIB parse errors) produces the same warning once per address and
// credential. Per-callsite token buckets keep the log readable.
//
// Rate limits (token bucket):
// - 50 messages per minute per callsite
// - The first message admitted after a drop is preceded by a count of the
//   messages that were dropped
//
// When to use:
// - Transport errors reported by the SNMP or liveness collaborators
// - Malformed lines in walk output
// - Not for batch summaries or configuration errors (always logged)

#include "util/rate_limiter.hpp"

namespace netsnmp {
namespace util {

inline constexpr int kLogBurst = 50;
inline constexpr std::chrono::seconds kLogPeriod{60};

}  // namespace util
}  // namespace netsnmp

// Helper macro to generate callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define NETSNMP_LOG_RL_(component, lvl, ...)                                                                           \
  do {                                                                                                                 \
    const auto admission_ =                                                                                            \
        netsnmp::util::RateLimiter::instance().Admit(CALLSITE_KEY_, netsnmp::util::kLogBurst, netsnmp::util::kLogPeriod); \
    if (admission_.allowed) {                                                                                          \
      auto logger_ = netsnmp::util::LogManager::GetLogger(component);                                                  \
      if (admission_.suppressed > 0) {                                                                                 \
        logger_->log(lvl, "{} similar messages suppressed", admission_.suppressed);                                    \
      }                                                                                                                \
      logger_->log(lvl, __VA_ARGS__);                                                                                  \
    }                                                                                                                  \
  } while (0)

#define LOG_WARN_RL(...) NETSNMP_LOG_RL_("default", spdlog::level::warn, __VA_ARGS__)
#define LOG_SCAN_WARN_RL(...) NETSNMP_LOG_RL_("scan", spdlog::level::warn, __VA_ARGS__)
#define LOG_SNMP_WARN_RL(...) NETSNMP_LOG_RL_("snmp", spdlog::level::warn, __VA_ARGS__)
#define LOG_SNMP_ERROR_RL(...) NETSNMP_LOG_RL_("snmp", spdlog::level::err, __VA_ARGS__)
