// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

#define NETSNMP_VERSION_MAJOR 3
#define NETSNMP_VERSION_MINOR 0
#define NETSNMP_VERSION_PATCH 0

namespace netsnmp {

inline std::string GetVersionString() {
  return std::to_string(NETSNMP_VERSION_MAJOR) + "." + std::to_string(NETSNMP_VERSION_MINOR) + "." +
         std::to_string(NETSNMP_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "netsnmp v" + GetVersionString() + " - low-noise SNMP network inventory";
}

inline std::string GetCopyrightString() {
  return "Copyright (c) 2025 The Unicity Foundation\nDistributed under the MIT software license";
}

}  // namespace netsnmp
