// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/snmp_transport.hpp"

namespace netsnmp {
namespace scan {

const char* TransportStatusName(TransportStatus status) {
  switch (status) {
  case TransportStatus::OK:
    return "ok";
  case TransportStatus::NO_RESPONSE:
    return "no-response";
  case TransportStatus::ERROR:
    return "error";
  }
  return "unknown";
}

}  // namespace scan
}  // namespace netsnmp
