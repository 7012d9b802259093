// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 SNMP response parsing

 Purpose
 - Turn raw transport output lines into typed VarBinds before any scanner
   logic looks at them
 - Keep every textual quirk of the transport in one place: leading dots on
   OIDs, "TYPE: " prefixes, surrounding quotes, wrapped multi-line values and
   the three "no such" markers

 Accepted line shapes (net-snmp with -On, with or without -OQ)
   .1.3.6.1.2.1.1.5.0 = STRING: "core-sw1"
   .1.3.6.1.2.1.1.5.0 = "core-sw1"
   .1.3.6.1.4.1.9.9.23.1.2.1.1.4.3.1 = Hex-STRING: C0 A8 01 01
   .1.3.6.1.2.1.47.1.1.1.1.11.1 = No Such Instance currently exists at this OID
   "core-sw1"                                  (value-only output, -Oqv)

 A line that does not start a new VarBind continues the previous value.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netsnmp {
namespace scan {

enum class VarBindKind : uint8_t {
  VALUE,
  NO_SUCH_OBJECT,
  NO_SUCH_INSTANCE,
  END_OF_MIB_VIEW,
};

struct VarBind {
  std::string oid;    // numeric, no leading dot; empty for value-only output
  std::string type;   // "STRING", "Hex-STRING", "INTEGER", ... ; empty if not printed
  std::string value;  // quotes stripped
  VarBindKind kind{VarBindKind::VALUE};

  bool HasValue() const { return kind == VarBindKind::VALUE; }
  bool IsHex() const { return type == "Hex-STRING"; }
};

// Parse one complete VarBind line. Returns nullopt for blank lines.
std::optional<VarBind> ParseVarBind(std::string_view line);

// Parse transport output, joining continuation lines onto the preceding VarBind.
std::vector<VarBind> ParseVarBinds(const std::vector<std::string>& lines);

// Pair each requested OID with its VarBind. Lookup is by OID; value-only
// output (no OIDs printed) is matched by position.
std::vector<std::optional<VarBind>> AlignToRequest(const std::vector<VarBind>& varbinds,
                                                   const std::vector<std::string>& requested_oids);

// "No Such Object ...", "No Such Instance ...", "No more variables left ..."
std::optional<VarBindKind> ClassifyMarker(std::string_view value);

// Remove one pair of surrounding double quotes
std::string StripQuotes(std::string_view value);

// Remove a single leading '.'
std::string NormalizeOid(std::string_view oid);

// True if oid equals prefix or lies underneath it
bool OidHasPrefix(std::string_view oid, std::string_view prefix);

// Numeric sub-identifiers following prefix. nullopt if oid is not under
// prefix or a component is not a number.
std::optional<std::vector<uint32_t>> OidSuffix(std::string_view oid, std::string_view prefix);

// Normalize a MAC address value ("00 1A 2B 3C 4D 5E", "0:1a:2b:3c:4d:5e")
// to "00:1a:2b:3c:4d:5e". Values that are not 6 octets are returned trimmed.
std::string FormatMacAddress(std::string_view value);

}  // namespace scan
}  // namespace netsnmp
