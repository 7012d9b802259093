#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate IPv4 address strings before they reach the scanner
 - Convert between dotted-quad text and raw octets
 - Decode IPv4 addresses that SNMP agents report as hex octet strings

 Key functions:
 - ParseIPv4: strict dotted-quad parser (four 1-3 digit groups, each <= 255)
 - HexToIPv4: "C0 A8 01 01" / "C0A80101" / "0xC0A80101" -> "192.168.1.1"
*/

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace netsnmp {
namespace util {

using IPv4Octets = std::array<uint8_t, 4>;

/**
 * Parse a dotted-quad IPv4 address
 *
 * Accepts exactly four groups of 1-3 decimal digits separated by '.', each
 * group <= 255. No whitespace, no signs, no shorthand forms ("10.1").
 *
 * @return octets in network order, or std::nullopt if malformed
 */
std::optional<IPv4Octets> ParseIPv4(std::string_view address);

bool IsValidIPv4(std::string_view address);

std::string FormatIPv4(const IPv4Octets& octets);

/**
 * Decode a 4-byte IPv4 address written as hex
 *
 * Agents report cdpCacheAddress as an OCTET STRING; net-snmp renders it as
 * "Hex-STRING: C0 A8 01 01". Separators (space, ':', '-') and an optional
 * "0x" prefix are accepted; exactly 8 hex digits must remain.
 *
 * @return "192.168.1.1" style string, or std::nullopt if not 4 bytes of hex
 */
std::optional<std::string> HexToIPv4(std::string_view hex);

/**
 * Decode a raw 4-byte string as IPv4 octets ("\xC0\xA8\x01\x01" -> "192.168.1.1").
 * net-snmp prints an octet string as STRING when all of its bytes are printable.
 */
std::optional<std::string> RawBytesToIPv4(std::string_view bytes);

}  // namespace util
}  // namespace netsnmp
