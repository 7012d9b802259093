#include "util/netaddress.hpp"

#include "util/string_parsing.hpp"

#include <cctype>
#include <cstdio>

namespace netsnmp {
namespace util {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

}  // namespace

std::optional<IPv4Octets> ParseIPv4(std::string_view address) {
  auto parts = Split(address, '.');
  if (parts.size() != 4) {
    return std::nullopt;
  }

  IPv4Octets octets{};
  for (size_t i = 0; i < 4; ++i) {
    auto value = SafeParseUInt(parts[i], 3);
    if (!value || *value > 255) {
      return std::nullopt;
    }
    octets[i] = static_cast<uint8_t>(*value);
  }
  return octets;
}

bool IsValidIPv4(std::string_view address) {
  return ParseIPv4(address).has_value();
}

std::string FormatIPv4(const IPv4Octets& octets) {
  char buf[16];
  snprintf(buf, sizeof(buf), "%u.%u.%u.%u", octets[0], octets[1], octets[2], octets[3]);
  return std::string(buf);
}

std::optional<std::string> HexToIPv4(std::string_view hex) {
  std::string_view text = hex;
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
  }

  std::string digits;
  for (char c : text) {
    if (c == ' ' || c == ':' || c == '-' || c == '\t') {
      continue;
    }
    if (HexValue(c) < 0) {
      return std::nullopt;
    }
    digits.push_back(c);
  }
  if (digits.size() != 8) {
    return std::nullopt;
  }

  IPv4Octets octets{};
  for (size_t i = 0; i < 4; ++i) {
    octets[i] = static_cast<uint8_t>(HexValue(digits[2 * i]) * 16 + HexValue(digits[2 * i + 1]));
  }
  return FormatIPv4(octets);
}

std::optional<std::string> RawBytesToIPv4(std::string_view bytes) {
  if (bytes.size() != 4) {
    return std::nullopt;
  }
  IPv4Octets octets{};
  for (size_t i = 0; i < 4; ++i) {
    octets[i] = static_cast<uint8_t>(bytes[i]);
  }
  return FormatIPv4(octets);
}

}  // namespace util
}  // namespace netsnmp
