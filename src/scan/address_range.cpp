// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/address_range.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace netsnmp {
namespace scan {

namespace {

// "A.B.C" -> first three octets
std::optional<util::IPv4Octets> ParsePrefix(std::string_view prefix) {
  auto parts = util::Split(prefix, '.');
  if (parts.size() != 3) {
    return std::nullopt;
  }
  util::IPv4Octets octets{};
  for (size_t i = 0; i < 3; ++i) {
    auto value = util::SafeParseUInt(parts[i], 3);
    if (!value || *value > 255) {
      return std::nullopt;
    }
    octets[i] = static_cast<uint8_t>(*value);
  }
  return octets;
}

void Fail(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
}

}  // namespace

std::string AddressRange::Iterator::operator*() const {
  if (!literal_.empty()) {
    return literal_;
  }
  util::IPv4Octets octets = prefix_;
  octets[3] = static_cast<uint8_t>(octet_);
  return util::FormatIPv4(octets);
}

std::optional<AddressRange> AddressRange::Parse(std::string_view spec, std::string* error) {
  const std::string text(spec);

  if (text.empty()) {
    Fail(error, "empty network spec");
    return std::nullopt;
  }

  // CIDR
  if (size_t slash = text.find('/'); slash != std::string::npos) {
    auto base = util::ParseIPv4(std::string_view(text).substr(0, slash));
    if (!base) {
      Fail(error, "invalid network address in '" + text + "'");
      return std::nullopt;
    }
    auto mask = util::SafeParseUInt(std::string_view(text).substr(slash + 1), 2);
    if (!mask) {
      Fail(error, "invalid mask in '" + text + "'");
      return std::nullopt;
    }
    if (*mask != 24) {
      Fail(error, "unsupported mask /" + std::to_string(*mask) + " in '" + text + "' (only /24 is supported)");
      return std::nullopt;
    }
    if ((*base)[3] != 0) {
      Fail(error, "'" + text + "' is not a /24 network address (last octet must be 0)");
      return std::nullopt;
    }
    return AddressRange(text, *base, MIN_HOST_OCTET, MAX_HOST_OCTET);
  }

  // Range: split on the last '.' before the hyphen
  if (size_t dash = text.find('-'); dash != std::string::npos) {
    size_t dot = text.rfind('.', dash);
    if (dot == std::string::npos) {
      Fail(error, "malformed range '" + text + "'");
      return std::nullopt;
    }
    auto prefix = ParsePrefix(std::string_view(text).substr(0, dot));
    auto start = util::SafeParseUInt(std::string_view(text).substr(dot + 1, dash - dot - 1), 3);
    auto stop = util::SafeParseUInt(std::string_view(text).substr(dash + 1), 3);
    if (!prefix || !start || !stop) {
      Fail(error, "malformed range '" + text + "'");
      return std::nullopt;
    }
    if (*start < MIN_HOST_OCTET || *stop > MAX_HOST_OCTET || *start > *stop) {
      Fail(error, "range '" + text + "' must satisfy 1 <= start <= end <= 254");
      return std::nullopt;
    }
    return AddressRange(text, *prefix, *start, *stop);
  }

  auto octets = util::ParseIPv4(text);
  if (!octets) {
    Fail(error, "unrecognized network spec '" + text + "'");
    return std::nullopt;
  }
  return AddressRange(text, *octets, (*octets)[3], (*octets)[3], true);
}

std::vector<std::string> ExpandAll(const std::vector<std::string>& specs, std::vector<std::string>* rejected) {
  std::vector<std::string> addresses;
  for (const auto& spec : specs) {
    std::string error;
    auto range = AddressRange::Parse(spec, &error);
    if (!range) {
      LOG_SCAN_ERROR("Skipping network spec: {}", error);
      if (rejected) {
        rejected->push_back(spec);
      }
      continue;
    }
    LOG_SCAN_DEBUG("Network spec {} expands to {} addresses", spec, range->size());
    addresses.reserve(addresses.size() + range->size());
    addresses.insert(addresses.end(), range->begin(), range->end());
  }
  return addresses;
}

}  // namespace scan
}  // namespace netsnmp
