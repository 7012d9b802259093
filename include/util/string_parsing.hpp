// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netsnmp {
namespace util {

// Parse a decimal integer in [min, max]. Rejects empty input, signs,
// whitespace and trailing characters.
std::optional<int> SafeParseInt(std::string_view str, int min, int max);

// Parse a non-negative decimal integer of at most max_digits digits.
std::optional<uint32_t> SafeParseUInt(std::string_view str, size_t max_digits = 10);

// Strip leading/trailing ASCII whitespace.
std::string Trim(std::string_view str);

// Split on runs of ASCII whitespace; no empty tokens.
std::vector<std::string> SplitWhitespace(std::string_view str);

// Split on a single delimiter; keeps empty tokens.
std::vector<std::string> Split(std::string_view str, char delim);

std::string ToLower(std::string_view str);

// Case-insensitive substring test. Empty needle matches everything.
bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

}  // namespace util
}  // namespace netsnmp
