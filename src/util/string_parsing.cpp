// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace netsnmp {
namespace util {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool AllDigits(std::string_view str) {
  return !str.empty() &&
         std::all_of(str.begin(), str.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

}  // namespace

std::optional<int> SafeParseInt(std::string_view str, int min, int max) {
  // from_chars accepts a leading '-', which we only allow when min < 0
  std::string_view digits = str;
  if (!digits.empty() && digits.front() == '-' && min < 0) {
    digits.remove_prefix(1);
  }
  if (!AllDigits(digits) || digits.size() > 10) {
    return std::nullopt;
  }

  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::optional<uint32_t> SafeParseUInt(std::string_view str, size_t max_digits) {
  if (!AllDigits(str) || str.size() > max_digits) {
    return std::nullopt;
  }
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  if (ec != std::errc() || ptr != str.data() + str.size() || value > UINT32_MAX) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

std::string Trim(std::string_view str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && IsSpace(str[begin])) {
    ++begin;
  }
  while (end > begin && IsSpace(str[end - 1])) {
    --end;
  }
  return std::string(str.substr(begin, end - begin));
}

std::vector<std::string> SplitWhitespace(std::string_view str) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < str.size()) {
    while (i < str.size() && IsSpace(str[i])) {
      ++i;
    }
    size_t start = i;
    while (i < str.size() && !IsSpace(str[i])) {
      ++i;
    }
    if (i > start) {
      out.emplace_back(str.substr(start, i - start));
    }
  }
  return out;
}

std::vector<std::string> Split(std::string_view str, char delim) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t pos = str.find(delim, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(str.substr(start));
      return out;
    }
    out.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }
}

std::string ToLower(std::string_view str) {
  std::string out(str);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

}  // namespace util
}  // namespace netsnmp
