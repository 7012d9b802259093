// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 AddressRange - expansion of a network spec into IPv4 addresses

 Accepted forms
 - "10.0.0.7"          single address, yields the input text unchanged
 - "10.0.0.20-30"      inclusive last-octet range, 1 <= start <= end <= 254
 - "10.0.0.0/24"       10.0.0.1 .. 10.0.0.254

 Other mask lengths are rejected, not approximated. The range is a value:
 iterating it twice yields the same addresses, and size() is known up front.
*/

#include "util/netaddress.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

namespace netsnmp {
namespace scan {

class AddressRange {
public:
  // Varying octet bounds for range and CIDR forms
  static constexpr uint32_t MIN_HOST_OCTET = 1;
  static constexpr uint32_t MAX_HOST_OCTET = 254;

  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = std::string;

    Iterator() = default;
    Iterator(util::IPv4Octets prefix, uint32_t octet, std::string literal = {})
        : prefix_(prefix), octet_(octet), literal_(std::move(literal)) {}

    std::string operator*() const;
    Iterator& operator++() {
      ++octet_;
      return *this;
    }
    Iterator operator++(int) {
      Iterator tmp = *this;
      ++octet_;
      return tmp;
    }
    bool operator==(const Iterator& other) const { return octet_ == other.octet_ && prefix_ == other.prefix_; }
    bool operator!=(const Iterator& other) const { return !(*this == other); }

  private:
    util::IPv4Octets prefix_{};
    uint32_t octet_{0};
    // Non-empty for the single-address form
    std::string literal_;
  };

  // Parse a spec. On failure returns std::nullopt and, if error is non-null,
  // stores a message naming the spec.
  static std::optional<AddressRange> Parse(std::string_view spec, std::string* error = nullptr);

  Iterator begin() const { return Iterator(prefix_, first_, single_ ? spec_ : std::string()); }
  Iterator end() const { return Iterator(prefix_, last_ + 1); }
  size_t size() const { return last_ - first_ + 1; }

  std::string front() const { return *begin(); }
  std::string back() const { return *Iterator(prefix_, last_, single_ ? spec_ : std::string()); }

  const std::string& spec() const { return spec_; }

  std::vector<std::string> ToVector() const { return std::vector<std::string>(begin(), end()); }

private:
  AddressRange(std::string spec, util::IPv4Octets prefix, uint32_t first, uint32_t last, bool single = false)
      : spec_(std::move(spec)), prefix_(prefix), first_(first), last_(last), single_(single) {}

  std::string spec_;
  util::IPv4Octets prefix_{};
  uint32_t first_{0};
  uint32_t last_{0};
  bool single_{false};
};

// Expand every spec and concatenate in spec order. Specs that fail to parse
// are logged, appended to rejected (if non-null) and skipped.
std::vector<std::string> ExpandAll(const std::vector<std::string>& specs, std::vector<std::string>* rejected = nullptr);

}  // namespace scan
}  // namespace netsnmp
