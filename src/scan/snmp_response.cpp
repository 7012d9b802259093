// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "scan/snmp_response.hpp"

#include "util/string_parsing.hpp"

#include <array>
#include <cctype>
#include <cstdio>

namespace netsnmp {
namespace scan {

namespace {

// Type tags net-snmp prints in front of a value
constexpr std::array<std::string_view, 13> KNOWN_TYPES = {
    "STRING", "Hex-STRING", "INTEGER", "Gauge32", "Counter32", "Counter64", "Timeticks",
    "OID",    "IpAddress",  "BITS",    "Opaque",  "UInteger32", "Network Address",
};

bool IsOidText(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  bool saw_digit = false;
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      saw_digit = true;
    } else if (c != '.') {
      return false;
    }
  }
  return saw_digit;
}

// "<oid> = <rest>" -> {oid, rest}
std::optional<std::pair<std::string_view, std::string_view>> SplitAssignment(std::string_view line) {
  size_t eq = line.find(" = ");
  if (eq == std::string_view::npos) {
    // "<oid> =" with an empty value
    if (line.size() > 2 && line.substr(line.size() - 2) == " =" && IsOidText(line.substr(0, line.size() - 2))) {
      return std::make_pair(line.substr(0, line.size() - 2), std::string_view{});
    }
    return std::nullopt;
  }
  std::string_view oid = line.substr(0, eq);
  if (!IsOidText(oid)) {
    return std::nullopt;
  }
  return std::make_pair(oid, line.substr(eq + 3));
}

VarBind ParseValue(std::string oid, std::string_view rest) {
  VarBind vb;
  vb.oid = std::move(oid);

  std::string text = util::Trim(rest);
  if (auto marker = ClassifyMarker(text)) {
    vb.kind = *marker;
    return vb;
  }

  for (std::string_view type : KNOWN_TYPES) {
    if (text.size() > type.size() && text.compare(0, type.size(), type) == 0 && text[type.size()] == ':') {
      vb.type = std::string(type);
      text = util::Trim(std::string_view(text).substr(type.size() + 1));
      break;
    }
  }
  // "STRING:" with nothing after it is an empty string
  if (text == "\"\"") {
    text.clear();
  }

  if (vb.IsHex()) {
    for (char& c : text) {
      if (c == '\n' || c == '\r') {
        c = ' ';
      }
    }
    vb.value = util::Trim(text);
  } else {
    vb.value = StripQuotes(text);
  }
  return vb;
}

}  // namespace

std::optional<VarBindKind> ClassifyMarker(std::string_view value) {
  if (value.starts_with("No Such Object")) {
    return VarBindKind::NO_SUCH_OBJECT;
  }
  if (value.starts_with("No Such Instance")) {
    return VarBindKind::NO_SUCH_INSTANCE;
  }
  if (value.starts_with("No more variables left")) {
    return VarBindKind::END_OF_MIB_VIEW;
  }
  return std::nullopt;
}

std::string StripQuotes(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return std::string(value.substr(1, value.size() - 2));
  }
  return std::string(value);
}

std::string NormalizeOid(std::string_view oid) {
  if (!oid.empty() && oid.front() == '.') {
    oid.remove_prefix(1);
  }
  return std::string(oid);
}

std::optional<VarBind> ParseVarBind(std::string_view line) {
  std::string trimmed = util::Trim(line);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  if (auto assignment = SplitAssignment(trimmed)) {
    return ParseValue(NormalizeOid(assignment->first), assignment->second);
  }
  return ParseValue(std::string{}, trimmed);
}

std::vector<VarBind> ParseVarBinds(const std::vector<std::string>& lines) {
  // Group raw lines: each group starts at an "<oid> = " line
  std::vector<std::string> groups;
  bool oid_mode = false;

  for (const auto& raw : lines) {
    std::string line = util::Trim(raw);
    if (line.empty()) {
      continue;
    }
    bool starts_varbind = SplitAssignment(line).has_value();
    if (groups.empty()) {
      oid_mode = starts_varbind;
      groups.push_back(std::move(line));
    } else if (!oid_mode || starts_varbind) {
      groups.push_back(std::move(line));
    } else {
      groups.back().append("\n").append(line);
    }
  }

  std::vector<VarBind> varbinds;
  varbinds.reserve(groups.size());
  for (const auto& group : groups) {
    if (auto vb = ParseVarBind(group)) {
      varbinds.push_back(std::move(*vb));
    }
  }
  return varbinds;
}

std::vector<std::optional<VarBind>> AlignToRequest(const std::vector<VarBind>& varbinds,
                                                   const std::vector<std::string>& requested_oids) {
  std::vector<std::optional<VarBind>> aligned(requested_oids.size());

  bool positional = !varbinds.empty() && varbinds.front().oid.empty();
  for (size_t i = 0; i < requested_oids.size(); ++i) {
    if (positional) {
      if (i < varbinds.size()) {
        aligned[i] = varbinds[i];
      }
      continue;
    }
    const std::string wanted = NormalizeOid(requested_oids[i]);
    for (const auto& vb : varbinds) {
      if (vb.oid == wanted) {
        aligned[i] = vb;
        break;
      }
    }
  }
  return aligned;
}

bool OidHasPrefix(std::string_view oid, std::string_view prefix) {
  if (!oid.empty() && oid.front() == '.')
    oid.remove_prefix(1);
  if (!prefix.empty() && prefix.front() == '.')
    prefix.remove_prefix(1);

  if (!oid.starts_with(prefix)) {
    return false;
  }
  return oid.size() == prefix.size() || oid[prefix.size()] == '.';
}

std::optional<std::vector<uint32_t>> OidSuffix(std::string_view oid, std::string_view prefix) {
  if (!OidHasPrefix(oid, prefix)) {
    return std::nullopt;
  }
  if (!oid.empty() && oid.front() == '.')
    oid.remove_prefix(1);
  if (!prefix.empty() && prefix.front() == '.')
    prefix.remove_prefix(1);

  std::vector<uint32_t> suffix;
  if (oid.size() == prefix.size()) {
    return suffix;
  }
  for (const auto& part : util::Split(oid.substr(prefix.size() + 1), '.')) {
    auto value = util::SafeParseUInt(part);
    if (!value) {
      return std::nullopt;
    }
    suffix.push_back(*value);
  }
  return suffix;
}

std::string FormatMacAddress(std::string_view value) {
  std::string text = util::Trim(value);
  std::vector<std::string> groups;
  for (auto& token : util::SplitWhitespace(text)) {
    for (auto& part : util::Split(token, ':')) {
      if (!part.empty()) {
        groups.push_back(part);
      }
    }
  }

  if (groups.size() != 6) {
    return text;
  }

  std::string out;
  for (const auto& group : groups) {
    if (group.size() > 2 || !std::isxdigit(static_cast<unsigned char>(group[0])) ||
        (group.size() == 2 && !std::isxdigit(static_cast<unsigned char>(group[1])))) {
      return text;
    }
    unsigned byte = 0;
    std::sscanf(group.c_str(), "%x", &byte);
    char buf[4];
    std::snprintf(buf, sizeof(buf), "%02x", byte & 0xFF);
    if (!out.empty()) {
      out.push_back(':');
    }
    out.append(buf);
  }
  return out;
}

}  // namespace scan
}  // namespace netsnmp
