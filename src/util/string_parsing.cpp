// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>

namespace torlink {
namespace util {

namespace {

// Digits only: std::stol would otherwise accept "+5", " 5" and "-0"
bool AllDigits(const std::string &str) {
  if (str.empty()) {
    return false;
  }
  for (unsigned char c : str) {
    if (!std::isdigit(c)) {
      return false;
    }
  }
  return true;
}

} // namespace

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  if (str.empty()) {
    return std::nullopt;
  }
  const bool negative = str[0] == '-';
  const std::string digits = negative ? str.substr(1) : str;
  // Bound the length so stoll cannot overflow
  if (!AllDigits(digits) || digits.size() > 12) {
    return std::nullopt;
  }
  try {
    long long value = std::stoll(digits);
    if (negative) {
      value = -value;
    }
    if (value < min || value > max) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  if (!AllDigits(str)) {
    return std::nullopt;
  }
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

bool SplitHostPort(const std::string &host_port, std::string &out_host,
                   uint16_t &out_port) {
  const size_t colon = host_port.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  std::string host = host_port.substr(0, colon);
  auto port = SafeParsePort(host_port.substr(colon + 1));
  if (!port) {
    return false;
  }
  if (host.front() == '[') {
    if (host.size() < 3 || host.back() != ']') {
      return false;
    }
    host = host.substr(1, host.size() - 2);
  }
  out_host = host;
  out_port = *port;
  return true;
}

bool IsBase32Lower(const std::string &str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    const bool letter = c >= 'a' && c <= 'z';
    const bool digit = c >= '2' && c <= '7';
    if (!letter && !digit) {
      return false;
    }
  }
  return true;
}

std::string HexEncode(const std::string &bytes) {
  static const char *kHex = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0f]);
  }
  return out;
}

std::vector<std::string> SplitString(const std::string &str, char delim) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    const size_t pos = str.find(delim, start);
    if (pos == std::string::npos) {
      parts.push_back(str.substr(start));
      return parts;
    }
    parts.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
}

} // namespace util
} // namespace torlink
