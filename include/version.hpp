// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace torlink {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Torlink Developers";

inline std::string GetFullVersionString() {
  return "torlink version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *MAGENTA = "\033[1;35m";
} // namespace colors

// Startup banner; `mode` is the stream framing ("direct" or "websocket")
inline std::string GetStartupBanner(const std::string &mode) {
  std::string banner;
  banner += "\n";
  banner += colors::MAGENTA;
  banner += "+-----------------------------------------------+\n";
  banner += "|  torlink - peer transport over onion services |\n";
  banner += "+-----------------------------------------------+\n";

  std::string version_str = GetVersionString();
  banner += "|  Version: " + version_str;
  // Box is 49 chars wide. "|  Version: " is 12, closing "|" is 1
  banner += std::string(36 - version_str.length(), ' ') + "|\n";

  banner += "|  Framing: " + mode;
  banner += std::string(mode.length() < 36 ? 36 - mode.length() : 0, ' ') +
            "|\n";

  banner += "+-----------------------------------------------+\n";
  banner += "|  " + GetCopyrightString();
  banner += std::string(45 - GetCopyrightString().length(), ' ') + "|\n";
  banner += "+-----------------------------------------------+";
  banner += colors::RESET;
  banner += "\n\n";
  return banner;
}

} // namespace torlink
