// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace topowatch {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Full version info for display
inline std::string GetFullVersionString() {
  return "topowatch version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *CYAN = "\033[1;36m";   // Daemon
constexpr const char *YELLOW = "\033[1;33m"; // One-shot round
} // namespace colors

// Startup banner with run mode ("DAEMON" or "ONE-SHOT")
inline std::string GetStartupBanner(const std::string &mode) {
  const char *color = mode == "ONE-SHOT" ? colors::YELLOW : colors::CYAN;

  std::string banner;
  banner += "\n";
  banner += color;
  banner +=
      "+-------------------------------------------------------------+\n";
  banner +=
      "|   _                                 _       _               |\n";
  banner +=
      "|  | |_ ___  _ __   _____      ____ _| |_ ___| |__            |\n";
  banner +=
      "|  | __/ _ \\| '_ \\ / _ \\ \\ /\\ / / _` | __/ __| '_ \\           |\n";
  banner +=
      "|  | || (_) | |_) | (_) \\ V  V / (_| | || (__| | | |          |\n";
  banner +=
      "|   \\__\\___/| .__/ \\___/ \\_/\\_/ \\__,_|\\__\\___|_| |_|          |\n";
  banner +=
      "|            |_|                                              |\n";
  banner +=
      "|            Network Discovery and Topology Engine            |\n";
  banner +=
      "+-------------------------------------------------------------+\n";
  // Box is 63 chars wide. "|  Version: " = 12 chars, closing "|" = 1
  std::string version_str = GetVersionString();
  banner += "|  Version: " + version_str;
  banner += std::string(50 - version_str.length(), ' ') + "|\n";

  banner += "|  Mode:    " + mode;
  banner += std::string(50 - mode.length(), ' ') + "|\n";

  banner +=
      "+-------------------------------------------------------------+\n";
  banner += "|  " + GetCopyrightString();
  banner += std::string(59 - GetCopyrightString().length(), ' ') + "|\n";
  banner += "+-------------------------------------------------------------+";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace topowatch
