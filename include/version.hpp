// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_VERSION_HPP
#define CODL3_VERSION_HPP

#include <string>

namespace codl3 {

constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 1;
constexpr int CLIENT_VERSION_PATCH = 0;

constexpr const char *CLIENT_NAME = "codl3d";
constexpr const char *COPYRIGHT_HOLDERS = "The C0DL3 developers";

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return std::string(CLIENT_NAME) + " version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) 2024 " + std::string(COPYRIGHT_HOLDERS);
}

/**
 * Startup banner printed before the logger takes over stdout
 *
 * `chain_type` is "MAINNET", "TESTNET" or "REGTEST"; regtest and testnet
 * are highlighted so a test node is hard to mistake for a production one.
 */
inline std::string GetStartupBanner(const std::string &chain_type) {
  const char *color = "\033[0m";
  if (chain_type == "TESTNET") {
    color = "\033[1;33m";
  } else if (chain_type == "REGTEST") {
    color = "\033[1;32m";
  }

  const std::string rule(60, '=');
  std::string banner = "\n";
  banner += color;
  banner += rule + "\n";
  banner += "  C0DL3 - merge-mined layer-2 rollup node\n";
  banner += "  " + GetFullVersionString() + " [" + chain_type + "]\n";
  banner += "  " + GetCopyrightString() + "\n";
  banner += rule;
  banner += "\033[0m\n\n";
  return banner;
}

} // namespace codl3

#endif // CODL3_VERSION_HPP
