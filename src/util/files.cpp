// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdlib>

namespace codl3 {
namespace util {

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".codl3";
  }

  // Fallback to current directory
  return std::filesystem::current_path() / ".codl3";
}

} // namespace util
} // namespace codl3
