// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_UTIL_FILES_HPP
#define CODL3_UTIL_FILES_HPP

#include <filesystem>

namespace codl3 {
namespace util {

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Get default data directory for the node
 * Returns ~/.codl3 on Unix
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace codl3

#endif // CODL3_UTIL_FILES_HPP
