// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_UTIL_SATURATING_HPP
#define CODL3_UTIL_SATURATING_HPP

#include <cstdint>
#include <limits>

namespace codl3 {
namespace util {

// Amount counters clamp instead of wrapping
inline uint64_t SaturatingAdd(uint64_t a, uint64_t b) {
  if (a > std::numeric_limits<uint64_t>::max() - b) {
    return std::numeric_limits<uint64_t>::max();
  }
  return a + b;
}

inline uint64_t SaturatingSub(uint64_t a, uint64_t b) {
  return a > b ? a - b : 0;
}

} // namespace util
} // namespace codl3

#endif // CODL3_UTIL_SATURATING_HPP
