// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_UTIL_ENDIAN_HPP
#define CODL3_UTIL_ENDIAN_HPP

#include <cstdint>
#include <vector>

namespace codl3 {
namespace endian {

inline void AppendLE32(std::vector<uint8_t> &out, uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    out.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
}

inline void AppendLE64(std::vector<uint8_t> &out, uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    out.push_back(static_cast<uint8_t>(v >> (8 * i)));
  }
}

inline void WriteLE64(uint8_t *ptr, uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    ptr[i] = static_cast<uint8_t>(v >> (8 * i));
  }
}

inline uint64_t ReadLE64(const uint8_t *ptr) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v = (v << 8) | ptr[i];
  }
  return v;
}

} // namespace endian
} // namespace codl3

#endif // CODL3_UTIL_ENDIAN_HPP
