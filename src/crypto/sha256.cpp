// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "crypto/sha256.hpp"
#include <algorithm>
#include <openssl/sha.h>

namespace codl3 {
namespace crypto {

Hash256 Sha256(const uint8_t *data, size_t len) {
  Hash256 out;
  SHA256(data, len, out.data());
  return out;
}

Hash256 Sha256(const std::vector<uint8_t> &data) {
  return Sha256(data.data(), data.size());
}

Hash256 Sha256(const std::string &data) {
  return Sha256(reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

Hash256 Sha256Pair(const Hash256 &left, const Hash256 &right) {
  uint8_t buf[64];
  std::copy(left.begin(), left.end(), buf);
  std::copy(right.begin(), right.end(), buf + 32);
  return Sha256(buf, sizeof(buf));
}

} // namespace crypto
} // namespace codl3
