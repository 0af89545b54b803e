// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_CRYPTO_SHA256_HPP
#define CODL3_CRYPTO_SHA256_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace codl3 {

// 32-byte digest; used for block, transaction and Merkle hashes
using Hash256 = std::array<uint8_t, 32>;

inline constexpr Hash256 ZERO_HASH{};

namespace crypto {

// Single SHA-256 (OpenSSL libcrypto)
Hash256 Sha256(const uint8_t *data, size_t len);
Hash256 Sha256(const std::vector<uint8_t> &data);
Hash256 Sha256(const std::string &data);

// SHA-256 of the 64-byte concatenation left || right
Hash256 Sha256Pair(const Hash256 &left, const Hash256 &right);

} // namespace crypto
} // namespace codl3

#endif // CODL3_CRYPTO_SHA256_HPP
