// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_UTIL_STRENCODINGS_HPP
#define CODL3_UTIL_STRENCODINGS_HPP

#include "crypto/sha256.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace codl3 {
namespace util {

// Lowercase hex, no prefix
std::string HexStr(const uint8_t *data, size_t len);
std::string HexStr(const std::vector<uint8_t> &data);
std::string HexStr(const Hash256 &hash);

// Accepts an optional "0x" prefix; fails on odd length or non-hex digits
bool ParseHex(const std::string &str, std::vector<uint8_t> &out);

// Exactly 64 hex digits (optional "0x" prefix)
bool ParseHash256(const std::string &str, Hash256 &out);

// Decimal, or hex with a "0x" prefix (Ethereum quantities). Rejects overflow.
bool ParseUInt64(const std::string &str, uint64_t &out);

// ParseUInt64 narrowed to the target range; out-of-range values fail
bool ParseUInt32(const std::string &str, uint32_t &out);
bool ParseNonNegativeInt64(const std::string &str, int64_t &out);

} // namespace util
} // namespace codl3

#endif // CODL3_UTIL_STRENCODINGS_HPP
