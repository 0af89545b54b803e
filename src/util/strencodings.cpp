// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "util/strencodings.hpp"
#include <limits>

namespace codl3 {
namespace util {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool HasHexPrefix(const std::string &str) {
  return str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
}

} // namespace

std::string HexStr(const uint8_t *data, size_t len) {
  static const char *digits = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0f]);
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t> &data) {
  return HexStr(data.data(), data.size());
}

std::string HexStr(const Hash256 &hash) {
  return HexStr(hash.data(), hash.size());
}

bool ParseHex(const std::string &str, std::vector<uint8_t> &out) {
  size_t start = HasHexPrefix(str) ? 2 : 0;
  if ((str.size() - start) % 2 != 0) {
    return false;
  }

  std::vector<uint8_t> bytes;
  bytes.reserve((str.size() - start) / 2);
  for (size_t i = start; i < str.size(); i += 2) {
    int hi = HexDigit(str[i]);
    int lo = HexDigit(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }

  out = std::move(bytes);
  return true;
}

bool ParseHash256(const std::string &str, Hash256 &out) {
  std::vector<uint8_t> bytes;
  if (!ParseHex(str, bytes) || bytes.size() != out.size()) {
    return false;
  }
  std::copy(bytes.begin(), bytes.end(), out.begin());
  return true;
}

bool ParseUInt64(const std::string &str, uint64_t &out) {
  const bool hex = HasHexPrefix(str);
  const size_t start = hex ? 2 : 0;
  const uint64_t base = hex ? 16 : 10;
  if (str.size() == start) {
    return false;
  }

  uint64_t value = 0;
  for (size_t i = start; i < str.size(); ++i) {
    int digit = hex ? HexDigit(str[i])
                    : (str[i] >= '0' && str[i] <= '9' ? str[i] - '0' : -1);
    if (digit < 0) {
      return false;
    }
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / base) {
      return false;
    }
    value = value * base + static_cast<uint64_t>(digit);
  }

  out = value;
  return true;
}

bool ParseUInt32(const std::string &str, uint32_t &out) {
  uint64_t value = 0;
  if (!ParseUInt64(str, value) ||
      value > std::numeric_limits<uint32_t>::max()) {
    return false;
  }
  out = static_cast<uint32_t>(value);
  return true;
}

bool ParseNonNegativeInt64(const std::string &str, int64_t &out) {
  uint64_t value = 0;
  if (!ParseUInt64(str, value) ||
      value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return false;
  }
  out = static_cast<int64_t>(value);
  return true;
}

} // namespace util
} // namespace codl3
