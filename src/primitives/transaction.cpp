// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "primitives/transaction.hpp"
#include "util/endian.hpp"

namespace codl3 {

namespace {

void AppendBytes(std::vector<uint8_t> &out, const std::string &s) {
  endian::AppendLE32(out, static_cast<uint32_t>(s.size()));
  out.insert(out.end(), s.begin(), s.end());
}

void AppendBytes(std::vector<uint8_t> &out, const std::vector<uint8_t> &v) {
  endian::AppendLE32(out, static_cast<uint32_t>(v.size()));
  out.insert(out.end(), v.begin(), v.end());
}

} // namespace

std::string TxStatusToString(TxStatus status) {
  switch (status) {
  case TxStatus::PENDING:
    return "pending";
  case TxStatus::CONFIRMED:
    return "confirmed";
  case TxStatus::FAILED:
    return "failed";
  case TxStatus::REVERTED:
    return "reverted";
  }
  return "unknown";
}

Hash256 Transaction::ComputeHash() const {
  std::vector<uint8_t> buf;
  buf.reserve(64 + from.size() + to.size() + payload.size());
  AppendBytes(buf, from);
  AppendBytes(buf, to);
  endian::AppendLE64(buf, value);
  endian::AppendLE64(buf, gas_price);
  endian::AppendLE64(buf, gas_limit);
  endian::AppendLE64(buf, nonce);
  AppendBytes(buf, payload);
  return crypto::Sha256(buf);
}

} // namespace codl3
