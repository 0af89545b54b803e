// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_PRIMITIVES_TRANSACTION_HPP
#define CODL3_PRIMITIVES_TRANSACTION_HPP

#include "crypto/sha256.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace codl3 {

// Account address as submitted by clients ("0x..." hex string)
using Address = std::string;

// Gas charged per transaction (flat)
static constexpr uint64_t BASE_TX_GAS = 21000;

// Highest gas price whose fee still fits in 64 bits
static constexpr uint64_t MAX_GAS_PRICE = UINT64_MAX / BASE_TX_GAS;

enum class TxStatus { PENDING, CONFIRMED, FAILED, REVERTED };

std::string TxStatusToString(TxStatus status);

/**
 * Rollup transaction
 *
 * Created by submission in PENDING state. The only mutation is the status
 * transition applied when a block including it is accepted; a CONFIRMED
 * transaction is never modified again.
 */
struct Transaction {
  Hash256 hash{};
  Address from;
  Address to;
  uint64_t value{0};
  uint64_t gas_price{0};
  uint64_t gas_limit{0};
  uint64_t nonce{0};
  std::vector<uint8_t> payload;
  std::vector<uint8_t> signature;
  TxStatus status{TxStatus::PENDING};

  // Hash over every field except hash, signature and status
  Hash256 ComputeHash() const;

  // Fee charged when included in a block
  uint64_t Fee() const { return gas_price * BASE_TX_GAS; }
};

} // namespace codl3

#endif // CODL3_PRIMITIVES_TRANSACTION_HPP
