// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_PRIMITIVES_BLOCK_HPP
#define CODL3_PRIMITIVES_BLOCK_HPP

#include "crypto/sha256.hpp"
#include "primitives/transaction.hpp"
#include "settlement/proof_system.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace codl3 {

/**
 * Block header
 *
 * Serialized little-endian in field order; the producer is length-prefixed.
 * GetHash() is SHA-256 of that serialization and is the value checked
 * against the proof-of-work difficulty.
 */
class BlockHeader {
public:
  uint64_t height{0};
  Hash256 parent_hash{};
  uint64_t timestamp{0};
  Hash256 merkle_root{};
  Address producer;
  uint64_t gas_used{0};
  uint64_t gas_limit{0};
  uint64_t nonce{0};
  uint64_t difficulty{0};    // Required leading zero bytes of GetHash()
  uint64_t anchor_height{0}; // Last anchor-chain height known to the producer

  std::vector<uint8_t> Serialize() const;
  Hash256 GetHash() const;

  // Byte offset of the nonce inside Serialize(); lets the miner patch the
  // nonce in place without re-serializing
  size_t NonceOffset() const;
};

class Block {
public:
  BlockHeader header;
  std::vector<Transaction> transactions;
  std::optional<settlement::ProofBlob> settlement_proof;

  Hash256 GetHash() const { return header.GetHash(); }
  uint64_t GetHeight() const { return header.height; }

  // Σ gas_price * BASE_TX_GAS over the transactions
  uint64_t TotalFees() const;
};

} // namespace codl3

#endif // CODL3_PRIMITIVES_BLOCK_HPP
