// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_MERGE_MINING_AUX_PROOF_HPP
#define CODL3_MERGE_MINING_AUX_PROOF_HPP

#include "crypto/sha256.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace codl3 {
namespace merge_mining {

// Marker preceding the aux commitment in the anchor coinbase
constexpr std::array<uint8_t, 4> AUXPOW_MAGIC = {0xfa, 0xbe, 0x6d, 0x6d};

/**
 * Auxiliary proof of work
 *
 * Links a native block hash to an anchor-chain block:
 *
 *   aux_root   = MerkleRoot(native block hashes since the last anchor block)
 *   commitment = SHA256(AUXPOW_MAGIC || aux_root || anchor_block_hash)
 *
 * `branch`/`index` prove that `native_block_hash` is a leaf under
 * `aux_root`.
 */
struct AuxProof {
  Hash256 native_block_hash{};
  Hash256 anchor_block_hash{};
  Hash256 aux_root{};
  std::vector<Hash256> branch;
  uint64_t index{0};
  Hash256 commitment{};

  // Recompute the branch root and commitment and compare
  bool Verify() const;
};

Hash256 ComputeAuxCommitment(const Hash256 &aux_root,
                             const Hash256 &anchor_block_hash);

/**
 * Build a proof for `native_hashes.back()`
 *
 * @throws std::invalid_argument if `native_hashes` is empty
 */
AuxProof BuildAuxProof(const std::vector<Hash256> &native_hashes,
                       const Hash256 &anchor_block_hash);

/**
 * Anchor-chain block observed by the merge-mining coordinator
 */
struct AnchorBlockRecord {
  uint64_t height{0};
  Hash256 hash{};
  uint64_t timestamp{0};
  AuxProof aux_pow;
};

} // namespace merge_mining
} // namespace codl3

#endif // CODL3_MERGE_MINING_AUX_PROOF_HPP
