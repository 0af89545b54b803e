// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_CONSENSUS_MERKLE_HPP
#define CODL3_CONSENSUS_MERKLE_HPP

#include "crypto/sha256.hpp"
#include "primitives/transaction.hpp"
#include <cstdint>
#include <vector>

namespace codl3 {
namespace consensus {

/**
 * Binary Merkle tree over 32-byte leaves
 *
 * Parent = SHA256(left || right). A level with an odd number of nodes pairs
 * its last node with itself. An empty leaf list yields ZERO_HASH and a
 * single leaf is its own root.
 */
Hash256 ComputeMerkleRoot(std::vector<Hash256> leaves);

// Merkle root over the stored transaction hashes, in block order
Hash256 ComputeMerkleRoot(const std::vector<Transaction> &txs);

/**
 * Sibling hashes from leaf `index` up to the root
 *
 * Returns an empty branch for a single-leaf tree. `index` must be < leaves.size().
 */
std::vector<Hash256> ComputeMerkleBranch(std::vector<Hash256> leaves,
                                         size_t index);

// Fold a branch back to a root; bit i of `index` selects the side at level i
Hash256 ComputeRootFromBranch(const Hash256 &leaf,
                              const std::vector<Hash256> &branch,
                              uint64_t index);

} // namespace consensus
} // namespace codl3

#endif // CODL3_CONSENSUS_MERKLE_HPP
