// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "consensus/merkle.hpp"

namespace codl3 {
namespace consensus {

namespace {

std::vector<Hash256> NextLevel(const std::vector<Hash256> &level) {
  std::vector<Hash256> next;
  next.reserve((level.size() + 1) / 2);
  for (size_t i = 0; i < level.size(); i += 2) {
    const Hash256 &left = level[i];
    const Hash256 &right = (i + 1 < level.size()) ? level[i + 1] : level[i];
    next.push_back(crypto::Sha256Pair(left, right));
  }
  return next;
}

} // namespace

Hash256 ComputeMerkleRoot(std::vector<Hash256> leaves) {
  if (leaves.empty()) {
    return ZERO_HASH;
  }

  while (leaves.size() > 1) {
    leaves = NextLevel(leaves);
  }
  return leaves[0];
}

Hash256 ComputeMerkleRoot(const std::vector<Transaction> &txs) {
  std::vector<Hash256> leaves;
  leaves.reserve(txs.size());
  for (const auto &tx : txs) {
    leaves.push_back(tx.hash);
  }
  return ComputeMerkleRoot(std::move(leaves));
}

std::vector<Hash256> ComputeMerkleBranch(std::vector<Hash256> leaves,
                                         size_t index) {
  std::vector<Hash256> branch;
  while (leaves.size() > 1) {
    size_t sibling = index ^ 1;
    if (sibling >= leaves.size()) {
      sibling = index; // Odd tail pairs with itself
    }
    branch.push_back(leaves[sibling]);
    leaves = NextLevel(leaves);
    index >>= 1;
  }
  return branch;
}

Hash256 ComputeRootFromBranch(const Hash256 &leaf,
                              const std::vector<Hash256> &branch,
                              uint64_t index) {
  Hash256 node = leaf;
  for (const auto &sibling : branch) {
    if (index & 1) {
      node = crypto::Sha256Pair(sibling, node);
    } else {
      node = crypto::Sha256Pair(node, sibling);
    }
    index >>= 1;
  }
  return node;
}

} // namespace consensus
} // namespace codl3
