// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "merge_mining/aux_proof.hpp"
#include "consensus/merkle.hpp"
#include <stdexcept>

namespace codl3 {
namespace merge_mining {

Hash256 ComputeAuxCommitment(const Hash256 &aux_root,
                             const Hash256 &anchor_block_hash) {
  std::vector<uint8_t> preimage(AUXPOW_MAGIC.begin(), AUXPOW_MAGIC.end());
  preimage.insert(preimage.end(), aux_root.begin(), aux_root.end());
  preimage.insert(preimage.end(), anchor_block_hash.begin(),
                  anchor_block_hash.end());
  return crypto::Sha256(preimage);
}

bool AuxProof::Verify() const {
  Hash256 root =
      consensus::ComputeRootFromBranch(native_block_hash, branch, index);
  if (root != aux_root) {
    return false;
  }
  return commitment == ComputeAuxCommitment(aux_root, anchor_block_hash);
}

AuxProof BuildAuxProof(const std::vector<Hash256> &native_hashes,
                       const Hash256 &anchor_block_hash) {
  if (native_hashes.empty()) {
    throw std::invalid_argument("aux proof needs at least one native block");
  }

  AuxProof proof;
  proof.index = native_hashes.size() - 1;
  proof.native_block_hash = native_hashes.back();
  proof.anchor_block_hash = anchor_block_hash;
  proof.aux_root = consensus::ComputeMerkleRoot(native_hashes);
  proof.branch = consensus::ComputeMerkleBranch(native_hashes, proof.index);
  proof.commitment = ComputeAuxCommitment(proof.aux_root, anchor_block_hash);
  return proof;
}

} // namespace merge_mining
} // namespace codl3
