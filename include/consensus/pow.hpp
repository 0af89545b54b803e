// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_CONSENSUS_POW_HPP
#define CODL3_CONSENSUS_POW_HPP

#include "crypto/sha256.hpp"
#include "primitives/block.hpp"
#include <atomic>
#include <cstdint>
#include <optional>

namespace codl3 {
namespace consensus {

/**
 * Proof of work
 *
 * A header hash satisfies difficulty d when its first
 * RequiredLeadingZeroBytes(d) bytes are zero. Difficulty is capped at the
 * hash width, and difficulty 0 accepts any hash.
 */

struct PowSolution {
  uint64_t nonce;
  Hash256 hash;
};

uint32_t RequiredLeadingZeroBytes(uint64_t difficulty);

uint32_t CountLeadingZeroBytes(const Hash256 &hash);

bool CheckProofOfWork(const Hash256 &hash, uint64_t difficulty);

/**
 * Search nonces 0, 1, ... max_nonce - 1 for a hash meeting `difficulty`
 *
 * The candidate is copied and its difficulty field set to `difficulty`
 * before hashing, so the returned hash is the hash of the finished header.
 *
 * @param abort Optional flag polled during the search; returns nullopt
 *        early when it becomes true
 * @param hashes_done Optional counter incremented by the number of hashes
 *        computed
 * @return First satisfying nonce and its hash, or nullopt if exhausted
 */
std::optional<PowSolution>
SearchProofOfWork(const BlockHeader &candidate, uint64_t difficulty,
                  uint64_t max_nonce,
                  const std::atomic<bool> *abort = nullptr,
                  std::atomic<uint64_t> *hashes_done = nullptr);

} // namespace consensus
} // namespace codl3

#endif // CODL3_CONSENSUS_POW_HPP
