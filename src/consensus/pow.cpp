// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "consensus/pow.hpp"
#include "util/endian.hpp"
#include <algorithm>

namespace codl3 {
namespace consensus {

// Abort flag and hash counter are touched once per batch
static constexpr uint64_t SEARCH_BATCH = 1024;

uint32_t RequiredLeadingZeroBytes(uint64_t difficulty) {
  return static_cast<uint32_t>(
      std::min<uint64_t>(difficulty, sizeof(Hash256)));
}

uint32_t CountLeadingZeroBytes(const Hash256 &hash) {
  uint32_t count = 0;
  for (uint8_t b : hash) {
    if (b != 0) {
      break;
    }
    ++count;
  }
  return count;
}

bool CheckProofOfWork(const Hash256 &hash, uint64_t difficulty) {
  return CountLeadingZeroBytes(hash) >= RequiredLeadingZeroBytes(difficulty);
}

std::optional<PowSolution>
SearchProofOfWork(const BlockHeader &candidate, uint64_t difficulty,
                  uint64_t max_nonce, const std::atomic<bool> *abort,
                  std::atomic<uint64_t> *hashes_done) {
  BlockHeader header = candidate;
  header.difficulty = difficulty;
  header.nonce = 0;

  // Serialize once, then patch the nonce bytes in place
  std::vector<uint8_t> data = header.Serialize();
  const size_t nonce_offset = header.NonceOffset();

  uint64_t batch_hashes = 0;
  for (uint64_t nonce = 0; nonce < max_nonce; ++nonce) {
    endian::WriteLE64(data.data() + nonce_offset, nonce);
    Hash256 hash = crypto::Sha256(data);
    ++batch_hashes;

    if (CheckProofOfWork(hash, difficulty)) {
      if (hashes_done) {
        hashes_done->fetch_add(batch_hashes, std::memory_order_relaxed);
      }
      return PowSolution{nonce, hash};
    }

    if (batch_hashes == SEARCH_BATCH) {
      if (hashes_done) {
        hashes_done->fetch_add(batch_hashes, std::memory_order_relaxed);
      }
      batch_hashes = 0;
      if (abort && abort->load(std::memory_order_relaxed)) {
        return std::nullopt;
      }
    }
  }

  if (hashes_done) {
    hashes_done->fetch_add(batch_hashes, std::memory_order_relaxed);
  }
  return std::nullopt;
}

} // namespace consensus
} // namespace codl3
