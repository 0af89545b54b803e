// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_MINING_MINER_HPP
#define CODL3_MINING_MINER_HPP

#include "primitives/block.hpp"
#include "primitives/transaction.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace codl3 {

// Forward declarations
namespace chain {
class ChainParams;
} // namespace chain

namespace validation {
class ChainstateManager;
}

namespace mining {

/**
 * Assemble an unsolved header over `txs`
 *
 * merkle_root and gas_used are derived from `txs`; nonce and difficulty
 * are left at 0 for the proof-of-work search to fill in.
 */
BlockHeader BuildCandidate(uint64_t height, const Hash256 &parent_hash,
                           const std::vector<Transaction> &txs,
                           const Address &producer, uint64_t gas_limit,
                           uint64_t timestamp, uint64_t anchor_height);

// Block template - unsolved block ready for mining
struct BlockTemplate {
  Block block;            // Header nonce/difficulty still unset
  uint64_t difficulty{0}; // Required leading zero bytes
};

// CPU Miner - one proof-of-work round per MineOnce() call
//
// The round works on a snapshot of the chainstate and holds no lock while
// searching; the found block goes through ProcessNewBlock() like any other
// block, so a round that lost the race against a tip change is rejected
// (bad-height) and its transactions stay pending.
// Counters are atomics for safe RPC access.
class CPUMiner {
public:
  CPUMiner(const chain::ChainParams &params,
           validation::ChainstateManager &chainstate);
  ~CPUMiner();

  /**
   * Run one mining round
   *
   * @return true if a block was found and connected. Returns false when
   *         the pool is empty, the nonce space was exhausted ("no block
   *         this round"), the miner was stopped, or the block was rejected.
   */
  bool MineOnce();

  // Abort an in-progress search; later rounds return immediately
  void Stop();

  bool IsMining() const { return mining_.load(); }
  double GetHashrate() const;
  uint64_t GetTotalHashes() const { return total_hashes_.load(); }
  int GetBlocksFound() const { return blocks_found_.load(); }

  // Address credited as producer of mined blocks
  // Set before the mining task is scheduled
  void SetMiningAddress(const Address &address) { mining_address_ = address; }
  Address GetMiningAddress() const { return mining_address_; }

  BlockTemplate CreateBlockTemplate() const;

private:
  const chain::ChainParams &params_;
  validation::ChainstateManager &chainstate_;

  Address mining_address_;

  std::atomic<bool> mining_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<uint64_t> total_hashes_{0};
  std::atomic<int> blocks_found_{0};
  std::chrono::steady_clock::time_point start_time_;
};

} // namespace mining
} // namespace codl3

#endif // CODL3_MINING_MINER_HPP
