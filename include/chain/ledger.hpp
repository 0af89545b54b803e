// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_CHAIN_LEDGER_HPP
#define CODL3_CHAIN_LEDGER_HPP

#include "merge_mining/aux_proof.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace codl3 {
namespace chain {

/**
 * Reward streams credited to this node
 *
 * total == anchor_rewards + native_gas_fees. validator_fee_share is the part
 * of native_gas_fees set aside for active validators, not an extra stream.
 */
struct MiningRewardAccumulator {
  uint64_t anchor_rewards{0};
  uint64_t native_gas_fees{0};
  uint64_t validator_fee_share{0};
  uint64_t total{0};
};

struct MiningStats {
  uint64_t native_blocks_mined{0};
  uint64_t anchor_blocks_observed{0};
  uint64_t l1_gas_price{0};
  uint64_t l1_head_height{0};
  int64_t started_at{0};
};

// Ledger - Canonical chain, pending pool and anchor/L1 bookkeeping
//
// Blocks are stored by height; the chain only grows by ConnectBlock() on
// the current tip. The pending pool keeps submission order.
//
// THREAD SAFETY: NO internal mutex - caller MUST hold
// ChainstateManager::state_mutex_ (shared for const methods, exclusive
// otherwise). Ledger is a PRIVATE member of ChainstateManager.
class Ledger {
public:
  explicit Ledger(const Block &genesis);

  // Chain
  uint64_t GetHeight() const { return blocks_.back().header.height; }
  Hash256 GetTipHash() const { return tip_hash_; }
  const Block &GetTip() const { return blocks_.back(); }
  const Block *GetBlock(uint64_t height) const;

  // Newest first, at most `max_count`
  std::vector<Block> GetRecentBlocks(size_t max_count) const;

  // Hashes of blocks with height > `height`, oldest first
  std::vector<Hash256> GetBlockHashesAbove(uint64_t height) const;

  // Append an already-validated block on the tip. Included transactions are
  // marked CONFIRMED and removed from the pending pool.
  void ConnectBlock(Block block);

  // Pending pool
  bool AddPendingTransaction(const Transaction &tx); // false on duplicate
  bool IsKnownTransaction(const Hash256 &hash) const;
  const std::vector<Transaction> &GetPendingTransactions() const {
    return pending_;
  }
  size_t GetPendingCount() const { return pending_.size(); }

  // Pending transactions in submission order whose total gas fits
  std::vector<Transaction> SelectTransactions(uint64_t gas_limit) const;

  // Height of the block that confirmed `hash`, if any
  bool GetConfirmedHeight(const Hash256 &hash, uint64_t &height) const;

  // Anchor chain
  uint64_t GetAnchorHeight() const { return anchor_height_; }
  // Native tip height when the last anchor block was recorded
  uint64_t GetNativeHeightAtLastAnchor() const {
    return native_height_at_last_anchor_;
  }
  const merge_mining::AnchorBlockRecord *GetAnchorBlock(uint64_t height) const;

  // Store the record and credit `reward` to anchor_rewards.
  // Returns false (no-op) if that height is already recorded.
  bool RecordAnchorBlock(const merge_mining::AnchorBlockRecord &record,
                         uint64_t reward);

  // Rewards
  const MiningRewardAccumulator &GetRewards() const { return rewards_; }
  void CreditGasFees(uint64_t fees, uint64_t validator_share);

  // Validator fee share not yet handed out (integer-division remainders and
  // shares earned while no validator was active)
  uint64_t GetUndistributedFeeShare() const { return undistributed_fee_share_; }
  void SetUndistributedFeeShare(uint64_t amount) {
    undistributed_fee_share_ = amount;
  }

  // Network view
  uint64_t GetBestKnownHeight() const { return best_known_height_; }
  // Never decreases; returns true if it moved
  bool AdvanceBestKnownHeight(uint64_t remote_height);
  uint32_t GetPeerCount() const { return peer_count_; }
  void SetPeerCount(uint32_t count) { peer_count_ = count; }

  // Stats
  const MiningStats &GetStats() const { return stats_; }
  void RecordL1Observation(uint64_t l1_head_height, uint64_t gas_price);
  void SetStartTime(int64_t time) { stats_.started_at = time; }

private:
  std::vector<Block> blocks_; // index == height
  Hash256 tip_hash_{};

  std::vector<Transaction> pending_;
  std::set<Hash256> pending_hashes_;
  std::map<Hash256, uint64_t> confirmed_; // tx hash -> block height

  uint64_t anchor_height_{0};
  uint64_t native_height_at_last_anchor_{0};
  std::map<uint64_t, merge_mining::AnchorBlockRecord> anchor_blocks_;

  MiningRewardAccumulator rewards_;
  uint64_t undistributed_fee_share_{0};

  uint64_t best_known_height_{0};
  uint32_t peer_count_{0};

  MiningStats stats_;
};

} // namespace chain
} // namespace codl3

#endif // CODL3_CHAIN_LEDGER_HPP
