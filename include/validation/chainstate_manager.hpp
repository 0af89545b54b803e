// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_VALIDATION_CHAINSTATE_MANAGER_HPP
#define CODL3_VALIDATION_CHAINSTATE_MANAGER_HPP

#include "bridge/settlement_ledger.hpp"
#include "chain/ledger.hpp"
#include "merge_mining/aux_proof.hpp"
#include "primitives/block.hpp"
#include "settlement/proof_system.hpp"
#include "staking/validator_registry.hpp"
#include "validation/validation.hpp"
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace codl3 {

// Forward declarations
namespace chain {
class ChainParams;
} // namespace chain

namespace validation {

// Resolved node policy; defaults come from ChainParams, the daemon may
// override individual values
struct ChainstateOptions {
  uint64_t difficulty{1};
  uint64_t block_gas_limit{30'000'000};
  uint64_t min_stake{0};
  uint32_t max_validators{0};
  uint32_t slashing_percent{50};
  uint32_t validator_fee_share_percent{10};
  int64_t challenge_period{0};
  uint64_t l1_confirmations{0};
  settlement::SettlementMode settlement_mode{
      settlement::SettlementMode::FRAUD_PROOF};

  static ChainstateOptions FromParams(const chain::ChainParams &params);
};

// Point-in-time view of the node for status queries
struct NodeStatus {
  uint64_t height{0};
  Hash256 tip_hash{};
  uint64_t best_known_height{0};
  uint32_t peer_count{0};
  size_t pending_tx_count{0};
  uint64_t anchor_height{0};
  uint64_t l1_confirmed_height{0};
  chain::MiningRewardAccumulator rewards;
  chain::MiningStats stats;
  uint64_t fraud_proofs_submitted{0};
  uint64_t total_staked{0};
  uint32_t active_validators{0};
  uint64_t undistributed_fee_share{0};
};

// Immutable inputs for one mining round
struct MiningSnapshot {
  uint64_t height{0};          // Height of the block to build
  Hash256 parent_hash{};
  uint64_t parent_timestamp{0};
  uint64_t anchor_height{0};
  std::vector<Transaction> transactions;
};

// ChainstateManager - Owner of all shared node state
//
// Ledger, ValidatorRegistry and SettlementLedger sit behind one
// reader/writer lock so cross-component updates (connecting a block and
// crediting its producer and validators) are observed all-or-nothing.
// Queries take a shared lock, mutations an exclusive one, and no lock is
// held outside a public method. Failure to acquire the lock throws
// std::system_error, which callers do not handle.
class ChainstateManager {
public:
  // LIFETIME: ChainParams and ProofSystem must outlive this object
  ChainstateManager(const chain::ChainParams &params,
                    const ChainstateOptions &options,
                    const settlement::ProofSystem &proofs);
  virtual ~ChainstateManager() = default;

  const chain::ChainParams &GetParams() const { return params_; }
  const ChainstateOptions &GetOptions() const { return options_; }
  const settlement::ProofSystem &GetProofSystem() const { return proofs_; }

  // ---- Transactions -------------------------------------------------------

  // CheckTransaction() + duplicate check (tx-duplicate), then enqueue
  bool SubmitTransaction(const Transaction &tx, ValidationState &state);
  std::vector<Transaction> GetPendingTransactions() const;

  // ---- Chain --------------------------------------------------------------

  /**
   * Validate `block` against the current tip and connect it
   *
   * On success the block's transactions leave the pool as CONFIRMED, the
   * producer's validator record is credited, gas fees are added to the
   * reward accumulator and the validator fee share is distributed.
   * On failure nothing changes.
   */
  bool ProcessNewBlock(const Block &block, ValidationState &state);

  MiningSnapshot GetMiningSnapshot() const;
  uint64_t GetHeight() const;
  Hash256 GetTipHash() const;
  std::optional<Block> GetBlock(uint64_t height) const;
  std::vector<Block> GetRecentBlocks(size_t max_count) const;
  NodeStatus GetStatus() const;

  // ---- Validators ---------------------------------------------------------

  staking::StakeResult Stake(const Address &address, uint64_t amount);
  staking::StakeResult Unstake(const Address &address, uint64_t amount);
  // Uses the configured slashing percent when `penalty_percent` is empty
  staking::StakeResult Slash(const Address &address,
                             std::optional<uint32_t> penalty_percent,
                             uint64_t *slashed = nullptr);
  uint64_t DistributeRewards(uint64_t total);
  std::optional<staking::Validator> GetValidator(const Address &address) const;
  std::vector<staking::Validator> GetValidators() const;

  // ---- Bridge -------------------------------------------------------------

  std::string RecordDeposit(const Address &sender, const Address &recipient,
                            uint64_t amount);
  std::string RecordWithdrawal(const Address &sender, const Address &recipient,
                               uint64_t amount);
  // Applies the configured confirmation depth; returns promoted count
  size_t AdvanceL1Confirmations(uint64_t current_l1_height);
  bridge::BridgeResult CompleteBridgeTransaction(const std::string &tx_id);
  bridge::BridgeResult FailBridgeTransaction(const std::string &tx_id,
                                             const std::string &reason);
  std::optional<bridge::BridgeTransaction>
  GetBridgeTransaction(const std::string &tx_id) const;
  std::vector<bridge::BridgeTransaction> GetOpenBridgeTransactions() const;
  std::vector<bridge::BridgeTransaction> GetAllBridgeTransactions() const;
  bridge::BridgeResult SubmitFraudProof(uint64_t block_height,
                                        const Address &challenger,
                                        const std::vector<uint8_t> &proof);

  // ---- Merge mining -------------------------------------------------------

  uint64_t GetAnchorHeight() const;
  // Native block hashes the next aux proof commits to: blocks connected
  // since the last anchor block, or the tip alone if there are none
  std::vector<Hash256> GetAuxCandidateHashes() const;
  // Idempotent per anchor height; returns false if already recorded
  bool RecordAnchorBlock(const merge_mining::AnchorBlockRecord &record,
                         uint64_t reward);
  std::optional<merge_mining::AnchorBlockRecord>
  GetAnchorBlock(uint64_t height) const;

  // ---- Network / L1 telemetry ---------------------------------------------

  // Never decreases; returns true if it moved
  bool AdvanceBestKnownHeight(uint64_t remote_height);
  void SetPeerCount(uint32_t count);
  void RecordL1Observation(uint64_t l1_head_height, uint64_t gas_price);

protected:
  // Virtual for test mocking (e.g. accept blocks without proof of work)
  virtual bool ValidateBlockWrapper(const Block &block,
                                    const Hash256 &expected_parent_hash,
                                    uint64_t expected_height,
                                    ValidationState &state) const;

private:
  // Assumes state_mutex_ held exclusively
  void ConnectBlock(const Block &block);

  const chain::ChainParams &params_;
  const ChainstateOptions options_;
  const settlement::ProofSystem &proofs_;

  // THREAD SAFETY: guards ledger_, registry_ and settlement_
  mutable std::shared_mutex state_mutex_;
  chain::Ledger ledger_;
  staking::ValidatorRegistry registry_;
  bridge::SettlementLedger settlement_;
};

} // namespace validation
} // namespace codl3

#endif // CODL3_VALIDATION_CHAINSTATE_MANAGER_HPP
