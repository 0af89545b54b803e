// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "validation/chainstate_manager.hpp"
#include "chain/chainparams.hpp"
#include "util/logging.hpp"
#include "util/saturating.hpp"
#include "util/strencodings.hpp"
#include "util/time.hpp"
#include <mutex>

namespace codl3 {
namespace validation {

ChainstateOptions ChainstateOptions::FromParams(const chain::ChainParams &params) {
  const auto &consensus = params.GetConsensus();

  ChainstateOptions options;
  options.difficulty = consensus.nDifficulty;
  options.block_gas_limit = consensus.nBlockGasLimit;
  options.min_stake = consensus.nMinStake;
  options.max_validators = consensus.nMaxValidators;
  options.slashing_percent = consensus.nSlashingPercent;
  options.validator_fee_share_percent = consensus.nValidatorFeeSharePercent;
  options.challenge_period = consensus.nChallengePeriod;
  options.l1_confirmations = consensus.nL1Confirmations;
  options.settlement_mode = params.GetDefaultSettlementMode();
  return options;
}

ChainstateManager::ChainstateManager(const chain::ChainParams &params,
                                     const ChainstateOptions &options,
                                     const settlement::ProofSystem &proofs)
    : params_(params), options_(options), proofs_(proofs),
      ledger_(params.GenesisBlock()),
      registry_(options.min_stake, options.max_validators) {
  ledger_.SetStartTime(util::GetTime());
  LOG_CHAIN_INFO("Chainstate initialized at genesis {} ({} settlement)",
                 util::HexStr(ledger_.GetTipHash()),
                 settlement::SettlementModeToString(options_.settlement_mode));
}

// ============================================================================
// Transactions
// ============================================================================

bool ChainstateManager::SubmitTransaction(const Transaction &tx,
                                          ValidationState &state) {
  if (!CheckTransaction(tx, state)) {
    LOG_CHAIN_DEBUG("Rejected transaction: {}", state.ToString());
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  if (!ledger_.AddPendingTransaction(tx)) {
    return state.Invalid("tx-duplicate", util::HexStr(tx.hash));
  }

  LOG_CHAIN_DEBUG("Accepted transaction {} ({} pending)",
                  util::HexStr(tx.hash), ledger_.GetPendingCount());
  return true;
}

std::vector<Transaction> ChainstateManager::GetPendingTransactions() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.GetPendingTransactions();
}

// ============================================================================
// Chain
// ============================================================================

bool ChainstateManager::ValidateBlockWrapper(const Block &block,
                                             const Hash256 &expected_parent_hash,
                                             uint64_t expected_height,
                                             ValidationState &state) const {
  return ValidateBlock(block, expected_parent_hash, expected_height, state);
}

bool ChainstateManager::ProcessNewBlock(const Block &block,
                                        ValidationState &state) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);

  if (!ValidateBlockWrapper(block, ledger_.GetTipHash(),
                            ledger_.GetHeight() + 1, state)) {
    LOG_CHAIN_WARN("Rejected block at height {}: {}", block.header.height,
                   state.ToString());
    return false;
  }

  for (const auto &tx : block.transactions) {
    ValidationState tx_state;
    if (!CheckTransaction(tx, tx_state)) {
      state.Invalid("bad-txns", tx_state.ToString());
      LOG_CHAIN_WARN("Rejected block at height {}: {}", block.header.height,
                     state.ToString());
      return false;
    }
    uint64_t confirmed_at = 0;
    if (ledger_.GetConfirmedHeight(tx.hash, confirmed_at)) {
      state.Invalid("bad-txns-duplicate",
                    util::HexStr(tx.hash) + " confirmed at height " +
                        std::to_string(confirmed_at));
      LOG_CHAIN_WARN("Rejected block at height {}: {}", block.header.height,
                     state.ToString());
      return false;
    }
  }

  if (!CheckSettlementProof(block, options_.settlement_mode, proofs_, state)) {
    LOG_CHAIN_WARN("Rejected block at height {}: {}", block.header.height,
                   state.ToString());
    return false;
  }

  ConnectBlock(block);
  return true;
}

void ChainstateManager::ConnectBlock(const Block &block) {
  const uint64_t fees = block.TotalFees();
  const uint64_t share = fees / 100 * options_.validator_fee_share_percent +
                         fees % 100 * options_.validator_fee_share_percent / 100;

  ledger_.ConnectBlock(block);
  ledger_.CreditGasFees(fees, share);
  registry_.RecordBlockProduced(block.header.producer, block.header.height);

  // Share plus whatever earlier rounds could not split evenly
  const uint64_t pool =
      util::SaturatingAdd(ledger_.GetUndistributedFeeShare(), share);
  const uint64_t distributed = registry_.DistributeRewards(pool);
  ledger_.SetUndistributedFeeShare(pool - distributed);

  LOG_CHAIN_INFO("Connected block {} at height {} ({} txs, fees {}, "
                 "validator share {})",
                 util::HexStr(ledger_.GetTipHash()), block.header.height,
                 block.transactions.size(), fees, distributed);
}

MiningSnapshot ChainstateManager::GetMiningSnapshot() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);

  MiningSnapshot snapshot;
  snapshot.height = ledger_.GetHeight() + 1;
  snapshot.parent_hash = ledger_.GetTipHash();
  snapshot.parent_timestamp = ledger_.GetTip().header.timestamp;
  snapshot.anchor_height = ledger_.GetAnchorHeight();
  snapshot.transactions = ledger_.SelectTransactions(options_.block_gas_limit);
  return snapshot;
}

uint64_t ChainstateManager::GetHeight() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.GetHeight();
}

Hash256 ChainstateManager::GetTipHash() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.GetTipHash();
}

std::optional<Block> ChainstateManager::GetBlock(uint64_t height) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  const Block *block = ledger_.GetBlock(height);
  if (!block) {
    return std::nullopt;
  }
  return *block;
}

std::vector<Block> ChainstateManager::GetRecentBlocks(size_t max_count) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.GetRecentBlocks(max_count);
}

NodeStatus ChainstateManager::GetStatus() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);

  NodeStatus status;
  status.height = ledger_.GetHeight();
  status.tip_hash = ledger_.GetTipHash();
  status.best_known_height = ledger_.GetBestKnownHeight();
  status.peer_count = ledger_.GetPeerCount();
  status.pending_tx_count = ledger_.GetPendingCount();
  status.anchor_height = ledger_.GetAnchorHeight();
  status.l1_confirmed_height = settlement_.GetConfirmedHeight();
  status.rewards = ledger_.GetRewards();
  status.stats = ledger_.GetStats();
  status.fraud_proofs_submitted = settlement_.GetFraudProofCount();
  status.total_staked = registry_.GetTotalStaked();
  status.active_validators = registry_.GetActiveCount();
  status.undistributed_fee_share = ledger_.GetUndistributedFeeShare();
  return status;
}

// ============================================================================
// Validators
// ============================================================================

staking::StakeResult ChainstateManager::Stake(const Address &address,
                                              uint64_t amount) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return registry_.Stake(address, amount);
}

staking::StakeResult ChainstateManager::Unstake(const Address &address,
                                                uint64_t amount) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return registry_.Unstake(address, amount);
}

staking::StakeResult
ChainstateManager::Slash(const Address &address,
                         std::optional<uint32_t> penalty_percent,
                         uint64_t *slashed) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return registry_.Slash(address,
                         penalty_percent.value_or(options_.slashing_percent),
                         slashed);
}

uint64_t ChainstateManager::DistributeRewards(uint64_t total) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return registry_.DistributeRewards(total);
}

std::optional<staking::Validator>
ChainstateManager::GetValidator(const Address &address) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  const staking::Validator *validator = registry_.Get(address);
  if (!validator) {
    return std::nullopt;
  }
  return *validator;
}

std::vector<staking::Validator> ChainstateManager::GetValidators() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return registry_.GetAll();
}

// ============================================================================
// Bridge
// ============================================================================

std::string ChainstateManager::RecordDeposit(const Address &sender,
                                             const Address &recipient,
                                             uint64_t amount) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return settlement_.RecordDeposit(sender, recipient, amount,
                                   ledger_.GetStats().l1_head_height,
                                   util::GetTime());
}

std::string ChainstateManager::RecordWithdrawal(const Address &sender,
                                                const Address &recipient,
                                                uint64_t amount) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return settlement_.RecordWithdrawal(sender, recipient, amount,
                                      ledger_.GetStats().l1_head_height,
                                      util::GetTime());
}

size_t ChainstateManager::AdvanceL1Confirmations(uint64_t current_l1_height) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  ledger_.RecordL1Observation(current_l1_height,
                              ledger_.GetStats().l1_gas_price);
  return settlement_.AdvanceL1Confirmations(current_l1_height,
                                            options_.l1_confirmations);
}

bridge::BridgeResult
ChainstateManager::CompleteBridgeTransaction(const std::string &tx_id) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return settlement_.Complete(tx_id);
}

bridge::BridgeResult
ChainstateManager::FailBridgeTransaction(const std::string &tx_id,
                                         const std::string &reason) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return settlement_.Fail(tx_id, reason);
}

std::optional<bridge::BridgeTransaction>
ChainstateManager::GetBridgeTransaction(const std::string &tx_id) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  const bridge::BridgeTransaction *tx = settlement_.Get(tx_id);
  if (!tx) {
    return std::nullopt;
  }
  return *tx;
}

std::vector<bridge::BridgeTransaction>
ChainstateManager::GetOpenBridgeTransactions() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return settlement_.GetOpen();
}

std::vector<bridge::BridgeTransaction>
ChainstateManager::GetAllBridgeTransactions() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return settlement_.GetAll();
}

bridge::BridgeResult
ChainstateManager::SubmitFraudProof(uint64_t block_height,
                                    const Address &challenger,
                                    const std::vector<uint8_t> &proof) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  const Block *block = ledger_.GetBlock(block_height);
  const int64_t block_time =
      block ? static_cast<int64_t>(block->header.timestamp) : 0;
  return settlement_.SubmitFraudProof(block_height, block != nullptr,
                                      block_time, challenger, proof,
                                      util::GetTime(),
                                      options_.challenge_period);
}

// ============================================================================
// Merge mining
// ============================================================================

uint64_t ChainstateManager::GetAnchorHeight() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.GetAnchorHeight();
}

std::vector<Hash256> ChainstateManager::GetAuxCandidateHashes() const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  std::vector<Hash256> hashes =
      ledger_.GetBlockHashesAbove(ledger_.GetNativeHeightAtLastAnchor());
  if (hashes.empty()) {
    hashes.push_back(ledger_.GetTipHash());
  }
  return hashes;
}

bool ChainstateManager::RecordAnchorBlock(
    const merge_mining::AnchorBlockRecord &record, uint64_t reward) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.RecordAnchorBlock(record, reward);
}

std::optional<merge_mining::AnchorBlockRecord>
ChainstateManager::GetAnchorBlock(uint64_t height) const {
  std::shared_lock<std::shared_mutex> lock(state_mutex_);
  const merge_mining::AnchorBlockRecord *record = ledger_.GetAnchorBlock(height);
  if (!record) {
    return std::nullopt;
  }
  return *record;
}

// ============================================================================
// Network / L1 telemetry
// ============================================================================

bool ChainstateManager::AdvanceBestKnownHeight(uint64_t remote_height) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  return ledger_.AdvanceBestKnownHeight(remote_height);
}

void ChainstateManager::SetPeerCount(uint32_t count) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  ledger_.SetPeerCount(count);
}

void ChainstateManager::RecordL1Observation(uint64_t l1_head_height,
                                            uint64_t gas_price) {
  std::unique_lock<std::shared_mutex> lock(state_mutex_);
  ledger_.RecordL1Observation(l1_head_height, gas_price);
}

} // namespace validation
} // namespace codl3
