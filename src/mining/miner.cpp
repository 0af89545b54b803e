// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "mining/miner.hpp"
#include "chain/chainparams.hpp"
#include "consensus/merkle.hpp"
#include "consensus/pow.hpp"
#include "util/logging.hpp"
#include "util/strencodings.hpp"
#include "util/time.hpp"
#include "validation/chainstate_manager.hpp"
#include "validation/validation.hpp"
#include <algorithm>

namespace codl3 {
namespace mining {

BlockHeader BuildCandidate(uint64_t height, const Hash256 &parent_hash,
                           const std::vector<Transaction> &txs,
                           const Address &producer, uint64_t gas_limit,
                           uint64_t timestamp, uint64_t anchor_height) {
  BlockHeader header;
  header.height = height;
  header.parent_hash = parent_hash;
  header.timestamp = timestamp;
  header.merkle_root = consensus::ComputeMerkleRoot(txs);
  header.producer = producer;
  header.gas_used = txs.size() * BASE_TX_GAS;
  header.gas_limit = gas_limit;
  header.nonce = 0;
  header.difficulty = 0;
  header.anchor_height = anchor_height;
  return header;
}

CPUMiner::CPUMiner(const chain::ChainParams &params,
                   validation::ChainstateManager &chainstate)
    : params_(params), chainstate_(chainstate),
      start_time_(std::chrono::steady_clock::now()) {}

CPUMiner::~CPUMiner() { Stop(); }

void CPUMiner::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }

  LOG_MINING_INFO("Miner: Stopped ({} hashes, {} blocks found)",
                  total_hashes_.load(), blocks_found_.load());
}

double CPUMiner::GetHashrate() const {
  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::steady_clock::now() - start_time_)
                     .count();

  if (elapsed == 0) {
    return 0.0;
  }

  return (double)total_hashes_.load() / elapsed;
}

BlockTemplate CPUMiner::CreateBlockTemplate() const {
  const validation::MiningSnapshot snapshot = chainstate_.GetMiningSnapshot();
  const validation::ChainstateOptions &options = chainstate_.GetOptions();

  // Keep timestamps non-decreasing along the chain
  const uint64_t now = static_cast<uint64_t>(util::GetTime());
  const uint64_t timestamp = std::max(now, snapshot.parent_timestamp);

  BlockTemplate tmpl;
  tmpl.difficulty = options.difficulty;
  tmpl.block.header =
      BuildCandidate(snapshot.height, snapshot.parent_hash,
                     snapshot.transactions, mining_address_,
                     options.block_gas_limit, timestamp,
                     snapshot.anchor_height);
  tmpl.block.transactions = snapshot.transactions;
  return tmpl;
}

bool CPUMiner::MineOnce() {
  if (stopped_.load()) {
    return false;
  }

  BlockTemplate tmpl = CreateBlockTemplate();
  if (tmpl.block.transactions.empty()) {
    LOG_MINING_DEBUG("Miner: No pending transactions, skipping round");
    return false;
  }

  LOG_MINING_DEBUG("Miner: Mining block at height {} ({} txs, difficulty {})",
                   tmpl.block.header.height, tmpl.block.transactions.size(),
                   tmpl.difficulty);

  mining_.store(true);
  auto solution = consensus::SearchProofOfWork(
      tmpl.block.header, tmpl.difficulty, params_.GetConsensus().nMaxNonce,
      &stopped_, &total_hashes_);
  mining_.store(false);

  if (!solution) {
    if (!stopped_.load()) {
      LOG_MINING_INFO("Miner: No block found at height {} within {} nonces",
                      tmpl.block.header.height,
                      params_.GetConsensus().nMaxNonce);
    }
    return false;
  }

  Block &block = tmpl.block;
  block.header.difficulty = tmpl.difficulty;
  block.header.nonce = solution->nonce;

  if (chainstate_.GetOptions().settlement_mode ==
      settlement::SettlementMode::ZK_PROOF) {
    block.settlement_proof = chainstate_.GetProofSystem().Generate(
        validation::SettlementProofInputs(block.header));
  }

  LOG_MINING_INFO("Miner: *** BLOCK FOUND *** Height: {}, Nonce: {}, Hash: {}",
                  block.header.height, solution->nonce,
                  util::HexStr(solution->hash).substr(0, 16));

  validation::ValidationState state;
  if (!chainstate_.ProcessNewBlock(block, state)) {
    LOG_MINING_WARN("Miner: Mined block rejected: {}", state.ToString());
    return false;
  }

  blocks_found_.fetch_add(1);
  return true;
}

} // namespace mining
} // namespace codl3
