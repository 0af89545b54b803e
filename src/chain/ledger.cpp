// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "chain/ledger.hpp"
#include "util/saturating.hpp"
#include <algorithm>

namespace codl3 {
namespace chain {

Ledger::Ledger(const Block &genesis) {
  blocks_.push_back(genesis);
  tip_hash_ = genesis.GetHash();
  best_known_height_ = genesis.header.height;
}

const Block *Ledger::GetBlock(uint64_t height) const {
  if (height >= blocks_.size()) {
    return nullptr;
  }
  return &blocks_[height];
}

std::vector<Block> Ledger::GetRecentBlocks(size_t max_count) const {
  std::vector<Block> result;
  size_t count = std::min(max_count, blocks_.size());
  result.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    result.push_back(blocks_[blocks_.size() - 1 - i]);
  }
  return result;
}

std::vector<Hash256> Ledger::GetBlockHashesAbove(uint64_t height) const {
  std::vector<Hash256> hashes;
  for (uint64_t h = height + 1; h < blocks_.size(); ++h) {
    hashes.push_back(blocks_[h].GetHash());
  }
  return hashes;
}

void Ledger::ConnectBlock(Block block) {
  const uint64_t height = block.header.height;

  std::set<Hash256> included;
  for (auto &tx : block.transactions) {
    tx.status = TxStatus::CONFIRMED;
    included.insert(tx.hash);
    confirmed_[tx.hash] = height;
  }

  std::erase_if(pending_, [&](const Transaction &tx) {
    return included.count(tx.hash) != 0;
  });
  for (const auto &hash : included) {
    pending_hashes_.erase(hash);
  }

  tip_hash_ = block.GetHash();
  blocks_.push_back(std::move(block));
  best_known_height_ = std::max(best_known_height_, height);
  stats_.native_blocks_mined++;
}

bool Ledger::AddPendingTransaction(const Transaction &tx) {
  if (IsKnownTransaction(tx.hash)) {
    return false;
  }
  pending_.push_back(tx);
  pending_.back().status = TxStatus::PENDING;
  pending_hashes_.insert(tx.hash);
  return true;
}

bool Ledger::IsKnownTransaction(const Hash256 &hash) const {
  return pending_hashes_.count(hash) != 0 || confirmed_.count(hash) != 0;
}

std::vector<Transaction> Ledger::SelectTransactions(uint64_t gas_limit) const {
  std::vector<Transaction> selected;
  uint64_t gas = 0;
  for (const auto &tx : pending_) {
    if (gas + BASE_TX_GAS > gas_limit) {
      break;
    }
    gas += BASE_TX_GAS;
    selected.push_back(tx);
  }
  return selected;
}

bool Ledger::GetConfirmedHeight(const Hash256 &hash, uint64_t &height) const {
  auto it = confirmed_.find(hash);
  if (it == confirmed_.end()) {
    return false;
  }
  height = it->second;
  return true;
}

const merge_mining::AnchorBlockRecord *
Ledger::GetAnchorBlock(uint64_t height) const {
  auto it = anchor_blocks_.find(height);
  return it == anchor_blocks_.end() ? nullptr : &it->second;
}

bool Ledger::RecordAnchorBlock(const merge_mining::AnchorBlockRecord &record,
                               uint64_t reward) {
  if (!anchor_blocks_.emplace(record.height, record).second) {
    return false;
  }

  anchor_height_ = std::max(anchor_height_, record.height);
  native_height_at_last_anchor_ = GetHeight();
  rewards_.anchor_rewards = util::SaturatingAdd(rewards_.anchor_rewards, reward);
  rewards_.total = util::SaturatingAdd(rewards_.total, reward);
  stats_.anchor_blocks_observed++;
  return true;
}

void Ledger::CreditGasFees(uint64_t fees, uint64_t validator_share) {
  rewards_.native_gas_fees = util::SaturatingAdd(rewards_.native_gas_fees, fees);
  rewards_.validator_fee_share =
      util::SaturatingAdd(rewards_.validator_fee_share, validator_share);
  rewards_.total = util::SaturatingAdd(rewards_.total, fees);
}

bool Ledger::AdvanceBestKnownHeight(uint64_t remote_height) {
  if (remote_height <= best_known_height_) {
    return false;
  }
  best_known_height_ = remote_height;
  return true;
}

void Ledger::RecordL1Observation(uint64_t l1_head_height, uint64_t gas_price) {
  stats_.l1_head_height = std::max(stats_.l1_head_height, l1_head_height);
  stats_.l1_gas_price = gas_price;
}

} // namespace chain
} // namespace codl3
