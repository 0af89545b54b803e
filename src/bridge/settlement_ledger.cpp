// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "bridge/settlement_ledger.hpp"
#include "crypto/sha256.hpp"
#include "util/endian.hpp"
#include "util/logging.hpp"
#include "util/saturating.hpp"
#include "util/strencodings.hpp"
#include <algorithm>

namespace codl3 {
namespace bridge {

std::string BridgeDirectionToString(BridgeDirection direction) {
  switch (direction) {
  case BridgeDirection::DEPOSIT:
    return "deposit";
  case BridgeDirection::WITHDRAWAL:
    return "withdrawal";
  }
  return "unknown";
}

std::string BridgeStatusToString(BridgeStatus status) {
  switch (status) {
  case BridgeStatus::PENDING:
    return "pending";
  case BridgeStatus::CONFIRMED:
    return "confirmed";
  case BridgeStatus::COMPLETED:
    return "completed";
  case BridgeStatus::FAILED:
    return "failed";
  }
  return "unknown";
}

std::string BridgeResultToString(BridgeResult result) {
  switch (result) {
  case BridgeResult::OK:
    return "Ok";
  case BridgeResult::NOT_FOUND:
    return "NotFound";
  case BridgeResult::INVALID_TRANSITION:
    return "InvalidTransition";
  case BridgeResult::CHALLENGE_EXPIRED:
    return "ChallengeExpired";
  case BridgeResult::UNKNOWN_BLOCK:
    return "UnknownBlock";
  }
  return "Unknown";
}

std::string SettlementLedger::Record(BridgeDirection direction,
                                     const Address &sender,
                                     const Address &recipient, uint64_t amount,
                                     uint64_t l1_height, int64_t now) {
  // Id = prefix + first 16 bytes of SHA256(sequence, time, parties, amount)
  std::vector<uint8_t> preimage;
  endian::AppendLE64(preimage, next_sequence_++);
  endian::AppendLE64(preimage, static_cast<uint64_t>(now));
  preimage.insert(preimage.end(), sender.begin(), sender.end());
  preimage.push_back(0);
  preimage.insert(preimage.end(), recipient.begin(), recipient.end());
  endian::AppendLE64(preimage, amount);
  Hash256 digest = crypto::Sha256(preimage);

  const char *prefix =
      direction == BridgeDirection::DEPOSIT ? "bridge_" : "withdraw_";

  BridgeTransaction tx;
  tx.tx_id = prefix + util::HexStr(digest.data(), 16);
  tx.direction = direction;
  tx.sender = sender;
  tx.recipient = recipient;
  tx.amount = amount;
  tx.status = BridgeStatus::PENDING;
  tx.created_at = now;
  tx.l1_height = l1_height;

  order_.push_back(tx.tx_id);
  transactions_.emplace(tx.tx_id, tx);

  LOG_BRIDGE_INFO("Recorded {} {}: {} -> {} amount {} (l1 height {})",
                  BridgeDirectionToString(direction), tx.tx_id, sender,
                  recipient, amount, l1_height);
  return tx.tx_id;
}

std::string SettlementLedger::RecordDeposit(const Address &sender,
                                            const Address &recipient,
                                            uint64_t amount,
                                            uint64_t l1_height, int64_t now) {
  return Record(BridgeDirection::DEPOSIT, sender, recipient, amount, l1_height,
                now);
}

std::string SettlementLedger::RecordWithdrawal(const Address &sender,
                                               const Address &recipient,
                                               uint64_t amount,
                                               uint64_t l1_height,
                                               int64_t now) {
  return Record(BridgeDirection::WITHDRAWAL, sender, recipient, amount,
                l1_height, now);
}

size_t SettlementLedger::AdvanceL1Confirmations(uint64_t current_l1_height,
                                                uint64_t required_confirmations) {
  const uint64_t candidate =
      util::SaturatingSub(current_l1_height, required_confirmations);
  if (candidate > confirmed_height_) {
    confirmed_height_ = candidate;
  }

  size_t promoted = 0;
  for (auto &[id, tx] : transactions_) {
    if (tx.status == BridgeStatus::PENDING &&
        tx.l1_height <= confirmed_height_) {
      tx.status = BridgeStatus::CONFIRMED;
      promoted++;
      LOG_BRIDGE_INFO("{} confirmed at L1 depth {}", id, confirmed_height_);
    }
  }
  return promoted;
}

BridgeResult SettlementLedger::Complete(const std::string &tx_id) {
  auto it = transactions_.find(tx_id);
  if (it == transactions_.end()) {
    return BridgeResult::NOT_FOUND;
  }
  if (it->second.IsTerminal()) {
    return BridgeResult::INVALID_TRANSITION;
  }

  it->second.status = BridgeStatus::COMPLETED;
  LOG_BRIDGE_INFO("{} completed", tx_id);
  return BridgeResult::OK;
}

BridgeResult SettlementLedger::Fail(const std::string &tx_id,
                                    const std::string &reason) {
  auto it = transactions_.find(tx_id);
  if (it == transactions_.end()) {
    return BridgeResult::NOT_FOUND;
  }
  if (it->second.IsTerminal()) {
    return BridgeResult::INVALID_TRANSITION;
  }

  it->second.status = BridgeStatus::FAILED;
  it->second.failure_reason = reason;
  LOG_BRIDGE_WARN("{} failed: {}", tx_id, reason);
  return BridgeResult::OK;
}

BridgeResult SettlementLedger::SubmitFraudProof(
    uint64_t block_height, bool block_exists, int64_t block_timestamp,
    const Address &challenger, const std::vector<uint8_t> &proof, int64_t now,
    int64_t challenge_period) {
  if (!block_exists) {
    return BridgeResult::UNKNOWN_BLOCK;
  }

  if (now - block_timestamp >= challenge_period) {
    LOG_BRIDGE_DEBUG("Fraud proof for block {} rejected: window closed",
                     block_height);
    return BridgeResult::CHALLENGE_EXPIRED;
  }

  FraudProofRecord record;
  record.block_height = block_height;
  record.challenger = challenger;
  record.proof = proof;
  record.submitted_at = now;
  fraud_proofs_.push_back(std::move(record));
  disputed_heights_.insert(block_height);

  LOG_BRIDGE_WARN("Fraud proof #{} submitted by {} against block {}",
                  fraud_proofs_.size(), challenger, block_height);
  return BridgeResult::OK;
}

const BridgeTransaction *
SettlementLedger::Get(const std::string &tx_id) const {
  auto it = transactions_.find(tx_id);
  return it == transactions_.end() ? nullptr : &it->second;
}

std::vector<BridgeTransaction> SettlementLedger::GetAll() const {
  std::vector<BridgeTransaction> result;
  result.reserve(order_.size());
  for (const auto &id : order_) {
    result.push_back(transactions_.at(id));
  }
  return result;
}

std::vector<BridgeTransaction> SettlementLedger::GetOpen() const {
  std::vector<BridgeTransaction> result;
  for (const auto &id : order_) {
    const auto &tx = transactions_.at(id);
    if (!tx.IsTerminal()) {
      result.push_back(tx);
    }
  }
  return result;
}

} // namespace bridge
} // namespace codl3
