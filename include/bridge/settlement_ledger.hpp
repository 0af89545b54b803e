// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_BRIDGE_SETTLEMENT_LEDGER_HPP
#define CODL3_BRIDGE_SETTLEMENT_LEDGER_HPP

#include "primitives/transaction.hpp"
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace codl3 {
namespace bridge {

enum class BridgeDirection { DEPOSIT, WITHDRAWAL };

// PENDING -> CONFIRMED -> COMPLETED, or PENDING|CONFIRMED -> FAILED.
// COMPLETED and FAILED are terminal.
enum class BridgeStatus { PENDING, CONFIRMED, COMPLETED, FAILED };

enum class BridgeResult {
  OK,
  NOT_FOUND,
  INVALID_TRANSITION, // Transaction already terminal
  CHALLENGE_EXPIRED,  // Fraud proof after the challenge window closed
  UNKNOWN_BLOCK,      // Fraud proof for a height that does not exist
};

std::string BridgeDirectionToString(BridgeDirection direction);
std::string BridgeStatusToString(BridgeStatus status);
// "NotFound", "InvalidTransition", ... (error kind reported to RPC callers)
std::string BridgeResultToString(BridgeResult result);

struct BridgeTransaction {
  std::string tx_id;
  BridgeDirection direction{BridgeDirection::DEPOSIT};
  Address sender;
  Address recipient;
  uint64_t amount{0};
  BridgeStatus status{BridgeStatus::PENDING};
  std::string failure_reason; // Set when FAILED
  int64_t created_at{0};
  uint64_t l1_height{0};      // L1 height the transfer originated at

  bool IsTerminal() const {
    return status == BridgeStatus::COMPLETED || status == BridgeStatus::FAILED;
  }
};

struct FraudProofRecord {
  uint64_t block_height{0};
  Address challenger;
  std::vector<uint8_t> proof;
  int64_t submitted_at{0};
};

// SettlementLedger - Bridge transfers, L1 confirmation depth and disputes
//
// confirmed_height only moves forward. Adjudication of disputed blocks
// happens outside the node; this ledger only records them.
//
// THREAD SAFETY: NO internal mutex - caller MUST hold
// ChainstateManager::state_mutex_.
class SettlementLedger {
public:
  SettlementLedger() = default;

  // Create a PENDING transfer; returns its id ("bridge_..." / "withdraw_...")
  std::string RecordDeposit(const Address &sender, const Address &recipient,
                            uint64_t amount, uint64_t l1_height,
                            int64_t now);
  std::string RecordWithdrawal(const Address &sender, const Address &recipient,
                               uint64_t amount, uint64_t l1_height,
                               int64_t now);

  /**
   * confirmed_height = max(confirmed_height,
   *                        current_l1_height - required_confirmations)
   *
   * The subtraction saturates at zero, so on an L1 chain shallower than
   * `required_confirmations` only transfers recorded at L1 height 0 qualify.
   * Every PENDING transfer with l1_height <= confirmed_height becomes
   * CONFIRMED.
   *
   * @return Number of transfers promoted by this call
   */
  size_t AdvanceL1Confirmations(uint64_t current_l1_height,
                                uint64_t required_confirmations);

  uint64_t GetConfirmedHeight() const { return confirmed_height_; }

  // Valid from PENDING or CONFIRMED only
  BridgeResult Complete(const std::string &tx_id);
  BridgeResult Fail(const std::string &tx_id, const std::string &reason);

  /**
   * Record a fraud proof against the block at `block_height`
   *
   * Accepted only while now - block_timestamp < challenge_period. The
   * caller resolves the block and passes UNKNOWN_BLOCK-worthy heights
   * through `block_exists == false`.
   */
  BridgeResult SubmitFraudProof(uint64_t block_height, bool block_exists,
                                int64_t block_timestamp,
                                const Address &challenger,
                                const std::vector<uint8_t> &proof, int64_t now,
                                int64_t challenge_period);

  const BridgeTransaction *Get(const std::string &tx_id) const;
  std::vector<BridgeTransaction> GetAll() const;
  // Non-terminal transfers (PENDING or CONFIRMED)
  std::vector<BridgeTransaction> GetOpen() const;

  uint64_t GetFraudProofCount() const { return fraud_proofs_.size(); }
  const std::vector<FraudProofRecord> &GetFraudProofs() const {
    return fraud_proofs_;
  }
  const std::set<uint64_t> &GetDisputedHeights() const {
    return disputed_heights_;
  }

private:
  std::string Record(BridgeDirection direction, const Address &sender,
                     const Address &recipient, uint64_t amount,
                     uint64_t l1_height, int64_t now);

  std::map<std::string, BridgeTransaction> transactions_;
  std::vector<std::string> order_; // Ids in creation order
  uint64_t next_sequence_{0};
  uint64_t confirmed_height_{0};

  std::vector<FraudProofRecord> fraud_proofs_;
  std::set<uint64_t> disputed_heights_;
};

} // namespace bridge
} // namespace codl3

#endif // CODL3_BRIDGE_SETTLEMENT_LEDGER_HPP
