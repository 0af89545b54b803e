// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#ifndef CODL3_VALIDATION_VALIDATION_HPP
#define CODL3_VALIDATION_VALIDATION_HPP

#include "primitives/block.hpp"
#include "primitives/transaction.hpp"
#include "settlement/proof_system.hpp"
#include <string>
#include <vector>

namespace codl3 {
namespace validation {

/**
 * ============================================================================
 * BLOCK VALIDATION
 * ============================================================================
 *
 * ValidateBlock() runs the context checks in a fixed order and stops at the
 * first failure:
 *   1. height == expected height             (bad-height)
 *   2. parent_hash == expected parent hash   (bad-prevblk)
 *   3. merkle_root == MerkleRoot(txs)        (bad-merkle-root)
 *   4. GetHash() meets header.difficulty     (high-hash)
 *   5. no duplicate transaction hashes       (bad-txns-duplicate)
 *   6. gas_used == txs * BASE_TX_GAS <= gas_limit  (bad-gas)
 *
 * CheckSettlementProof() is applied separately since it depends on the
 * node's settlement mode.
 *
 * A block is either accepted whole by ChainstateManager::ProcessNewBlock()
 * or not at all; nothing here mutates state.
 * ============================================================================
 */

/**
 * Validation state - tracks why validation failed
 */
class ValidationState {
public:
    enum class Result {
        VALID,
        INVALID,        // Invalid block or transaction (permanent failure)
        ERROR           // System error (temporary failure)
    };

    ValidationState() : result_(Result::VALID) {}

    bool IsValid() const { return result_ == Result::VALID; }
    bool IsInvalid() const { return result_ == Result::INVALID; }
    bool IsError() const { return result_ == Result::ERROR; }

    bool Invalid(const std::string& reject_reason, const std::string& debug_message = "") {
        result_ = Result::INVALID;
        reject_reason_ = reject_reason;
        debug_message_ = debug_message;
        return false;
    }

    bool Error(const std::string& reject_reason, const std::string& debug_message = "") {
        result_ = Result::ERROR;
        reject_reason_ = reject_reason;
        debug_message_ = debug_message;
        return false;
    }

    std::string GetRejectReason() const { return reject_reason_; }
    std::string GetDebugMessage() const { return debug_message_; }

    // "reason (debug)" or just "reason"
    std::string ToString() const;

private:
    Result result_;
    std::string reject_reason_;
    std::string debug_message_;
};

/**
 * Context-free transaction checks for pool admission
 *
 * - hash present                          (tx-missing-hash)
 * - sender present                        (tx-missing-sender)
 * - gas_limit covers BASE_TX_GAS          (tx-bad-gas)
 * - hash == ComputeHash()                 (tx-hash-mismatch)
 *
 * Duplicate detection against the pool is the caller's job (tx-duplicate).
 */
bool CheckTransaction(const Transaction& tx, ValidationState& state);

/**
 * Validate a block against the current tip
 *
 * @param block Block to check
 * @param expected_parent_hash Hash of the current tip
 * @param expected_height Current tip height + 1
 * @param state Output validation state (reject reason on failure)
 * @return true if every check passes
 */
bool ValidateBlock(const Block& block,
                   const Hash256& expected_parent_hash,
                   uint64_t expected_height,
                   ValidationState& state);

/**
 * Public inputs a block's settlement proof commits to: height and merkle root
 */
std::vector<std::string> SettlementProofInputs(const BlockHeader& header);

/**
 * Settlement artifact check
 *
 * ZK_PROOF: the block must carry a proof over SettlementProofInputs() that
 * `proofs` verifies (bad-settlement-proof).
 * FRAUD_PROOF: blocks carry no artifact; always passes.
 */
bool CheckSettlementProof(const Block& block,
                          settlement::SettlementMode mode,
                          const settlement::ProofSystem& proofs,
                          ValidationState& state);

} // namespace validation
} // namespace codl3

#endif // CODL3_VALIDATION_VALIDATION_HPP
