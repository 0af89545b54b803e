// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license

#include "validation/validation.hpp"
#include "consensus/merkle.hpp"
#include "consensus/pow.hpp"
#include "util/strencodings.hpp"
#include <set>

namespace codl3 {
namespace validation {

std::string ValidationState::ToString() const {
  if (debug_message_.empty()) {
    return reject_reason_;
  }
  return reject_reason_ + " (" + debug_message_ + ")";
}

bool CheckTransaction(const Transaction &tx, ValidationState &state) {
  if (tx.hash == ZERO_HASH) {
    return state.Invalid("tx-missing-hash");
  }

  if (tx.from.empty()) {
    return state.Invalid("tx-missing-sender");
  }

  if (tx.gas_limit < BASE_TX_GAS) {
    return state.Invalid("tx-bad-gas",
                         "gas limit " + std::to_string(tx.gas_limit) +
                             " below " + std::to_string(BASE_TX_GAS));
  }

  if (tx.gas_price > MAX_GAS_PRICE) {
    return state.Invalid("tx-bad-gas", "gas price " +
                                           std::to_string(tx.gas_price) +
                                           " overflows the fee");
  }

  if (tx.hash != tx.ComputeHash()) {
    return state.Invalid("tx-hash-mismatch",
                         "declared " + util::HexStr(tx.hash));
  }

  return true;
}

bool ValidateBlock(const Block &block, const Hash256 &expected_parent_hash,
                   uint64_t expected_height, ValidationState &state) {
  const BlockHeader &header = block.header;

  if (header.height != expected_height) {
    return state.Invalid("bad-height",
                         "expected " + std::to_string(expected_height) +
                             ", got " + std::to_string(header.height));
  }

  if (header.parent_hash != expected_parent_hash) {
    return state.Invalid("bad-prevblk",
                         "parent " + util::HexStr(header.parent_hash) +
                             " is not the tip");
  }

  if (header.merkle_root != consensus::ComputeMerkleRoot(block.transactions)) {
    return state.Invalid("bad-merkle-root");
  }

  if (!consensus::CheckProofOfWork(header.GetHash(), header.difficulty)) {
    return state.Invalid("high-hash", "proof of work failed for difficulty " +
                                          std::to_string(header.difficulty));
  }

  std::set<Hash256> seen;
  for (const auto &tx : block.transactions) {
    if (!seen.insert(tx.hash).second) {
      return state.Invalid("bad-txns-duplicate", util::HexStr(tx.hash));
    }
  }

  const uint64_t expected_gas = block.transactions.size() * BASE_TX_GAS;
  if (header.gas_used != expected_gas || header.gas_used > header.gas_limit) {
    return state.Invalid("bad-gas", "gas_used " +
                                        std::to_string(header.gas_used) +
                                        ", limit " +
                                        std::to_string(header.gas_limit));
  }

  return true;
}

std::vector<std::string> SettlementProofInputs(const BlockHeader &header) {
  return {std::to_string(header.height), util::HexStr(header.merkle_root)};
}

bool CheckSettlementProof(const Block &block, settlement::SettlementMode mode,
                          const settlement::ProofSystem &proofs,
                          ValidationState &state) {
  if (mode != settlement::SettlementMode::ZK_PROOF) {
    return true;
  }

  if (!block.settlement_proof) {
    return state.Invalid("bad-settlement-proof", "missing validity proof");
  }

  if (block.settlement_proof->inputs != SettlementProofInputs(block.header)) {
    return state.Invalid("bad-settlement-proof",
                         "proof does not commit to this block");
  }

  if (!proofs.Verify(*block.settlement_proof)) {
    return state.Invalid("bad-settlement-proof", "verification failed");
  }

  return true;
}

} // namespace validation
} // namespace codl3
