// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Unit tests for transaction and block validation

#include "consensus/merkle.hpp"
#include "consensus/pow.hpp"
#include "settlement/proof_system.hpp"
#include "test_chainstate_manager.hpp"
#include "validation/validation.hpp"
#include <cstdint>
#include <catch2/catch_test_macros.hpp>

using namespace codl3;
using namespace codl3::validation;
using codl3::test::MakeTransaction;

namespace {

const Hash256 PARENT = crypto::Sha256(std::string("parent-block"));

// Solved block at height 5 on PARENT with difficulty 1
Block MakeSolvedBlock(const std::vector<Transaction>& txs) {
    Block block;
    block.header.height = 5;
    block.header.parent_hash = PARENT;
    block.header.timestamp = 1700000000;
    block.header.merkle_root = consensus::ComputeMerkleRoot(txs);
    block.header.producer = "0xminer";
    block.header.gas_used = txs.size() * BASE_TX_GAS;
    block.header.gas_limit = 30'000'000;
    block.transactions = txs;

    auto solution = consensus::SearchProofOfWork(block.header, 1, 1'000'000);
    REQUIRE(solution.has_value());
    block.header.difficulty = 1;
    block.header.nonce = solution->nonce;
    return block;
}

// Re-solve after a header edit so only the intended check fails
void Resolve(Block& block) {
    auto solution = consensus::SearchProofOfWork(block.header, block.header.difficulty,
                                                 1'000'000);
    REQUIRE(solution.has_value());
    block.header.nonce = solution->nonce;
}

} // namespace

TEST_CASE("Transaction checks", "[validation][transaction]") {
    ValidationState state;

    SECTION("Well-formed transaction passes") {
        REQUIRE(CheckTransaction(MakeTransaction("0xalice", 1), state));
        REQUIRE(state.IsValid());
    }

    SECTION("Missing hash") {
        Transaction tx = MakeTransaction("0xalice", 1);
        tx.hash = ZERO_HASH;
        REQUIRE_FALSE(CheckTransaction(tx, state));
        REQUIRE(state.GetRejectReason() == "tx-missing-hash");
    }

    SECTION("Missing sender") {
        Transaction tx = MakeTransaction("", 1);
        REQUIRE_FALSE(CheckTransaction(tx, state));
        REQUIRE(state.GetRejectReason() == "tx-missing-sender");
    }

    SECTION("Gas limit below base cost") {
        Transaction tx = MakeTransaction("0xalice", 1);
        tx.gas_limit = BASE_TX_GAS - 1;
        tx.hash = tx.ComputeHash();
        REQUIRE_FALSE(CheckTransaction(tx, state));
        REQUIRE(state.GetRejectReason() == "tx-bad-gas");
    }

    SECTION("Gas price whose fee overflows") {
        Transaction tx = MakeTransaction("0xalice", 1, MAX_GAS_PRICE + 1);
        REQUIRE_FALSE(CheckTransaction(tx, state));
        REQUIRE(state.GetRejectReason() == "tx-bad-gas");
    }

    SECTION("Highest representable gas price") {
        Transaction tx = MakeTransaction("0xalice", 1, MAX_GAS_PRICE);
        REQUIRE(CheckTransaction(tx, state));
        REQUIRE(tx.Fee() == MAX_GAS_PRICE * BASE_TX_GAS);
    }

    SECTION("Hash does not match contents") {
        Transaction tx = MakeTransaction("0xalice", 1);
        tx.value += 1;
        REQUIRE_FALSE(CheckTransaction(tx, state));
        REQUIRE(state.GetRejectReason() == "tx-hash-mismatch");
        REQUIRE(state.IsInvalid());
    }

    SECTION("Signature and status are not hashed") {
        Transaction tx = MakeTransaction("0xalice", 1);
        tx.signature = {0x01, 0x02};
        tx.status = TxStatus::CONFIRMED;
        REQUIRE(CheckTransaction(tx, state));
    }
}

TEST_CASE("Block validation", "[validation][block]") {
    std::vector<Transaction> txs = {MakeTransaction("0xalice", 1),
                                    MakeTransaction("0xbob", 1)};
    Block block = MakeSolvedBlock(txs);
    ValidationState state;

    SECTION("Valid block") {
        REQUIRE(ValidateBlock(block, PARENT, 5, state));
    }

    SECTION("Wrong height") {
        REQUIRE_FALSE(ValidateBlock(block, PARENT, 6, state));
        REQUIRE(state.GetRejectReason() == "bad-height");
    }

    SECTION("Wrong parent") {
        REQUIRE_FALSE(ValidateBlock(block, ZERO_HASH, 5, state));
        REQUIRE(state.GetRejectReason() == "bad-prevblk");
    }

    SECTION("Merkle root does not match transactions") {
        block.transactions.pop_back();
        REQUIRE_FALSE(ValidateBlock(block, PARENT, 5, state));
        REQUIRE(state.GetRejectReason() == "bad-merkle-root");
    }

    SECTION("Insufficient proof of work") {
        block.header.difficulty = 32;
        REQUIRE_FALSE(ValidateBlock(block, PARENT, 5, state));
        REQUIRE(state.GetRejectReason() == "high-hash");
    }

    SECTION("Duplicate transaction") {
        block.transactions = {txs[0], txs[0]};
        block.header.merkle_root = consensus::ComputeMerkleRoot(block.transactions);
        Resolve(block);
        REQUIRE_FALSE(ValidateBlock(block, PARENT, 5, state));
        REQUIRE(state.GetRejectReason() == "bad-txns-duplicate");
    }

    SECTION("Gas used does not match transaction count") {
        block.header.gas_used = BASE_TX_GAS;
        Resolve(block);
        REQUIRE_FALSE(ValidateBlock(block, PARENT, 5, state));
        REQUIRE(state.GetRejectReason() == "bad-gas");
    }

    SECTION("Gas used above the limit") {
        block.header.gas_limit = BASE_TX_GAS;
        Resolve(block);
        REQUIRE_FALSE(ValidateBlock(block, PARENT, 5, state));
        REQUIRE(state.GetRejectReason() == "bad-gas");
    }

    SECTION("Checks stop at the first failure") {
        block.header.height = 9;
        block.header.parent_hash = ZERO_HASH;
        REQUIRE_FALSE(ValidateBlock(block, PARENT, 5, state));
        REQUIRE(state.GetRejectReason() == "bad-height");
    }
}

TEST_CASE("Block fees saturate", "[validation][block]") {
    Block block;
    block.transactions = {MakeTransaction("0xalice", 1, MAX_GAS_PRICE),
                          MakeTransaction("0xbob", 1, MAX_GAS_PRICE)};
    REQUIRE(block.TotalFees() == UINT64_MAX);

    block.transactions = {MakeTransaction("0xalice", 1, 2), MakeTransaction("0xbob", 1, 3)};
    REQUIRE(block.TotalFees() == 5 * BASE_TX_GAS);
}

TEST_CASE("Overflowing gas price never reaches the ledger", "[validation][transaction]") {
    auto params = chain::ChainParams::CreateRegTest();
    settlement::HashCommitmentProofSystem proofs;
    test::TestChainstateManager chainstate(
        *params, ChainstateOptions::FromParams(*params), proofs);
    ValidationState state;

    Transaction huge = MakeTransaction("0xalice", 1, MAX_GAS_PRICE + 1);
    REQUIRE_FALSE(chainstate.SubmitTransaction(huge, state));
    REQUIRE(state.GetRejectReason() == "tx-bad-gas");
    REQUIRE(chainstate.GetStatus().pending_tx_count == 0);

    // Included directly by a producer, the block is refused as well
    ValidationState block_state;
    REQUIRE_FALSE(
        chainstate.ProcessNewBlock(test::MakeNextBlock(chainstate, {huge}), block_state));
    REQUIRE(block_state.GetRejectReason() == "bad-txns");
    REQUIRE(chainstate.GetHeight() == 0);
    REQUIRE(chainstate.GetStatus().rewards.native_gas_fees == 0);
}

TEST_CASE("Settlement proof check", "[validation][settlement]") {
    settlement::HashCommitmentProofSystem proofs;
    Block block = MakeSolvedBlock({MakeTransaction("0xalice", 1)});
    ValidationState state;

    SECTION("Fraud-proof mode needs no artifact") {
        REQUIRE(CheckSettlementProof(block, settlement::SettlementMode::FRAUD_PROOF,
                                     proofs, state));
    }

    SECTION("ZK mode rejects a missing proof") {
        REQUIRE_FALSE(CheckSettlementProof(block, settlement::SettlementMode::ZK_PROOF,
                                           proofs, state));
        REQUIRE(state.GetRejectReason() == "bad-settlement-proof");
    }

    SECTION("ZK mode accepts a proof over this block") {
        block.settlement_proof = proofs.Generate(SettlementProofInputs(block.header));
        REQUIRE(CheckSettlementProof(block, settlement::SettlementMode::ZK_PROOF,
                                     proofs, state));
    }

    SECTION("ZK mode rejects a proof for another block") {
        BlockHeader other = block.header;
        other.height += 1;
        block.settlement_proof = proofs.Generate(SettlementProofInputs(other));
        REQUIRE_FALSE(CheckSettlementProof(block, settlement::SettlementMode::ZK_PROOF,
                                           proofs, state));
        REQUIRE(state.GetRejectReason() == "bad-settlement-proof");
    }

    SECTION("ZK mode rejects a forged proof") {
        block.settlement_proof = proofs.Generate(SettlementProofInputs(block.header));
        block.settlement_proof->data[0] ^= 0xff;
        REQUIRE_FALSE(CheckSettlementProof(block, settlement::SettlementMode::ZK_PROOF,
                                           proofs, state));
    }
}

TEST_CASE("Validation state formatting", "[validation]") {
    ValidationState state;
    state.Invalid("bad-gas", "gas_used 1");
    REQUIRE(state.ToString() == "bad-gas (gas_used 1)");

    ValidationState plain;
    plain.Invalid("bad-merkle-root");
    REQUIRE(plain.ToString() == "bad-merkle-root");
}
