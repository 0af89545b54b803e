// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Unit tests for the bridge settlement ledger

#include "bridge/settlement_ledger.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace codl3;
using namespace codl3::bridge;

TEST_CASE("Bridge transfer creation", "[bridge]") {
    SettlementLedger ledger;

    std::string deposit = ledger.RecordDeposit("0xl1user", "0xl2user", 500, 100, 1'000);
    std::string withdrawal = ledger.RecordWithdrawal("0xl2user", "0xl1user", 200, 100, 1'000);

    REQUIRE(deposit.rfind("bridge_", 0) == 0);
    REQUIRE(withdrawal.rfind("withdraw_", 0) == 0);
    REQUIRE(deposit != withdrawal);

    const BridgeTransaction* tx = ledger.Get(deposit);
    REQUIRE(tx != nullptr);
    REQUIRE(tx->direction == BridgeDirection::DEPOSIT);
    REQUIRE(tx->status == BridgeStatus::PENDING);
    REQUIRE(tx->amount == 500);
    REQUIRE(tx->l1_height == 100);
    REQUIRE(tx->created_at == 1'000);

    SECTION("Identical requests get distinct ids") {
        std::string again = ledger.RecordDeposit("0xl1user", "0xl2user", 500, 100, 1'000);
        REQUIRE(again != deposit);
    }

    SECTION("Listing keeps creation order") {
        auto all = ledger.GetAll();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].tx_id == deposit);
        REQUIRE(all[1].tx_id == withdrawal);
    }

    REQUIRE(ledger.Get("bridge_missing") == nullptr);
}

TEST_CASE("L1 confirmation depth", "[bridge]") {
    SettlementLedger ledger;
    std::string early = ledger.RecordDeposit("0xa", "0xb", 1, 100, 0);
    std::string late = ledger.RecordDeposit("0xa", "0xb", 1, 110, 0);

    SECTION("Shallow L1 chain confirms only height zero") {
        std::string genesis = ledger.RecordDeposit("0xa", "0xb", 1, 0, 0);

        REQUIRE(ledger.AdvanceL1Confirmations(5, 12) == 1);
        REQUIRE(ledger.GetConfirmedHeight() == 0);
        REQUIRE(ledger.Get(genesis)->status == BridgeStatus::CONFIRMED);
        REQUIRE(ledger.Get(early)->status == BridgeStatus::PENDING);
    }

    SECTION("Transfers at or below the confirmed height are promoted") {
        REQUIRE(ledger.AdvanceL1Confirmations(112, 12) == 1);
        REQUIRE(ledger.GetConfirmedHeight() == 100);
        REQUIRE(ledger.Get(early)->status == BridgeStatus::CONFIRMED);
        REQUIRE(ledger.Get(late)->status == BridgeStatus::PENDING);

        REQUIRE(ledger.AdvanceL1Confirmations(122, 12) == 1);
        REQUIRE(ledger.Get(late)->status == BridgeStatus::CONFIRMED);
    }

    SECTION("Repeating an observation changes nothing") {
        ledger.AdvanceL1Confirmations(112, 12);
        REQUIRE(ledger.AdvanceL1Confirmations(112, 12) == 0);
        REQUIRE(ledger.GetConfirmedHeight() == 100);
    }

    SECTION("Confirmed height never moves backwards") {
        ledger.AdvanceL1Confirmations(150, 12);
        REQUIRE(ledger.AdvanceL1Confirmations(50, 12) == 0);
        REQUIRE(ledger.GetConfirmedHeight() == 138);
    }

    SECTION("Zero confirmations confirms the head itself") {
        REQUIRE(ledger.AdvanceL1Confirmations(100, 0) == 1);
        REQUIRE(ledger.GetConfirmedHeight() == 100);
    }
}

TEST_CASE("Completion and failure", "[bridge]") {
    SettlementLedger ledger;
    std::string id = ledger.RecordWithdrawal("0xa", "0xb", 10, 0, 0);

    SECTION("Complete from pending") {
        REQUIRE(ledger.Complete(id) == BridgeResult::OK);
        REQUIRE(ledger.Get(id)->status == BridgeStatus::COMPLETED);
        REQUIRE(ledger.GetOpen().empty());
    }

    SECTION("Complete from confirmed") {
        ledger.AdvanceL1Confirmations(10, 2);
        REQUIRE(ledger.Get(id)->status == BridgeStatus::CONFIRMED);
        REQUIRE(ledger.Complete(id) == BridgeResult::OK);
    }

    SECTION("Fail records the reason") {
        REQUIRE(ledger.Fail(id, "l1 reverted") == BridgeResult::OK);
        REQUIRE(ledger.Get(id)->status == BridgeStatus::FAILED);
        REQUIRE(ledger.Get(id)->failure_reason == "l1 reverted");
    }

    SECTION("Terminal states are final") {
        ledger.Complete(id);
        REQUIRE(ledger.Complete(id) == BridgeResult::INVALID_TRANSITION);
        REQUIRE(ledger.Fail(id, "late") == BridgeResult::INVALID_TRANSITION);
        REQUIRE(ledger.Get(id)->status == BridgeStatus::COMPLETED);

        // Terminal transfers are never re-promoted
        REQUIRE(ledger.AdvanceL1Confirmations(100, 0) == 0);
    }

    SECTION("Unknown id") {
        REQUIRE(ledger.Complete("withdraw_none") == BridgeResult::NOT_FOUND);
        REQUIRE(ledger.Fail("withdraw_none", "x") == BridgeResult::NOT_FOUND);
    }
}

TEST_CASE("Fraud proof window", "[bridge][fraud]") {
    SettlementLedger ledger;
    const int64_t block_time = 10'000;
    const int64_t period = 3'600;
    const std::vector<uint8_t> proof = {0xde, 0xad};

    SECTION("Accepted inside the window") {
        REQUIRE(ledger.SubmitFraudProof(4, true, block_time, "0xwatcher", proof,
                                        block_time + period - 1, period) == BridgeResult::OK);
        REQUIRE(ledger.GetFraudProofCount() == 1);
        REQUIRE(ledger.GetDisputedHeights().count(4) == 1);
        REQUIRE(ledger.GetFraudProofs()[0].challenger == "0xwatcher");
        REQUIRE(ledger.GetFraudProofs()[0].proof == proof);
    }

    SECTION("Rejected once the window has closed") {
        REQUIRE(ledger.SubmitFraudProof(4, true, block_time, "0xwatcher", proof,
                                        block_time + period, period) ==
                BridgeResult::CHALLENGE_EXPIRED);
        REQUIRE(ledger.GetFraudProofCount() == 0);
    }

    SECTION("Unknown block") {
        REQUIRE(ledger.SubmitFraudProof(99, false, 0, "0xwatcher", proof, block_time, period) ==
                BridgeResult::UNKNOWN_BLOCK);
        REQUIRE(ledger.GetDisputedHeights().empty());
    }

    SECTION("Several proofs against one block") {
        ledger.SubmitFraudProof(4, true, block_time, "0xa", proof, block_time, period);
        ledger.SubmitFraudProof(4, true, block_time, "0xb", proof, block_time, period);
        REQUIRE(ledger.GetFraudProofCount() == 2);
        REQUIRE(ledger.GetDisputedHeights().size() == 1);
    }
}

TEST_CASE("Bridge result and status names", "[bridge]") {
    REQUIRE(BridgeResultToString(BridgeResult::INVALID_TRANSITION) == "InvalidTransition");
    REQUIRE(BridgeResultToString(BridgeResult::CHALLENGE_EXPIRED) == "ChallengeExpired");
    REQUIRE(BridgeResultToString(BridgeResult::UNKNOWN_BLOCK) == "UnknownBlock");
    REQUIRE(BridgeStatusToString(BridgeStatus::CONFIRMED) == "confirmed");
    REQUIRE(BridgeDirectionToString(BridgeDirection::WITHDRAWAL) == "withdrawal");
}
