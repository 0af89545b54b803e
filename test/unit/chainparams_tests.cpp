// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Test suite for chain parameters

#include "chain/chainparams.hpp"
#include "consensus/merkle.hpp"
#include "validation/chainstate_manager.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace codl3;
using namespace codl3::chain;

TEST_CASE("ChainParams creation", "[chainparams]") {
    SECTION("Create MainNet") {
        auto params = ChainParams::CreateMainNet();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetChainType() == ChainType::MAIN);
        REQUIRE(params->GetChainTypeString() == "main");
        REQUIRE(params->GetDefaultRPCPort() == 9944);

        const auto& consensus = params->GetConsensus();
        REQUIRE(consensus.nMinStake == 80'000'000'000);
        REQUIRE(consensus.nMaxValidators == 21);
        REQUIRE(consensus.nSlashingPercent == 50);
        REQUIRE(consensus.nChallengePeriod == 7 * 24 * 60 * 60);
        REQUIRE(consensus.nL1Confirmations == 12);
        REQUIRE(consensus.nAnchorBlockReward == 13'000);
    }

    SECTION("Create TestNet") {
        auto params = ChainParams::CreateTestNet();
        REQUIRE(params->GetChainType() == ChainType::TESTNET);
        REQUIRE(params->GetChainTypeString() == "test");
        REQUIRE(params->GetDefaultRPCPort() == 19944);
    }

    SECTION("Create RegTest") {
        auto params = ChainParams::Create(ChainType::REGTEST);
        REQUIRE(params->GetChainType() == ChainType::REGTEST);
        REQUIRE(params->GetChainTypeString() == "regtest");
        REQUIRE(params->GetDefaultRPCPort() == 29944);

        // Cheap enough to mine inside unit tests
        REQUIRE(params->GetConsensus().nDifficulty == 1);
        REQUIRE(params->GetDefaultSettlementMode() ==
                settlement::SettlementMode::FRAUD_PROOF);
    }
}

TEST_CASE("Genesis block creation", "[chainparams]") {
    auto params = ChainParams::CreateRegTest();
    const auto& genesis = params->GenesisBlock();

    SECTION("Genesis block properties") {
        REQUIRE(genesis.header.height == 0);
        REQUIRE(genesis.header.parent_hash == ZERO_HASH);
        REQUIRE(genesis.transactions.empty());
        REQUIRE(genesis.header.merkle_root == ZERO_HASH);
        REQUIRE(genesis.header.timestamp > 0);
    }

    SECTION("Genesis hash") {
        REQUIRE(genesis.GetHash() != ZERO_HASH);
        REQUIRE(params->GetConsensus().hashGenesisBlock == genesis.GetHash());
    }

    SECTION("Networks have distinct genesis blocks") {
        REQUIRE(ChainParams::CreateMainNet()->GenesisBlock().GetHash() !=
                ChainParams::CreateTestNet()->GenesisBlock().GetHash());
    }
}

TEST_CASE("Chainstate options from params", "[chainparams]") {
    auto params = ChainParams::CreateRegTest();
    auto options = validation::ChainstateOptions::FromParams(*params);
    const auto& consensus = params->GetConsensus();

    REQUIRE(options.difficulty == consensus.nDifficulty);
    REQUIRE(options.min_stake == consensus.nMinStake);
    REQUIRE(options.max_validators == consensus.nMaxValidators);
    REQUIRE(options.challenge_period == consensus.nChallengePeriod);
    REQUIRE(options.l1_confirmations == consensus.nL1Confirmations);
    REQUIRE(options.validator_fee_share_percent == 10);
}
