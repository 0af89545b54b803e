// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Validator set scenarios through the chainstate

#include "chain/chainparams.hpp"
#include "settlement/proof_system.hpp"
#include "test_chainstate_manager.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace codl3;
using namespace codl3::test;
using staking::StakeResult;

namespace {

struct StakingFixture {
    explicit StakingFixture(uint32_t fee_share_percent = 10)
        : params(chain::ChainParams::CreateRegTest()),
          chainstate(*params, MakeOptions(*params, fee_share_percent), proofs) {}

    static validation::ChainstateOptions MakeOptions(const chain::ChainParams& params,
                                                     uint32_t fee_share_percent)
    {
        auto options = validation::ChainstateOptions::FromParams(params);
        options.validator_fee_share_percent = fee_share_percent;
        return options;
    }

    // Connect a block with one gas-price-1 transaction per sender
    void ConnectBlockFrom(const std::vector<std::string>& senders,
                          const Address& producer = "0xproducer")
    {
        std::vector<Transaction> txs;
        validation::ValidationState state;
        for (const auto& sender : senders) {
            Transaction tx = MakeTransaction(sender, chainstate.GetHeight() + 1);
            REQUIRE(chainstate.SubmitTransaction(tx, state));
            txs.push_back(tx);
        }
        REQUIRE(chainstate.ProcessNewBlock(MakeNextBlock(chainstate, txs, producer), state));
    }

    uint64_t Rewards(const Address& address) const
    {
        return chainstate.GetValidator(address)->total_rewards;
    }

    std::unique_ptr<chain::ChainParams> params;
    settlement::HashCommitmentProofSystem proofs;
    TestChainstateManager chainstate;
};

} // namespace

TEST_CASE("Validator lifecycle", "[staking][integration]") {
    StakingFixture f;

    REQUIRE(f.chainstate.Stake("0xv1", 1000) == StakeResult::OK);
    REQUIRE(f.chainstate.Stake("0xv1", 1000) == StakeResult::OK);
    REQUIRE(f.chainstate.GetValidator("0xv1")->stake == 2000);

    SECTION("Partial unstake below the minimum deactivates") {
        REQUIRE(f.chainstate.Unstake("0xv1", 1500) == StakeResult::OK);
        auto v = f.chainstate.GetValidator("0xv1");
        REQUIRE(v->stake == 500);
        REQUIRE_FALSE(v->active);

        auto status = f.chainstate.GetStatus();
        REQUIRE(status.total_staked == 500);
        REQUIRE(status.active_validators == 0);

        // Top-ups still have to meet the minimum on their own
        REQUIRE(f.chainstate.Stake("0xv1", 500) == StakeResult::BELOW_MINIMUM);
        REQUIRE(f.chainstate.Stake("0xv1", 1000) == StakeResult::OK);
        REQUIRE(f.chainstate.GetValidator("0xv1")->active);
    }

    SECTION("Full unstake keeps the record") {
        REQUIRE(f.chainstate.Unstake("0xv1", 2000) == StakeResult::OK);
        auto v = f.chainstate.GetValidator("0xv1");
        REQUIRE(v.has_value());
        REQUIRE(v->stake == 0);
        REQUIRE(f.chainstate.GetValidators().size() == 1);
    }

    SECTION("Default slash uses the configured percent") {
        uint64_t slashed = 0;
        REQUIRE(f.chainstate.Slash("0xv1", std::nullopt, &slashed) == StakeResult::OK);
        REQUIRE(slashed == 1000);

        auto v = f.chainstate.GetValidator("0xv1");
        REQUIRE(v->stake == 1000);
        REQUIRE(v->total_slashed == 1000);
        REQUIRE(v->active);

        REQUIRE(f.chainstate.Slash("0xv1", 50u, &slashed) == StakeResult::OK);
        REQUIRE(slashed == 500);
        REQUIRE_FALSE(f.chainstate.GetValidator("0xv1")->active);
        REQUIRE(f.chainstate.GetStatus().total_staked == 500);
    }

    SECTION("Unknown validators") {
        REQUIRE(f.chainstate.Unstake("0xghost", 1) == StakeResult::NOT_FOUND);
        REQUIRE(f.chainstate.Slash("0xghost", std::nullopt) == StakeResult::NOT_FOUND);
        REQUIRE_FALSE(f.chainstate.GetValidator("0xghost").has_value());
    }
}

TEST_CASE("Active set bound", "[staking][integration]") {
    StakingFixture f;
    for (int i = 0; i < 4; ++i) {
        REQUIRE(f.chainstate.Stake("0xv" + std::to_string(i), 1000) == StakeResult::OK);
    }

    REQUIRE(f.chainstate.Stake("0xlate", 1000) == StakeResult::SET_FULL);
    // Members of the set may still add stake
    REQUIRE(f.chainstate.Stake("0xv0", 1000) == StakeResult::OK);

    SECTION("Unstaking frees a slot") {
        REQUIRE(f.chainstate.Unstake("0xv3", 1000) == StakeResult::OK);
        REQUIRE(f.chainstate.Stake("0xlate", 1000) == StakeResult::OK);
        REQUIRE(f.chainstate.GetStatus().active_validators == 4);
    }

    SECTION("Slashing below the minimum frees a slot") {
        REQUIRE(f.chainstate.Slash("0xv3", 100u) == StakeResult::OK);
        REQUIRE(f.chainstate.Stake("0xlate", 1000) == StakeResult::OK);
    }
}

TEST_CASE("Fee share reaches validators through blocks", "[staking][integration]") {
    SECTION("Share waits for validators and is carried forward") {
        StakingFixture f;
        f.ConnectBlockFrom({"0xa"});

        auto status = f.chainstate.GetStatus();
        REQUIRE(status.rewards.native_gas_fees == BASE_TX_GAS);
        REQUIRE(status.rewards.validator_fee_share == 2100);
        REQUIRE(status.undistributed_fee_share == 2100);

        for (const char* v : {"0xv1", "0xv2", "0xv3"}) {
            REQUIRE(f.chainstate.Stake(v, 1000) == StakeResult::OK);
        }
        f.ConnectBlockFrom({"0xb"});

        REQUIRE(f.Rewards("0xv1") == 1400);
        REQUIRE(f.Rewards("0xv2") == 1400);
        REQUIRE(f.Rewards("0xv3") == 1400);
        REQUIRE(f.chainstate.GetStatus().undistributed_fee_share == 0);
    }

    SECTION("Uneven splits keep the remainder") {
        StakingFixture f(7);
        for (int i = 0; i < 4; ++i) {
            REQUIRE(f.chainstate.Stake("0xv" + std::to_string(i), 1000) == StakeResult::OK);
        }

        // 7% of 21000 = 1470 over four validators
        f.ConnectBlockFrom({"0xa"});
        REQUIRE(f.Rewards("0xv0") == 367);
        REQUIRE(f.chainstate.GetStatus().undistributed_fee_share == 2);

        // 1470 + 2 carried = 1472 over four
        f.ConnectBlockFrom({"0xb"});
        REQUIRE(f.Rewards("0xv0") == 367 + 368);
        REQUIRE(f.chainstate.GetStatus().undistributed_fee_share == 0);
    }

    SECTION("Inactive validators are skipped") {
        StakingFixture f;
        REQUIRE(f.chainstate.Stake("0xv1", 1000) == StakeResult::OK);
        REQUIRE(f.chainstate.Stake("0xv2", 1000) == StakeResult::OK);
        REQUIRE(f.chainstate.Unstake("0xv2", 1) == StakeResult::OK);

        f.ConnectBlockFrom({"0xa", "0xb"});
        REQUIRE(f.Rewards("0xv1") == 4200);
        REQUIRE(f.Rewards("0xv2") == 0);
    }

    SECTION("Producers are credited when staked") {
        StakingFixture f;
        REQUIRE(f.chainstate.Stake("0xv1", 1000) == StakeResult::OK);
        f.ConnectBlockFrom({"0xa"}, "0xv1");
        f.ConnectBlockFrom({"0xb"}, "0xunstaked");
        f.ConnectBlockFrom({"0xc"}, "0xv1");

        auto v = f.chainstate.GetValidator("0xv1");
        REQUIRE(v->blocks_produced == 2);
        REQUIRE(v->last_active_height == 3);
        REQUIRE_FALSE(f.chainstate.GetValidator("0xunstaked").has_value());
    }
}

TEST_CASE("Direct reward distribution", "[staking][integration]") {
    StakingFixture f;
    REQUIRE(f.chainstate.DistributeRewards(1000) == 0);

    REQUIRE(f.chainstate.Stake("0xv1", 1000) == StakeResult::OK);
    REQUIRE(f.chainstate.Stake("0xv2", 1000) == StakeResult::OK);
    REQUIRE(f.chainstate.DistributeRewards(1001) == 1000);
    REQUIRE(f.Rewards("0xv1") == 500);
    REQUIRE(f.chainstate.DistributeRewards(1) == 0);
}
