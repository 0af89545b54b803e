// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Unit tests for the settlement proof system

#include "settlement/proof_system.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace codl3::settlement;

TEST_CASE("Settlement mode parsing", "[settlement]") {
    SettlementMode mode = SettlementMode::FRAUD_PROOF;

    REQUIRE(ParseSettlementMode("zk", mode));
    REQUIRE(mode == SettlementMode::ZK_PROOF);
    REQUIRE(ParseSettlementMode("fraud-proof", mode));
    REQUIRE(mode == SettlementMode::FRAUD_PROOF);
    REQUIRE_FALSE(ParseSettlementMode("optimistic", mode));

    REQUIRE(SettlementModeToString(SettlementMode::ZK_PROOF) == "zk-proof");
}

TEST_CASE("Hash commitment proofs", "[settlement]") {
    HashCommitmentProofSystem proofs;
    ProofBlob blob = proofs.Generate({"42", "abcd"});

    SECTION("Generated proof verifies") {
        REQUIRE(blob.system == proofs.Name());
        REQUIRE(blob.data.size() == 32);
        REQUIRE(proofs.Verify(blob));
    }

    SECTION("Deterministic for equal inputs") {
        REQUIRE(proofs.Generate({"42", "abcd"}) == blob);
    }

    SECTION("Tampered inputs fail") {
        blob.inputs[0] = "43";
        REQUIRE_FALSE(proofs.Verify(blob));
    }

    SECTION("Tampered data fails") {
        blob.data[0] ^= 0x01;
        REQUIRE_FALSE(proofs.Verify(blob));
    }

    SECTION("Foreign system name fails") {
        blob.system = "groth16";
        REQUIRE_FALSE(proofs.Verify(blob));
    }

    SECTION("Input boundaries are part of the commitment") {
        REQUIRE(proofs.Generate({"ab", "c"}).data != proofs.Generate({"a", "bc"}).data);
    }
}
