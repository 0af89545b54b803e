// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Unit tests for auxiliary proof of work

#include "consensus/merkle.hpp"
#include "merge_mining/aux_proof.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>

using namespace codl3;
using namespace codl3::merge_mining;

namespace {

std::vector<Hash256> NativeHashes(size_t n) {
    std::vector<Hash256> hashes;
    for (size_t i = 0; i < n; ++i) {
        hashes.push_back(crypto::Sha256("native-" + std::to_string(i)));
    }
    return hashes;
}

const Hash256 ANCHOR = crypto::Sha256(std::string("anchor-block"));

} // namespace

TEST_CASE("Aux proof construction", "[auxpow]") {
    SECTION("Single native block") {
        auto hashes = NativeHashes(1);
        AuxProof proof = BuildAuxProof(hashes, ANCHOR);

        REQUIRE(proof.native_block_hash == hashes[0]);
        REQUIRE(proof.aux_root == hashes[0]);
        REQUIRE(proof.branch.empty());
        REQUIRE(proof.commitment == ComputeAuxCommitment(hashes[0], ANCHOR));
        REQUIRE(proof.Verify());
    }

    SECTION("Several native blocks commit to the latest") {
        auto hashes = NativeHashes(5);
        AuxProof proof = BuildAuxProof(hashes, ANCHOR);

        REQUIRE(proof.native_block_hash == hashes.back());
        REQUIRE(proof.index == 4);
        REQUIRE(proof.aux_root == consensus::ComputeMerkleRoot(hashes));
        REQUIRE(proof.Verify());
    }

    SECTION("No native blocks") {
        REQUIRE_THROWS_AS(BuildAuxProof({}, ANCHOR), std::invalid_argument);
    }
}

TEST_CASE("Aux proof verification detects tampering", "[auxpow]") {
    AuxProof proof = BuildAuxProof(NativeHashes(3), ANCHOR);

    SECTION("Other native block") {
        proof.native_block_hash = crypto::Sha256(std::string("forged"));
        REQUIRE_FALSE(proof.Verify());
    }

    SECTION("Other anchor block") {
        proof.anchor_block_hash = crypto::Sha256(std::string("other-anchor"));
        REQUIRE_FALSE(proof.Verify());
    }

    SECTION("Broken branch") {
        proof.branch[0][0] ^= 0x01;
        REQUIRE_FALSE(proof.Verify());
    }

    SECTION("Commitment without the magic prefix") {
        std::vector<uint8_t> preimage(proof.aux_root.begin(), proof.aux_root.end());
        preimage.insert(preimage.end(), ANCHOR.begin(), ANCHOR.end());
        proof.commitment = crypto::Sha256(preimage);
        REQUIRE_FALSE(proof.Verify());
    }
}
