// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Unit tests for Merkle root and branch computation

#include "consensus/merkle.hpp"
#include "crypto/sha256.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace codl3;
using namespace codl3::consensus;

namespace {

std::vector<Hash256> MakeLeaves(size_t n) {
    std::vector<Hash256> leaves;
    for (size_t i = 0; i < n; ++i) {
        leaves.push_back(crypto::Sha256("leaf-" + std::to_string(i)));
    }
    return leaves;
}

} // namespace

TEST_CASE("Merkle root of small trees", "[merkle]") {
    SECTION("Empty list yields the zero hash") {
        REQUIRE(ComputeMerkleRoot(std::vector<Hash256>{}) == ZERO_HASH);
        REQUIRE(ComputeMerkleRoot(std::vector<Transaction>{}) == ZERO_HASH);
    }

    SECTION("Single leaf is its own root") {
        auto leaves = MakeLeaves(1);
        REQUIRE(ComputeMerkleRoot(leaves) == leaves[0]);
    }

    SECTION("Two leaves hash as a pair") {
        auto leaves = MakeLeaves(2);
        REQUIRE(ComputeMerkleRoot(leaves) == crypto::Sha256Pair(leaves[0], leaves[1]));
    }

    SECTION("Odd level pairs the last node with itself") {
        auto leaves = MakeLeaves(3);
        Hash256 left = crypto::Sha256Pair(leaves[0], leaves[1]);
        Hash256 right = crypto::Sha256Pair(leaves[2], leaves[2]);
        REQUIRE(ComputeMerkleRoot(leaves) == crypto::Sha256Pair(left, right));
    }
}

TEST_CASE("Merkle root is order sensitive", "[merkle]") {
    auto leaves = MakeLeaves(4);
    auto swapped = leaves;
    std::swap(swapped[0], swapped[1]);
    REQUIRE(ComputeMerkleRoot(leaves) != ComputeMerkleRoot(swapped));
}

TEST_CASE("Merkle root over transactions uses stored hashes", "[merkle]") {
    std::vector<Transaction> txs(3);
    std::vector<Hash256> hashes;
    for (size_t i = 0; i < txs.size(); ++i) {
        txs[i].hash = crypto::Sha256("tx-" + std::to_string(i));
        hashes.push_back(txs[i].hash);
    }
    REQUIRE(ComputeMerkleRoot(txs) == ComputeMerkleRoot(hashes));
}

TEST_CASE("Merkle branch folds back to the root", "[merkle]") {
    for (size_t n : {1u, 2u, 3u, 5u, 8u}) {
        auto leaves = MakeLeaves(n);
        Hash256 root = ComputeMerkleRoot(leaves);

        for (size_t i = 0; i < n; ++i) {
            auto branch = ComputeMerkleBranch(leaves, i);
            REQUIRE(ComputeRootFromBranch(leaves[i], branch, i) == root);
        }
    }

    SECTION("Single-leaf branch is empty") {
        REQUIRE(ComputeMerkleBranch(MakeLeaves(1), 0).empty());
    }

    SECTION("Wrong leaf does not reach the root") {
        auto leaves = MakeLeaves(4);
        auto branch = ComputeMerkleBranch(leaves, 2);
        REQUIRE(ComputeRootFromBranch(leaves[1], branch, 2) != ComputeMerkleRoot(leaves));
    }
}
