// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Unit tests for proof-of-work checks and nonce search

#include "consensus/pow.hpp"
#include "primitives/block.hpp"
#include <catch2/catch_test_macros.hpp>
#include <atomic>

using namespace codl3;
using namespace codl3::consensus;

namespace {

BlockHeader MakeHeader() {
    BlockHeader header;
    header.height = 7;
    header.parent_hash = crypto::Sha256(std::string("parent"));
    header.timestamp = 1700000000;
    header.producer = "0xminer";
    header.gas_limit = 30'000'000;
    return header;
}

} // namespace

TEST_CASE("Leading zero bytes", "[pow]") {
    Hash256 hash{};
    REQUIRE(CountLeadingZeroBytes(hash) == 32);

    hash[0] = 0x01;
    REQUIRE(CountLeadingZeroBytes(hash) == 0);

    hash[0] = 0x00;
    hash[2] = 0x80;
    REQUIRE(CountLeadingZeroBytes(hash) == 2);
}

TEST_CASE("Difficulty check", "[pow]") {
    Hash256 hash{};
    hash[2] = 0xff;

    SECTION("Difficulty zero accepts anything") {
        Hash256 ones;
        ones.fill(0xff);
        REQUIRE(CheckProofOfWork(ones, 0));
    }

    SECTION("Hash with two zero bytes") {
        REQUIRE(CheckProofOfWork(hash, 1));
        REQUIRE(CheckProofOfWork(hash, 2));
        REQUIRE_FALSE(CheckProofOfWork(hash, 3));
    }

    SECTION("Difficulty is capped at the hash width") {
        REQUIRE(RequiredLeadingZeroBytes(1000) == 32);
        REQUIRE(CheckProofOfWork(ZERO_HASH, 1000));
    }
}

TEST_CASE("Nonce search", "[pow]") {
    BlockHeader header = MakeHeader();

    SECTION("Solution hash is the hash of the finished header") {
        auto solution = SearchProofOfWork(header, 1, 1'000'000);
        REQUIRE(solution.has_value());

        BlockHeader solved = header;
        solved.difficulty = 1;
        solved.nonce = solution->nonce;
        REQUIRE(solved.GetHash() == solution->hash);
        REQUIRE(CheckProofOfWork(solved.GetHash(), 1));
    }

    SECTION("Difficulty zero takes the first nonce") {
        std::atomic<uint64_t> hashes{0};
        auto solution = SearchProofOfWork(header, 0, 10, nullptr, &hashes);
        REQUIRE(solution.has_value());
        REQUIRE(solution->nonce == 0);
        REQUIRE(hashes.load() == 1);
    }

    SECTION("Exhausted nonce range yields nothing") {
        std::atomic<uint64_t> hashes{0};
        auto solution = SearchProofOfWork(header, 32, 100, nullptr, &hashes);
        REQUIRE_FALSE(solution.has_value());
        REQUIRE(hashes.load() == 100);
    }

    SECTION("Abort flag stops the search") {
        std::atomic<bool> abort{true};
        auto solution = SearchProofOfWork(header, 32, 1'000'000, &abort);
        REQUIRE_FALSE(solution.has_value());
    }
}

TEST_CASE("Nonce offset matches serialization", "[pow]") {
    BlockHeader header = MakeHeader();
    header.nonce = 0x0102030405060708ULL;
    auto data = header.Serialize();
    size_t offset = header.NonceOffset();
    REQUIRE(data[offset] == 0x08);
    REQUIRE(data[offset + 7] == 0x01);
}
