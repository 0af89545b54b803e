// Copyright (c) 2024 C0DL3
// Distributed under the MIT software license
// Unit tests for hex and integer parsing

#include "util/strencodings.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace codl3;
using namespace codl3::util;

TEST_CASE("Hex encoding", "[strencodings]") {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    REQUIRE(HexStr(data) == "000fabff");
    REQUIRE(HexStr(std::vector<uint8_t>{}).empty());

    Hash256 hash{};
    hash[31] = 0x01;
    std::string hex = HexStr(hash);
    REQUIRE(hex.size() == 64);
    REQUIRE(hex.substr(62) == "01");
}

TEST_CASE("Hex parsing", "[strencodings]") {
    std::vector<uint8_t> out;

    SECTION("Plain and prefixed") {
        REQUIRE(ParseHex("deadBEEF", out));
        REQUIRE(out == std::vector<uint8_t>{0xde, 0xad, 0xbe, 0xef});

        REQUIRE(ParseHex("0x0102", out));
        REQUIRE(out == std::vector<uint8_t>{0x01, 0x02});
    }

    SECTION("Rejects odd length and bad digits") {
        REQUIRE_FALSE(ParseHex("abc", out));
        REQUIRE_FALSE(ParseHex("zz", out));
        REQUIRE_FALSE(ParseHex("0x1", out));
    }

    SECTION("Hash requires exactly 32 bytes") {
        Hash256 hash{};
        std::string hex(64, 'a');
        REQUIRE(ParseHash256(hex, hash));
        REQUIRE(hash[0] == 0xaa);
        REQUIRE(ParseHash256("0x" + hex, hash));
        REQUIRE_FALSE(ParseHash256(hex.substr(2), hash));
        REQUIRE_FALSE(ParseHash256(hex + "aa", hash));
    }
}

TEST_CASE("Unsigned integer parsing", "[strencodings]") {
    uint64_t value = 0;

    SECTION("Decimal") {
        REQUIRE(ParseUInt64("12345", value));
        REQUIRE(value == 12345);
        REQUIRE(ParseUInt64("18446744073709551615", value));
        REQUIRE(value == UINT64_MAX);
    }

    SECTION("Ethereum hex quantities") {
        REQUIRE(ParseUInt64("0x1b4", value));
        REQUIRE(value == 436);
        REQUIRE(ParseUInt64("0X0", value));
        REQUIRE(value == 0);
    }

    SECTION("Rejects garbage and overflow") {
        REQUIRE_FALSE(ParseUInt64("", value));
        REQUIRE_FALSE(ParseUInt64("0x", value));
        REQUIRE_FALSE(ParseUInt64("-1", value));
        REQUIRE_FALSE(ParseUInt64("12a", value));
        REQUIRE_FALSE(ParseUInt64("18446744073709551616", value));
        REQUIRE_FALSE(ParseUInt64("0x10000000000000000", value));
    }
}

TEST_CASE("Narrowed integer parsing", "[util][strencodings]") {
    uint32_t small = 7;
    REQUIRE(ParseUInt32("4294967295", small));
    REQUIRE(small == UINT32_MAX);

    // Would wrap to 10 if truncated
    REQUIRE_FALSE(ParseUInt32("4294967306", small));
    REQUIRE(small == UINT32_MAX);
    REQUIRE_FALSE(ParseUInt32("0x100000000", small));

    int64_t seconds = 0;
    REQUIRE(ParseNonNegativeInt64("9223372036854775807", seconds));
    REQUIRE(seconds == INT64_MAX);
    REQUIRE_FALSE(ParseNonNegativeInt64("9223372036854775808", seconds));
    REQUIRE_FALSE(ParseNonNegativeInt64("-5", seconds));
}
