// ETHLEDGER - Hex Encoding Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/core/hex.h>

#include <stdexcept>

namespace ethledger {
namespace test {

// ============================================================================
// Encoding
// ============================================================================

TEST(HexTest, BytesToHexIsLowercase) {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data), "000fabff");
}

TEST(HexTest, BytesToHexEmpty) {
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>{}), "");
}

TEST(HexTest, BytesToHexFromArray) {
    std::array<uint8_t, 2> data = {0xde, 0xad};
    EXPECT_EQ(BytesToHex(data), "dead");
}

// ============================================================================
// Decoding
// ============================================================================

TEST(HexTest, HexToBytesAcceptsPrefixAndMixedCase) {
    std::vector<uint8_t> expected = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(HexToBytes("deadbeef"), expected);
    EXPECT_EQ(HexToBytes("0xDeAdBeEf"), expected);
    EXPECT_TRUE(HexToBytes("0x").empty());
}

TEST(HexTest, HexToBytesRejectsOddLength) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
}

TEST(HexTest, HexToBytesRejectsInvalidCharacters) {
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("0x0g"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_TRUE(IsValidHex("ABcd"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("abc"));
    EXPECT_FALSE(IsValidHex("0x00"));
}

// ============================================================================
// Prefix Helpers
// ============================================================================

TEST(HexTest, PrefixHandling) {
    EXPECT_TRUE(IsHexPrefixed("0x12"));
    EXPECT_TRUE(IsHexPrefixed("0X12"));
    EXPECT_FALSE(IsHexPrefixed("12"));
    EXPECT_FALSE(IsHexPrefixed("0"));

    EXPECT_EQ(StripHexPrefix("0xabc"), "abc");
    EXPECT_EQ(StripHexPrefix("abc"), "abc");
    EXPECT_EQ(AddHexPrefix("abc"), "0xabc");
    EXPECT_EQ(AddHexPrefix("0xabc"), "0xabc");
}

TEST(HexTest, PadLeftHex) {
    EXPECT_EQ(PadLeftHex("1", 2), "01");
    EXPECT_EQ(PadLeftHex("", 2), "00");
    EXPECT_EQ(PadLeftHex("abc", 2), "abc");
}

TEST(HexTest, ToLowerHex) {
    EXPECT_EQ(ToLowerHex("0xABcD"), "0xabcd");
}

} // namespace test
} // namespace ethledger
