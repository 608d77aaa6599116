// ETHLEDGER - Quantity Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/eth/quantity.h>
#include <ethledger/core/hex.h>

#include <stdexcept>

namespace ethledger {
namespace eth {
namespace test {

TEST(QuantityTest, ParseDecimalAndHex) {
    EXPECT_EQ(BytesToHex(ParseQuantity("21000")), "5208");
    EXPECT_EQ(BytesToHex(ParseQuantity("0x5208")), "5208");
    EXPECT_EQ(BytesToHex(ParseQuantity("0x05208")), "5208");
    EXPECT_EQ(BytesToHex(ParseQuantity("1000000000000000000")), "0de0b6b3a7640000");
}

TEST(QuantityTest, ZeroIsEmpty) {
    EXPECT_TRUE(ParseQuantity("0").empty());
    EXPECT_TRUE(ParseQuantity("0x0").empty());
    EXPECT_TRUE(ParseQuantity("0x").empty());
}

TEST(QuantityTest, RejectsMalformed) {
    EXPECT_THROW(ParseQuantity(""), std::invalid_argument);
    EXPECT_THROW(ParseQuantity("-1"), std::invalid_argument);
    EXPECT_THROW(ParseQuantity("12abc"), std::invalid_argument);
    EXPECT_THROW(ParseQuantity("0xzz"), std::invalid_argument);
    EXPECT_THROW(ParseQuantity("1.5"), std::invalid_argument);
}

TEST(QuantityTest, RejectsMoreThan256Bits) {
    std::string max = "0x" + std::string(64, 'f');
    EXPECT_EQ(ParseQuantity(max).size(), 32u);
    EXPECT_THROW(ParseQuantity("0x1" + std::string(64, '0')), std::invalid_argument);
}

TEST(QuantityTest, Formatting) {
    EXPECT_EQ(QuantityToHex(Bytes()), "0x0");
    EXPECT_EQ(QuantityToHex(Bytes{0x00, 0x05, 0x20}), "0x520");
    EXPECT_EQ(QuantityToDecimal(Bytes{0x52, 0x08}), "21000");
    EXPECT_EQ(QuantityToDecimal(Bytes()), "0");
}

TEST(QuantityTest, Uint64Conversion) {
    EXPECT_EQ(QuantityToUint64(Bytes{0x01, 0x00}), 256u);
    EXPECT_EQ(QuantityToUint64(Bytes()), 0u);
    EXPECT_THROW(QuantityToUint64(Bytes(9, 0x01)), std::invalid_argument);
    EXPECT_EQ(Uint64ToQuantity(256), (Bytes{0x01, 0x00}));
    EXPECT_TRUE(Uint64ToQuantity(0).empty());
}

TEST(QuantityTest, TrimQuantity) {
    EXPECT_EQ(TrimQuantity(Bytes{0x00, 0x00, 0x07}), Bytes{0x07});
    EXPECT_TRUE(TrimQuantity(Bytes{0x00}).empty());
}

} // namespace test
} // namespace eth
} // namespace ethledger
