// ETHLEDGER - Personal Message Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/eth/message.h>
#include <ethledger/crypto/keccak.h>

#include <string>

namespace ethledger {
namespace eth {
namespace test {

TEST(PersonalMessageTest, PayloadCarriesPrefixAndLength) {
    std::string text = "hello";
    Bytes payload = PersonalMessagePayload(Bytes(text.begin(), text.end()));
    std::string expected = std::string("\x19") + "Ethereum Signed Message:\n5hello";
    EXPECT_EQ(std::string(payload.begin(), payload.end()), expected);
}

TEST(PersonalMessageTest, LengthIsDecimal) {
    Bytes message(12, 'a');
    Bytes payload = PersonalMessagePayload(message);
    std::string text(payload.begin(), payload.end());
    EXPECT_NE(text.find("\n12aaaa"), std::string::npos);
}

TEST(PersonalMessageTest, HashOfHello) {
    std::string text = "hello";
    EXPECT_EQ(PersonalMessageHash(Bytes(text.begin(), text.end())).ToHex(),
              "50b2c43fd39106bafbba0da34fc430e1f91e3c96ea2acee2bc34119f92b37750");
}

TEST(PersonalMessageTest, EmptyMessage) {
    Bytes payload = PersonalMessagePayload(Bytes());
    std::string text(payload.begin(), payload.end());
    EXPECT_EQ(text.back(), '0');
    EXPECT_EQ(PersonalMessageHash(Bytes()), Keccak256Hash(payload));
}

} // namespace test
} // namespace eth
} // namespace ethledger
