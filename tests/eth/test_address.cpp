// ETHLEDGER - Address Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/eth/address.h>
#include <ethledger/crypto/secp256k1.h>
#include <ethledger/core/hex.h>

namespace ethledger {
namespace eth {
namespace test {

// ============================================================================
// Parsing
// ============================================================================

TEST(AddressTest, FromHexAcceptsAnyCase) {
    auto lower = Address::FromHex("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
    auto upper = Address::FromHex("5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED");
    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*lower, *upper);
}

TEST(AddressTest, FromHexRejectsBadInput) {
    EXPECT_FALSE(Address::FromHex("").has_value());
    EXPECT_FALSE(Address::FromHex("0x1234").has_value());
    EXPECT_FALSE(Address::FromHex("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaedff").has_value());
    EXPECT_FALSE(Address::FromHex("0xzzaeb6053f3e94c9b9a09f33669435e7ef1beaed").has_value());
}

// ============================================================================
// EIP-55 Checksums
// ============================================================================

TEST(AddressTest, ChecksumEncoding) {
    const std::vector<std::string> vectors = {
        "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
        "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359",
        "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB",
        "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb",
    };
    for (const auto& expected : vectors) {
        auto address = Address::FromHex(ToLowerHex(expected));
        ASSERT_TRUE(address.has_value()) << expected;
        EXPECT_EQ(address->ToChecksumString(), expected);
        EXPECT_EQ(ToChecksumAddress(expected), expected);
    }
}

TEST(AddressTest, ChecksummedParsingRejectsBadMixedCase) {
    EXPECT_TRUE(Address::FromChecksummedHex("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
    EXPECT_FALSE(Address::FromChecksummedHex("0x5AAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
    // Single-case input carries no checksum
    EXPECT_TRUE(Address::FromChecksummedHex("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    EXPECT_TRUE(Address::FromChecksummedHex("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED"));
}

TEST(AddressTest, IsValidAddress) {
    EXPECT_TRUE(IsValidAddress("0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359"));
    EXPECT_FALSE(IsValidAddress("0xfb6916095ca1df60bB79Ce92cE3Ea74c37c5d359"));
    EXPECT_FALSE(IsValidAddress("not an address"));
}

TEST(AddressTest, ToStringIsLowercase) {
    auto address = Address::FromHex("0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ToString(), "0xd1220a0cf47c7b9be7a2e6ba89f429762e7b9adb");
}

TEST(AddressTest, AddressesEqualIgnoresCase) {
    EXPECT_TRUE(AddressesEqual("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
                               "5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    EXPECT_FALSE(AddressesEqual("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
                                "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359"));
    EXPECT_FALSE(AddressesEqual("junk", "junk"));
}

// ============================================================================
// Public Key Derivation
// ============================================================================

TEST(AddressTest, FromPublicKeyOfPrivateKeyOne) {
    std::array<uint8_t, 32> key{};
    key[31] = 1;
    auto pub = secp256k1::PublicKeyFromPrivate(key.data());
    ASSERT_TRUE(pub.has_value());

    auto address = Address::FromPublicKey(pub->data(), pub->size());
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ToChecksumString(), "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
}

TEST(AddressTest, FromPublicKeyRejectsGarbage) {
    std::vector<uint8_t> garbage(33, 0x07);
    EXPECT_FALSE(Address::FromPublicKey(garbage.data(), garbage.size()).has_value());
}

} // namespace test
} // namespace eth
} // namespace ethledger
