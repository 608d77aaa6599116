// ETHLEDGER - HMAC / PBKDF2 Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/crypto/hmac.h>
#include <ethledger/core/hex.h>

#include <string>

namespace ethledger {
namespace test {

namespace {
std::vector<Byte> ToBytes(const std::string& s) {
    return std::vector<Byte>(s.begin(), s.end());
}
}

// RFC 4231 test case 2
TEST(HmacTest, Sha512KnownVector) {
    Hash512 mac = ComputeHMAC_SHA512(ToBytes("Jefe"), ToBytes("what do ya want for nothing?"));
    EXPECT_EQ(mac.ToHex(),
              "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
              "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737");
}

TEST(HmacTest, Sha512DependsOnKey) {
    auto data = ToBytes("payload");
    EXPECT_NE(ComputeHMAC_SHA512(ToBytes("a"), data), ComputeHMAC_SHA512(ToBytes("b"), data));
}

// BIP-39 reference seed for the all-"abandon" mnemonic with passphrase "TREZOR"
TEST(HmacTest, Pbkdf2Sha512Bip39Vector) {
    const std::string mnemonic =
        "abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon abandon abandon about";
    auto seed = PBKDF2_SHA512(mnemonic, ToBytes("mnemonicTREZOR"), 2048, 64);
    ASSERT_EQ(seed.size(), 64u);
    EXPECT_EQ(BytesToHex(seed),
              "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e5349553"
              "1f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04");
}

TEST(HmacTest, Pbkdf2HonorsKeyLength) {
    auto shortKey = PBKDF2_SHA512("pw", ToBytes("salt"), 1, 16);
    auto longKey = PBKDF2_SHA512("pw", ToBytes("salt"), 1, 64);
    ASSERT_EQ(shortKey.size(), 16u);
    EXPECT_TRUE(std::equal(shortKey.begin(), shortKey.end(), longKey.begin()));
}

TEST(HmacTest, SecureClearZeroes) {
    std::vector<Byte> secret = {1, 2, 3, 4};
    SecureClear(secret.data(), secret.size());
    for (Byte b : secret) {
        EXPECT_EQ(b, 0);
    }
}

} // namespace test
} // namespace ethledger
