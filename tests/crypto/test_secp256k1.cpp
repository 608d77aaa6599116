// ETHLEDGER - secp256k1 Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/crypto/secp256k1.h>
#include <ethledger/crypto/keccak.h>
#include <ethledger/core/hex.h>

#include <cstring>

namespace ethledger {
namespace secp256k1 {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class Secp256k1Test : public ::testing::Test {
protected:
    static std::array<uint8_t, 32> Scalar(const std::string& hex) {
        auto bytes = HexToBytes(PadLeftHex(hex, 64));
        std::array<uint8_t, 32> out{};
        std::memcpy(out.data(), bytes.data(), out.size());
        return out;
    }

    const std::string generatorHex_ =
        "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
    const std::string twoGHex_ =
        "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";
    const std::string order_ =
        "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141";
};

// ============================================================================
// Key Tests
// ============================================================================

TEST_F(Secp256k1Test, PrivateKeyRange) {
    EXPECT_FALSE(IsValidPrivateKey(Scalar("0").data()));
    EXPECT_TRUE(IsValidPrivateKey(Scalar("1").data()));
    EXPECT_TRUE(IsValidPrivateKey(Scalar(
        "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364140").data()));
    EXPECT_FALSE(IsValidPrivateKey(Scalar(order_).data()));
}

TEST_F(Secp256k1Test, PublicKeyOfOneIsGenerator) {
    auto pub = PublicKeyFromPrivate(Scalar("1").data());
    ASSERT_TRUE(pub.has_value());
    EXPECT_EQ(BytesToHex(*pub), generatorHex_);
    EXPECT_EQ(Point::Generator().ToCompressed(), *pub);
}

TEST_F(Secp256k1Test, DecompressRoundTrip) {
    auto compressed = HexToBytes(twoGHex_);
    auto full = DecompressPublicKey(compressed.data(), compressed.size());
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ((*full)[0], 0x04);

    auto point = Point::FromBytes(full->data(), full->size());
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(BytesToHex(point->ToCompressed()), twoGHex_);
}

TEST_F(Secp256k1Test, RejectsPointOffCurve) {
    auto bad = HexToBytes(generatorHex_);
    bad[32] ^= 0x01;
    bad[0] = 0x05;
    EXPECT_FALSE(IsValidPublicKey(bad));
    EXPECT_FALSE(Point::FromBytes(bad).has_value());
}

TEST_F(Secp256k1Test, PointAddition) {
    Point g = Point::Generator();
    Point sum = g + g;
    EXPECT_EQ(BytesToHex(sum.ToCompressed()), twoGHex_);
    EXPECT_NE(sum, g);
}

// ============================================================================
// Tweak Tests
// ============================================================================

TEST_F(Secp256k1Test, TweakAddAgreesForPrivateAndPublic) {
    auto one = Scalar("1");
    std::array<uint8_t, 32> priv{};
    ASSERT_TRUE(PrivateKeyTweakAdd(one.data(), one.data(), priv.data()));
    EXPECT_EQ(priv, Scalar("2"));

    auto g = HexToBytes(generatorHex_);
    CompressedPubKey pub{};
    ASSERT_TRUE(PublicKeyTweakAdd(g.data(), g.size(), one.data(), pub.data()));
    EXPECT_EQ(BytesToHex(pub), twoGHex_);
}

TEST_F(Secp256k1Test, TweakAddRejectsTweakAtOrder) {
    auto one = Scalar("1");
    auto n = Scalar(order_);
    std::array<uint8_t, 32> out{};
    EXPECT_FALSE(PrivateKeyTweakAdd(one.data(), n.data(), out.data()));
}

// ============================================================================
// Signature Tests
// ============================================================================

TEST_F(Secp256k1Test, LowSBoundary) {
    EXPECT_TRUE(IsLowS(Scalar(
        "7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0").data()));
    EXPECT_FALSE(IsLowS(Scalar(
        "7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a1").data()));
}

TEST_F(Secp256k1Test, SignatureScalarRange) {
    EXPECT_FALSE(IsValidSignatureScalar(Scalar("0").data()));
    EXPECT_TRUE(IsValidSignatureScalar(Scalar("1").data()));
    EXPECT_FALSE(IsValidSignatureScalar(Scalar(order_).data()));
}

TEST_F(Secp256k1Test, SignAndRecover) {
    auto key = Scalar("ac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80");
    Hash256 hash = Keccak256Hash(std::string("ethledger"));

    RecoverableSignature sig;
    ASSERT_TRUE(ECDSASignRecoverable(hash.data(), key.data(), sig));
    EXPECT_TRUE(IsLowS(sig.s.data()));
    EXPECT_GE(sig.recid, 0);
    EXPECT_LE(sig.recid, 1);

    auto recovered = ECDSARecover(hash.data(), sig.r.data(), sig.s.data(), sig.recid);
    ASSERT_TRUE(recovered.has_value());

    auto expected = PublicKeyFromPrivate(key.data());
    ASSERT_TRUE(expected.has_value());
    auto point = Point::FromBytes(recovered->data(), recovered->size());
    ASSERT_TRUE(point.has_value());
    EXPECT_EQ(point->ToCompressed(), *expected);
}

TEST_F(Secp256k1Test, RecoverWithWrongIdGivesDifferentKey) {
    auto key = Scalar("1");
    Hash256 hash = Keccak256Hash(std::string("message"));

    RecoverableSignature sig;
    ASSERT_TRUE(ECDSASignRecoverable(hash.data(), key.data(), sig));

    auto flipped = ECDSARecover(hash.data(), sig.r.data(), sig.s.data(), sig.recid ^ 1);
    if (flipped) {
        auto point = Point::FromBytes(flipped->data(), flipped->size());
        ASSERT_TRUE(point.has_value());
        EXPECT_NE(BytesToHex(point->ToCompressed()), generatorHex_);
    }
}

} // namespace test
} // namespace secp256k1
} // namespace ethledger
