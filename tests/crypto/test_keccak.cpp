// ETHLEDGER - Keccak-256 Tests
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <ethledger/crypto/keccak.h>
#include <ethledger/core/hex.h>

#include <string>

namespace ethledger {
namespace test {

// ============================================================================
// Known Vectors
// ============================================================================

TEST(Keccak256Test, EmptyInput) {
    EXPECT_EQ(Keccak256Hash(std::string()).ToHex(),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Keccak256Test, Abc) {
    EXPECT_EQ(Keccak256Hash(std::string("abc")).ToHex(),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(Keccak256Test, TransferSelector) {
    // First four bytes are the ERC-20 transfer(address,uint256) selector
    Hash256 h = Keccak256Hash(std::string("transfer(address,uint256)"));
    EXPECT_EQ(h.ToHex().substr(0, 8), "a9059cbb");
}

// ============================================================================
// Streaming
// ============================================================================

TEST(Keccak256Test, IncrementalMatchesOneShot) {
    // Spans several 136-byte blocks with an unaligned tail
    std::string input;
    for (int i = 0; i < 500; ++i) {
        input.push_back(static_cast<char>('a' + i % 26));
    }
    const auto* data = reinterpret_cast<const Byte*>(input.data());

    Keccak256 hasher;
    hasher.Write(data, 1).Write(data + 1, 135).Write(data + 136, 200).Write(data + 336, 164);
    Byte out[Keccak256::OUTPUT_SIZE];
    hasher.Finalize(out);

    EXPECT_EQ(BytesToHex(out, sizeof(out)), Keccak256Hash(input).ToHex());
}

TEST(Keccak256Test, ExactRateBoundary) {
    std::string block(Keccak256::RATE, 'x');
    std::string chunked;
    {
        Keccak256 hasher;
        const auto* data = reinterpret_cast<const Byte*>(block.data());
        hasher.Write(data, 100).Write(data + 100, block.size() - 100);
        Byte out[Keccak256::OUTPUT_SIZE];
        hasher.Finalize(out);
        chunked = BytesToHex(out, sizeof(out));
    }
    EXPECT_EQ(chunked, Keccak256Hash(block).ToHex());
    EXPECT_NE(chunked, Keccak256Hash(std::string(Keccak256::RATE - 1, 'x')).ToHex());
}

TEST(Keccak256Test, ResetStartsOver) {
    Keccak256 hasher;
    const std::string junk = "junk";
    hasher.Write(reinterpret_cast<const Byte*>(junk.data()), junk.size());
    hasher.Reset();

    const std::string abc = "abc";
    hasher.Write(reinterpret_cast<const Byte*>(abc.data()), abc.size());
    Byte out[Keccak256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(BytesToHex(out, sizeof(out)),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

} // namespace test
} // namespace ethledger
