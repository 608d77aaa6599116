// ETHLEDGER - Keccak-256 Hash Function
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Keccak-256 as used by Ethereum (original Keccak padding, not FIPS 202 SHA3).

#ifndef ETHLEDGER_CRYPTO_KECCAK_H
#define ETHLEDGER_CRYPTO_KECCAK_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <ethledger/core/types.h>

namespace ethledger {

/// Keccak-256 hasher class
/// Provides incremental hashing over the Keccak-f[1600] permutation
class Keccak256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Sponge rate in bytes (1600 - 2 * 256 bits)
    static constexpr size_t RATE = 136;

    /// Default constructor - initializes to empty state
    Keccak256();

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    Keccak256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    /// @return Reference to this hasher (for chaining)
    Keccak256& Reset();

private:
    /// Sponge state (25 x 64-bit lanes)
    uint64_t state_[25];

    /// Buffer for partial block
    Byte buffer_[RATE];

    /// Bytes currently held in buffer_
    size_t bufferLen_;

    /// XOR a full block into the state and permute
    void Absorb(const Byte block[RATE]);
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute Keccak-256 of data in a single call
Hash256 Keccak256Hash(const Byte* data, size_t len);

/// Compute Keccak-256 of a byte vector
inline Hash256 Keccak256Hash(const Bytes& data) {
    return Keccak256Hash(data.data(), data.size());
}

/// Compute Keccak-256 of a string's raw bytes
inline Hash256 Keccak256Hash(const std::string& data) {
    return Keccak256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace ethledger

#endif // ETHLEDGER_CRYPTO_KECCAK_H
