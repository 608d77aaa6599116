// ETHLEDGER - secp256k1 Elliptic Curve Operations
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// secp256k1 point arithmetic and recoverable ECDSA, backed by OpenSSL.

#ifndef ETHLEDGER_CRYPTO_SECP256K1_H
#define ETHLEDGER_CRYPTO_SECP256K1_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <memory>
#include <vector>
#include <optional>
#include <ethledger/core/types.h>

namespace ethledger {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Curve order n
extern const std::array<uint8_t, 32> CURVE_ORDER;

/// n / 2, the upper bound for canonical (low) s values
extern const std::array<uint8_t, 32> HALF_CURVE_ORDER;

/// Compressed public key size
constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;

/// Uncompressed public key size
constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;

using CompressedPubKey = std::array<uint8_t, COMPRESSED_PUBKEY_SIZE>;
using UncompressedPubKey = std::array<uint8_t, UNCOMPRESSED_PUBKEY_SIZE>;

// ============================================================================
// Point (secp256k1 curve point)
// ============================================================================

/**
 * A point on the secp256k1 curve.
 */
class Point {
public:
    /// Default constructor - point at infinity
    Point();

    /// Parse from compressed (33 bytes) or uncompressed (65 bytes) form
    static std::optional<Point> FromBytes(const uint8_t* data, size_t len);
    static std::optional<Point> FromBytes(const std::vector<uint8_t>& data);

    /// Check if point at infinity
    bool IsInfinity() const;

    /// Serialize to compressed form
    CompressedPubKey ToCompressed() const;

    /// Serialize to uncompressed form
    UncompressedPubKey ToUncompressed() const;

    /// Point addition
    Point operator+(const Point& other) const;

    /// Comparison
    bool operator==(const Point& other) const;
    bool operator!=(const Point& other) const { return !(*this == other); }

    /// Get the generator point G
    static Point Generator();

    Point(const Point& other);
    Point& operator=(const Point& other);
    Point(Point&& other) noexcept;
    Point& operator=(Point&& other) noexcept;
    ~Point();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    friend std::optional<Point> ScalarBaseMultiply(const uint8_t* scalar);
};

// ============================================================================
// Key Operations
// ============================================================================

/**
 * Scalar multiplication: scalar * G.
 *
 * @param scalar 32-byte big-endian scalar
 * @return Public point, or nullopt if scalar is not in [1, n-1]
 */
std::optional<Point> ScalarBaseMultiply(const uint8_t* scalar);

/// Must be in range [1, n-1]
bool IsValidPrivateKey(const uint8_t* key);

/// Must parse, lie on the curve and not be the point at infinity
bool IsValidPublicKey(const uint8_t* point, size_t len);
bool IsValidPublicKey(const std::vector<uint8_t>& point);

/// Compressed public key for a private key
std::optional<CompressedPubKey> PublicKeyFromPrivate(const uint8_t* privateKey);

/// Convert a 33- or 65-byte public key to uncompressed form
std::optional<UncompressedPubKey> DecompressPublicKey(const uint8_t* pubkey, size_t len);

/**
 * Tweak a private key by adding a scalar.
 * result = (key + tweak) mod n
 *
 * @return false if tweak >= n or the result would be zero
 */
bool PrivateKeyTweakAdd(const uint8_t* key, const uint8_t* tweak, uint8_t* result);

/**
 * Tweak a public key by adding tweak*G.
 * result = P + tweak*G
 *
 * @param pubkey Public key (33 or 65 bytes)
 * @param pubkeyLen Length of public key
 * @param tweak Tweak value (32 bytes)
 * @param result Output buffer (same size as input)
 * @return false if tweak >= n or the result is the point at infinity
 */
bool PublicKeyTweakAdd(const uint8_t* pubkey, size_t pubkeyLen,
                       const uint8_t* tweak, uint8_t* result);

// ============================================================================
// ECDSA Operations
// ============================================================================

/// ECDSA signature with its public key recovery id
struct RecoverableSignature {
    std::array<uint8_t, 32> r{};
    std::array<uint8_t, 32> s{};
    /// 0..3: bit 0 is the parity of R.y, bit 1 set when R.x overflowed n
    int recid{0};
};

/// True if the 32-byte big-endian value is in [1, n-1]
bool IsValidSignatureScalar(const uint8_t* value);

/// True if s <= n/2
bool IsLowS(const uint8_t* s);

/**
 * Sign a 32-byte hash, returning a low-s signature and its recovery id.
 *
 * @param hash 32-byte message hash
 * @param privateKey 32-byte private key
 * @param out Output signature
 * @return true if successful
 */
bool ECDSASignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                          RecoverableSignature& out);

/**
 * Recover the signer's public key.
 *
 * @param hash 32-byte message hash
 * @param r 32-byte r
 * @param s 32-byte s
 * @param recid Recovery id (0..3)
 * @return Uncompressed public key, or nullopt if no valid key exists
 */
std::optional<UncompressedPubKey> ECDSARecover(const uint8_t* hash,
                                               const uint8_t* r,
                                               const uint8_t* s,
                                               int recid);

} // namespace secp256k1
} // namespace ethledger

#endif // ETHLEDGER_CRYPTO_SECP256K1_H
