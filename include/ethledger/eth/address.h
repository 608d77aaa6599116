// ETHLEDGER - Ethereum Addresses
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// 20-byte account addresses, EIP-55 mixed-case checksum encoding.

#ifndef ETHLEDGER_ETH_ADDRESS_H
#define ETHLEDGER_ETH_ADDRESS_H

#include <ethledger/core/types.h>
#include <ethledger/crypto/secp256k1.h>

#include <optional>
#include <string>

namespace ethledger {
namespace eth {

/**
 * An Ethereum account address: the last 20 bytes of the Keccak-256 hash
 * of the 64-byte uncompressed public key (without the 0x04 tag).
 */
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    Address(const BaseHash<160>& base) : BaseHash<160>(base) {}

    /// Parse 40 hex digits with optional 0x prefix, ignoring case and checksum
    static std::optional<Address> FromHex(const std::string& str);

    /// Parse like FromHex, but reject mixed-case input whose EIP-55 checksum is wrong
    static std::optional<Address> FromChecksummedHex(const std::string& str);

    /// Derive from an uncompressed (65-byte) or compressed (33-byte) public key
    static std::optional<Address> FromPublicKey(const Byte* pubkey, size_t len);

    static Address FromPublicKey(const secp256k1::UncompressedPubKey& pubkey);

    /// "0x" followed by 40 lowercase hex digits
    std::string ToString() const;

    /// "0x" followed by the EIP-55 checksummed encoding
    std::string ToChecksumString() const;
};

/// True for 40 hex digits (optional 0x); all-lower or all-upper input skips
/// the checksum, mixed case must carry a valid EIP-55 checksum
bool IsValidAddress(const std::string& str);

/// EIP-55 encode an address string; returns nullopt for malformed input
std::optional<std::string> ToChecksumAddress(const std::string& str);

/// Case-insensitive comparison after hex normalization
bool AddressesEqual(const std::string& a, const std::string& b);

} // namespace eth
} // namespace ethledger

#endif // ETHLEDGER_ETH_ADDRESS_H
