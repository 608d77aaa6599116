// ETHLEDGER - Ethereum Address Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/eth/address.h>
#include <ethledger/core/hex.h>
#include <ethledger/crypto/keccak.h>

#include <cctype>

namespace ethledger {
namespace eth {

namespace {

bool HasMixedCase(const std::string& digits) {
    bool lower = false;
    bool upper = false;
    for (char c : digits) {
        if (c >= 'a' && c <= 'f') lower = true;
        if (c >= 'A' && c <= 'F') upper = true;
    }
    return lower && upper;
}

/// EIP-55: uppercase a letter when the matching nibble of keccak(lowerhex) >= 8
std::string ChecksumEncode(const std::string& lowerDigits) {
    Hash256 hash = Keccak256Hash(lowerDigits);
    std::string out = lowerDigits;
    for (size_t i = 0; i < out.size(); ++i) {
        Byte nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0F);
        if (nibble >= 8) {
            out[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[i])));
        }
    }
    return out;
}

} // anonymous namespace

std::optional<Address> Address::FromHex(const std::string& str) {
    std::string digits = StripHexPrefix(str);
    if (digits.size() != SIZE * 2 || !IsValidHex(digits)) {
        return std::nullopt;
    }
    auto bytes = HexToBytes(digits);
    return Address(bytes.data(), bytes.size());
}

std::optional<Address> Address::FromChecksummedHex(const std::string& str) {
    auto address = FromHex(str);
    if (!address) {
        return std::nullopt;
    }
    std::string digits = StripHexPrefix(str);
    if (HasMixedCase(digits) && ChecksumEncode(ToLowerHex(digits)) != digits) {
        return std::nullopt;
    }
    return address;
}

std::optional<Address> Address::FromPublicKey(const Byte* pubkey, size_t len) {
    auto uncompressed = secp256k1::DecompressPublicKey(pubkey, len);
    if (!uncompressed) {
        return std::nullopt;
    }
    return FromPublicKey(*uncompressed);
}

Address Address::FromPublicKey(const secp256k1::UncompressedPubKey& pubkey) {
    // Skip the 0x04 tag, hash X || Y, keep the trailing 20 bytes
    Hash256 hash = Keccak256Hash(pubkey.data() + 1, pubkey.size() - 1);
    return Address(hash.data() + (Hash256::SIZE - SIZE), SIZE);
}

std::string Address::ToString() const {
    return "0x" + ToHex();
}

std::string Address::ToChecksumString() const {
    return "0x" + ChecksumEncode(ToHex());
}

bool IsValidAddress(const std::string& str) {
    return Address::FromChecksummedHex(str).has_value();
}

std::optional<std::string> ToChecksumAddress(const std::string& str) {
    auto address = Address::FromHex(str);
    if (!address) {
        return std::nullopt;
    }
    return address->ToChecksumString();
}

bool AddressesEqual(const std::string& a, const std::string& b) {
    auto lhs = Address::FromHex(a);
    auto rhs = Address::FromHex(b);
    return lhs && rhs && *lhs == *rhs;
}

} // namespace eth
} // namespace ethledger
