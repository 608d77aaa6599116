// ETHLEDGER - Hierarchical Deterministic Key Derivation (BIP32/BIP44)
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// BIP32 public child derivation from a device-supplied extended public key,
// plus the private-key side used by the software debug device.
//
// BIP44 path: m/44'/60'/account'/index (Ledger Live style base paths vary)

#ifndef ETHLEDGER_WALLET_HDKEY_H
#define ETHLEDGER_WALLET_HDKEY_H

#include <ethledger/core/types.h>
#include <ethledger/crypto/secp256k1.h>
#include <ethledger/eth/address.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ethledger {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// Ethereum coin type for BIP44 (SLIP-0044)
constexpr uint32_t ETHEREUM_COIN_TYPE = 60;

/// BIP44 purpose constant
constexpr uint32_t BIP44_PURPOSE = 44;

/// Hardened key derivation threshold
constexpr uint32_t HARDENED_FLAG = 0x80000000;

/// Chain code size
constexpr size_t CHAIN_CODE_SIZE = 32;

/// BIP39 seed size
constexpr size_t BIP39_SEED_SIZE = 64;

/// Default base path handed to the device (without the leading "m/")
constexpr const char* DEFAULT_BASE_DERIVATION_PATH = "44'/60'/0'";

using ChainCode = std::array<Byte, CHAIN_CODE_SIZE>;

// ============================================================================
// Key Derivation Path
// ============================================================================

/**
 * Represents a BIP32 derivation path component.
 */
struct PathComponent {
    uint32_t index;
    bool hardened;

    PathComponent(uint32_t idx = 0, bool hard = false)
        : index(idx), hardened(hard) {}

    /// Get the full index value (with hardened flag if applicable)
    uint32_t GetFullIndex() const {
        return hardened ? (index | HARDENED_FLAG) : index;
    }

    /// Parse from string (e.g., "44'", "44h" or "0"); index must be < 2^31
    static std::optional<PathComponent> FromString(const std::string& str);

    /// Convert to string
    std::string ToString() const;
};

/**
 * A complete BIP32 derivation path.
 *
 * Example paths:
 * - m/44'/60'/0'/0   (first account, Ledger legacy layout)
 * - 44'/60'/0'       (base path as handed to the device, "m/" optional)
 */
class DerivationPath {
public:
    /// Create empty path (master key)
    DerivationPath() = default;

    /// Create from components
    explicit DerivationPath(std::vector<PathComponent> components)
        : components_(std::move(components)) {}

    /// Parse from string with or without the leading "m/"
    static std::optional<DerivationPath> FromString(const std::string& path);

    /// Create account-level path (m/44'/60'/account')
    static DerivationPath BIP44Account(uint32_t account);

    /// Get path components
    const std::vector<PathComponent>& GetComponents() const { return components_; }

    /// Get depth (number of components)
    size_t Depth() const { return components_.size(); }

    /// Check if path is empty (master)
    bool IsEmpty() const { return components_.empty(); }

    /// Append a component
    DerivationPath Child(uint32_t index, bool hardened = false) const;

    /// "m/44'/60'/0'"
    std::string ToString() const;

    /// "44'/60'/0'"
    std::string ToRelativeString() const;

    bool operator==(const DerivationPath& other) const;
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }

private:
    std::vector<PathComponent> components_;
};

// ============================================================================
// Extended Public Key
// ============================================================================

/**
 * A public key plus chain code, sufficient to derive non-hardened children.
 * Immutable once constructed; the address is always a function of publicKey.
 */
struct ExtendedKey {
    secp256k1::CompressedPubKey publicKey{};
    ChainCode chainCode{};
    /// Full path of this key, e.g. "m/44'/60'/0'/3"
    std::string derivationPath;
    /// Base path the root was fetched at, e.g. "44'/60'/0'"
    std::string baseDerivationPath;
    eth::Address address;
};

/**
 * Pure BIP32 public child derivation.
 */
class KeyDeriver {
public:
    /**
     * Build a root key from raw device output.
     *
     * @param publicKey 33- or 65-byte SEC1 public key
     * @param chainCode 32-byte chain code
     * @param derivationPath Path the key was fetched at
     * @param baseDerivationPath Base path recorded on derived children
     * @return nullopt on malformed lengths or a point not on the curve
     */
    static std::optional<ExtendedKey> MakeRoot(const std::vector<Byte>& publicKey,
                                               const std::vector<Byte>& chainCode,
                                               const std::string& derivationPath,
                                               const std::string& baseDerivationPath);

    /**
     * Derive the non-hardened child at `index`.
     *
     * @return nullopt for hardened indices, an invalid parent point or an
     *         out-of-range tweak
     */
    static std::optional<ExtendedKey> Derive(const ExtendedKey& parent, uint32_t index);

    /// Address of a 33- or 65-byte public key
    static std::optional<eth::Address> AddressOf(const Byte* publicKey, size_t len);
};

// ============================================================================
// Extended Private Key
// ============================================================================

/**
 * Private extended key used by the software signing device.
 */
class ExtendedPrivateKey {
public:
    ExtendedPrivateKey() = default;
    ~ExtendedPrivateKey();

    ExtendedPrivateKey(const ExtendedPrivateKey&) = default;
    ExtendedPrivateKey& operator=(const ExtendedPrivateKey&) = default;

    /// BIP32 master key: HMAC-SHA512("Bitcoin seed", seed)
    static std::optional<ExtendedPrivateKey> FromSeed(const Byte* seed, size_t seedLen);

    /// Derive child key (index | HARDENED_FLAG for hardened)
    std::optional<ExtendedPrivateKey> DeriveChild(uint32_t index) const;

    /// Derive key at path
    std::optional<ExtendedPrivateKey> DerivePath(const DerivationPath& path) const;

    const std::array<Byte, 32>& GetPrivateKey() const { return privateKey_; }
    const ChainCode& GetChainCode() const { return chainCode_; }

    /// Compressed public key
    secp256k1::CompressedPubKey GetPublicKey() const;

private:
    std::array<Byte, 32> privateKey_{};
    ChainCode chainCode_{};
};

/// BIP39: seed = PBKDF2-HMAC-SHA512(mnemonic, "mnemonic" + passphrase, 2048, 64)
std::array<Byte, BIP39_SEED_SIZE> MnemonicToSeed(const std::string& mnemonic,
                                                 const std::string& passphrase = "");

} // namespace wallet
} // namespace ethledger

#endif // ETHLEDGER_WALLET_HDKEY_H
