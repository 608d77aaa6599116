// ETHLEDGER - HD Key Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/wallet/hdkey.h>
#include <ethledger/crypto/hmac.h>

#include <cstring>
#include <sstream>

namespace ethledger {
namespace wallet {

namespace {

void AppendIndex(std::vector<Byte>& data, uint32_t index) {
    data.push_back((index >> 24) & 0xFF);
    data.push_back((index >> 16) & 0xFF);
    data.push_back((index >> 8) & 0xFF);
    data.push_back(index & 0xFF);
}

/// Split HMAC-SHA512 output into IL (tweak) and IR (chain code)
void SplitHash(const Hash512& hash, std::array<Byte, 32>& tweak, ChainCode& chainCode) {
    std::memcpy(tweak.data(), hash.data(), 32);
    std::memcpy(chainCode.data(), hash.data() + 32, 32);
}

} // anonymous namespace

// ============================================================================
// PathComponent Implementation
// ============================================================================

std::optional<PathComponent> PathComponent::FromString(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    bool hardened = false;
    std::string numStr = str;

    if (str.back() == '\'' || str.back() == 'h' || str.back() == 'H') {
        hardened = true;
        numStr = str.substr(0, str.size() - 1);
    }

    if (numStr.empty() || numStr.size() > 10) {
        return std::nullopt;
    }

    uint64_t index = 0;
    for (char c : numStr) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        index = index * 10 + static_cast<uint64_t>(c - '0');
    }

    if (index >= HARDENED_FLAG) {
        return std::nullopt;
    }

    return PathComponent(static_cast<uint32_t>(index), hardened);
}

std::string PathComponent::ToString() const {
    return std::to_string(index) + (hardened ? "'" : "");
}

// ============================================================================
// DerivationPath Implementation
// ============================================================================

std::optional<DerivationPath> DerivationPath::FromString(const std::string& path) {
    std::string p = path;

    // Remove leading "m/" or "M/"
    if (p.size() >= 2 && (p[0] == 'm' || p[0] == 'M') && p[1] == '/') {
        p = p.substr(2);
    } else if (p == "m" || p == "M") {
        return DerivationPath();
    }

    if (p.empty()) {
        return std::nullopt;
    }

    std::vector<PathComponent> components;
    std::istringstream stream(p);
    std::string token;

    while (std::getline(stream, token, '/')) {
        auto comp = PathComponent::FromString(token);
        if (!comp) {
            return std::nullopt;
        }
        components.push_back(*comp);
    }

    // getline drops a trailing empty token
    if (p.back() == '/') {
        return std::nullopt;
    }

    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::BIP44Account(uint32_t account) {
    std::vector<PathComponent> components;
    components.emplace_back(BIP44_PURPOSE, true);
    components.emplace_back(ETHEREUM_COIN_TYPE, true);
    components.emplace_back(account, true);
    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::Child(uint32_t index, bool hardened) const {
    std::vector<PathComponent> newComponents = components_;
    newComponents.emplace_back(index, hardened);
    return DerivationPath(std::move(newComponents));
}

std::string DerivationPath::ToString() const {
    std::string result = "m";
    for (const auto& comp : components_) {
        result += "/" + comp.ToString();
    }
    return result;
}

std::string DerivationPath::ToRelativeString() const {
    std::string result;
    for (const auto& comp : components_) {
        if (!result.empty()) result += "/";
        result += comp.ToString();
    }
    return result;
}

bool DerivationPath::operator==(const DerivationPath& other) const {
    if (components_.size() != other.components_.size()) {
        return false;
    }
    for (size_t i = 0; i < components_.size(); ++i) {
        if (components_[i].index != other.components_[i].index ||
            components_[i].hardened != other.components_[i].hardened) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// KeyDeriver Implementation
// ============================================================================

std::optional<ExtendedKey> KeyDeriver::MakeRoot(const std::vector<Byte>& publicKey,
                                                const std::vector<Byte>& chainCode,
                                                const std::string& derivationPath,
                                                const std::string& baseDerivationPath) {
    if (chainCode.size() != CHAIN_CODE_SIZE) {
        return std::nullopt;
    }

    auto point = secp256k1::Point::FromBytes(publicKey);
    if (!point || point->IsInfinity()) {
        return std::nullopt;
    }

    ExtendedKey key;
    key.publicKey = point->ToCompressed();
    std::memcpy(key.chainCode.data(), chainCode.data(), CHAIN_CODE_SIZE);
    key.derivationPath = derivationPath;
    key.baseDerivationPath = baseDerivationPath;
    key.address = eth::Address::FromPublicKey(point->ToUncompressed());
    return key;
}

std::optional<ExtendedKey> KeyDeriver::Derive(const ExtendedKey& parent, uint32_t index) {
    // Cannot derive hardened child from public key
    if ((index & HARDENED_FLAG) != 0) {
        return std::nullopt;
    }

    // Data: compressed public key (33 bytes) || index (4 bytes big-endian)
    std::vector<Byte> data(parent.publicKey.begin(), parent.publicKey.end());
    AppendIndex(data, index);

    Hash512 hash = ComputeHMAC_SHA512(parent.chainCode.data(), parent.chainCode.size(),
                                      data.data(), data.size());

    std::array<Byte, 32> tweak{};
    ExtendedKey child;
    SplitHash(hash, tweak, child.chainCode);

    // childPubKey = parentPubKey + IL*G; fails if IL >= n or the sum is infinity
    if (!secp256k1::PublicKeyTweakAdd(parent.publicKey.data(), parent.publicKey.size(),
                                      tweak.data(), child.publicKey.data())) {
        return std::nullopt;
    }

    auto address = AddressOf(child.publicKey.data(), child.publicKey.size());
    if (!address) {
        return std::nullopt;
    }

    child.address = *address;
    child.derivationPath = parent.derivationPath + "/" + std::to_string(index);
    child.baseDerivationPath = parent.baseDerivationPath;
    return child;
}

std::optional<eth::Address> KeyDeriver::AddressOf(const Byte* publicKey, size_t len) {
    return eth::Address::FromPublicKey(publicKey, len);
}

// ============================================================================
// ExtendedPrivateKey Implementation
// ============================================================================

ExtendedPrivateKey::~ExtendedPrivateKey() {
    SecureClear(privateKey_.data(), privateKey_.size());
}

std::optional<ExtendedPrivateKey> ExtendedPrivateKey::FromSeed(const Byte* seed, size_t seedLen) {
    // BIP32: Master key = HMAC-SHA512(Key = "Bitcoin seed", Data = Seed)
    static const char* KEY = "Bitcoin seed";

    Hash512 hash = ComputeHMAC_SHA512(reinterpret_cast<const Byte*>(KEY), 12,
                                      seed, seedLen);

    ExtendedPrivateKey master;
    SplitHash(hash, master.privateKey_, master.chainCode_);
    SecureClear(hash.data(), hash.size());

    if (!secp256k1::IsValidPrivateKey(master.privateKey_.data())) {
        return std::nullopt;
    }
    return master;
}

std::optional<ExtendedPrivateKey> ExtendedPrivateKey::DeriveChild(uint32_t index) const {
    std::vector<Byte> data;

    if ((index & HARDENED_FLAG) != 0) {
        // Hardened: 0x00 || private key || index
        data.push_back(0x00);
        data.insert(data.end(), privateKey_.begin(), privateKey_.end());
    } else {
        // Normal: public key || index
        auto pubKey = GetPublicKey();
        data.insert(data.end(), pubKey.begin(), pubKey.end());
    }
    AppendIndex(data, index);

    Hash512 hash = ComputeHMAC_SHA512(chainCode_.data(), chainCode_.size(),
                                      data.data(), data.size());
    SecureClear(data.data(), data.size());

    std::array<Byte, 32> tweak{};
    ExtendedPrivateKey child;
    SplitHash(hash, tweak, child.chainCode_);
    SecureClear(hash.data(), hash.size());

    // Child key = IL + parent key (mod n)
    bool ok = secp256k1::PrivateKeyTweakAdd(privateKey_.data(), tweak.data(),
                                            child.privateKey_.data());
    SecureClear(tweak.data(), tweak.size());
    if (!ok) {
        return std::nullopt;
    }
    return child;
}

std::optional<ExtendedPrivateKey> ExtendedPrivateKey::DerivePath(const DerivationPath& path) const {
    ExtendedPrivateKey current = *this;

    for (const auto& comp : path.GetComponents()) {
        auto child = current.DeriveChild(comp.GetFullIndex());
        if (!child) {
            return std::nullopt;
        }
        current = *child;
    }

    return current;
}

secp256k1::CompressedPubKey ExtendedPrivateKey::GetPublicKey() const {
    auto pub = secp256k1::PublicKeyFromPrivate(privateKey_.data());
    return pub ? *pub : secp256k1::CompressedPubKey{};
}

// ============================================================================
// BIP39 Seed
// ============================================================================

std::array<Byte, BIP39_SEED_SIZE> MnemonicToSeed(const std::string& mnemonic,
                                                 const std::string& passphrase) {
    std::string salt = "mnemonic" + passphrase;
    auto derived = PBKDF2_SHA512(mnemonic, std::vector<Byte>(salt.begin(), salt.end()),
                                 2048, BIP39_SEED_SIZE);

    std::array<Byte, BIP39_SEED_SIZE> seed{};
    std::memcpy(seed.data(), derived.data(), BIP39_SEED_SIZE);
    SecureClear(derived.data(), derived.size());
    return seed;
}

} // namespace wallet
} // namespace ethledger
