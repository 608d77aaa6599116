// ETHLEDGER - Software Debug Device Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/device/debug_device.h>
#include <ethledger/core/hex.h>
#include <ethledger/crypto/hmac.h>
#include <ethledger/crypto/secp256k1.h>
#include <ethledger/eth/message.h>
#include <ethledger/util/logging.h>

namespace ethledger {
namespace device {

// ============================================================================
// DebugDeviceClient
// ============================================================================

DebugDeviceClient::DebugDeviceClient(std::shared_ptr<const wallet::ExtendedPrivateKey> master,
                                     bool rejectConfirmations)
    : master_(std::move(master)), rejectConfirmations_(rejectConfirmations) {}

wallet::ExtendedPrivateKey DebugDeviceClient::KeyAt(const std::string& path) const {
    auto parsed = wallet::DerivationPath::FromString(path);
    if (!parsed) {
        throw DeviceError("Invalid derivation path: " + path);
    }
    auto key = master_->DerivePath(*parsed);
    if (!key) {
        throw DeviceError("Derivation failed at " + path);
    }
    return *key;
}

DeviceAddress DebugDeviceClient::GetAddress(const std::string& path,
                                            bool confirm,
                                            bool includeChainCode) {
    if (confirm && rejectConfirmations_) {
        throw DeviceError("Address confirmation denied by the user");
    }

    wallet::ExtendedPrivateKey key = KeyAt(path);
    auto pubkey = key.GetPublicKey();
    auto address = wallet::KeyDeriver::AddressOf(pubkey.data(), pubkey.size());
    if (!address) {
        throw DeviceError("Cannot compute address at " + path);
    }

    DeviceAddress result;
    result.publicKey.assign(pubkey.begin(), pubkey.end());
    if (includeChainCode) {
        result.chainCode.assign(key.GetChainCode().begin(), key.GetChainCode().end());
    }
    result.address = address->ToChecksumString();
    return result;
}

DeviceSignature DebugDeviceClient::Sign(const std::string& path,
                                        const Hash256& hash,
                                        uint64_t vBase) const {
    if (rejectConfirmations_) {
        throw DeviceError("Signature denied by the user");
    }

    wallet::ExtendedPrivateKey key = KeyAt(path);
    secp256k1::RecoverableSignature sig;
    if (!secp256k1::ECDSASignRecoverable(hash.data(), key.GetPrivateKey().data(), sig)) {
        throw DeviceError("Signing failed");
    }
    // Firmware reports only the parity of R.y
    if (sig.recid > 1) {
        throw DeviceError("Signature with overflowed R, retry with another payload");
    }

    DeviceSignature out;
    out.r = BytesToHex(sig.r);
    out.s = BytesToHex(sig.s);
    out.v = vBase + static_cast<uint64_t>(sig.recid);
    return out;
}

DeviceSignature DebugDeviceClient::SignTransaction(const std::string& path,
                                                   const std::string& digestHex) {
    Bytes digest;
    try {
        digest = HexToBytes(digestHex);
    } catch (const std::invalid_argument& e) {
        throw DeviceError(std::string("Malformed digest: ") + e.what());
    }
    if (digest.size() != Hash256::SIZE) {
        throw DeviceError("Digest must be 32 bytes");
    }
    LOG_DEBUG(util::LogCategory::DEVICE) << "Signing transaction digest at " << path;
    return Sign(path, Hash256(digest.data(), digest.size()), 0);
}

DeviceSignature DebugDeviceClient::SignPersonalMessage(const std::string& path,
                                                       const std::string& dataHex) {
    Bytes data;
    try {
        data = HexToBytes(dataHex);
    } catch (const std::invalid_argument& e) {
        throw DeviceError(std::string("Malformed message: ") + e.what());
    }
    LOG_DEBUG(util::LogCategory::DEVICE) << "Signing " << data.size()
                                         << "-byte personal message at " << path;
    return Sign(path, eth::PersonalMessageHash(data), 27);
}

// ============================================================================
// DebugDeviceFactory
// ============================================================================

DebugDeviceFactory::DebugDeviceFactory(const Bytes& seed) {
    auto master = wallet::ExtendedPrivateKey::FromSeed(seed.data(), seed.size());
    if (!master) {
        throw DeviceError("Seed does not produce a valid master key");
    }
    master_ = std::make_shared<const wallet::ExtendedPrivateKey>(*master);
}

std::shared_ptr<DebugDeviceFactory> DebugDeviceFactory::FromMnemonic(const std::string& mnemonic,
                                                                     const std::string& passphrase) {
    auto seed = wallet::MnemonicToSeed(mnemonic, passphrase);
    Bytes seedBytes(seed.begin(), seed.end());
    auto factory = std::make_shared<DebugDeviceFactory>(seedBytes);
    SecureClear(seed.data(), seed.size());
    SecureClear(seedBytes.data(), seedBytes.size());
    return factory;
}

std::unique_ptr<IDeviceClient> DebugDeviceFactory::Open() {
    ++opened_;
    return std::make_unique<DebugDeviceClient>(master_, rejectConfirmations_.load());
}

void DebugDeviceFactory::Close(IDeviceClient& /*client*/) {
    ++closed_;
}

} // namespace device
} // namespace ethledger
