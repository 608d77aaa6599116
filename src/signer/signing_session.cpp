// ETHLEDGER - Signing Session Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/signer/signing_session.h>
#include <ethledger/core/hex.h>
#include <ethledger/eth/address.h>
#include <ethledger/util/logging.h>
#include <ethledger/wallet/address_search.h>

#include <cstring>

namespace ethledger {
namespace signer {

namespace lc = util::LogCategory;

namespace {

constexpr uint64_t LEGACY_V_BASE = 27;
constexpr uint64_t EIP155_V_BASE = 35;

/// 64 hex digits (device output may drop leading zeros)
std::optional<std::array<Byte, 32>> ParseScalar(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.empty() || digits.size() > 64) {
        return std::nullopt;
    }
    digits = PadLeftHex(digits, 64);
    if (!IsValidHex(digits)) {
        return std::nullopt;
    }
    Bytes bytes = HexToBytes(digits);
    std::array<Byte, 32> out{};
    std::memcpy(out.data(), bytes.data(), out.size());
    return out;
}

} // anonymous namespace

std::optional<int> NormalizeRecoveryId(uint64_t v, uint64_t chainId) {
    if (v <= 1) {
        return static_cast<int>(v);
    }
    if (v == LEGACY_V_BASE || v == LEGACY_V_BASE + 1) {
        return static_cast<int>(v - LEGACY_V_BASE);
    }
    uint64_t base = EIP155_V_BASE + 2 * chainId;
    if (v == base || v == base + 1) {
        return static_cast<int>(v - base);
    }
    return std::nullopt;
}

// ============================================================================
// Construction and configuration
// ============================================================================

SigningSession::SigningSession(std::shared_ptr<device::IDeviceClientFactory> factory,
                               SubproviderConfig config)
    : config_(std::move(config)), guard_(std::move(factory)) {
    SignerStatus status = ValidateConfig(config_);
    if (!status) {
        throw std::invalid_argument(std::string(SignerErrorToString(status.error)) +
                                    ": " + status.message);
    }
}

std::string SigningSession::GetPath() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_.baseDerivationPath;
}

SignerStatus SigningSession::SetPath(const std::string& baseDerivationPath) {
    if (!wallet::DerivationPath::FromString(baseDerivationPath)) {
        return SignerStatus::Fail(SignerError::InvalidDerivationPath,
                                  "Malformed derivation path: " + baseDerivationPath);
    }
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.baseDerivationPath = baseDerivationPath;
    LOG_INFO(lc::SIGNER) << "Base derivation path set to " << baseDerivationPath;
    return SignerStatus::Ok();
}

SubproviderConfig SigningSession::GetConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

// ============================================================================
// Device access
// ============================================================================

SignerResult<device::DeviceSession> SigningSession::Acquire() {
    using Result = SignerResult<device::DeviceSession>;
    try {
        return Result::Ok(guard_.Acquire());
    } catch (const device::MultipleConnectionsError& e) {
        LOG_ERROR(lc::SIGNER) << e.what();
        return Result::Fail(SignerError::MultipleOpenConnectionsDisallowed, e.what());
    } catch (const device::DeviceError& e) {
        return Result::Fail(SignerError::DeviceCommunicationError, e.what());
    }
}

std::optional<SigningSession::ParsedSignature>
SigningSession::ParseSignature(const device::DeviceSignature& sig, uint64_t chainId) {
    auto recid = NormalizeRecoveryId(sig.v, chainId);
    auto r = ParseScalar(sig.r);
    auto s = ParseScalar(sig.s);
    if (!recid || !r || !s) {
        return std::nullopt;
    }
    ParsedSignature out;
    out.r = *r;
    out.s = *s;
    out.recid = *recid;
    return out;
}

// ============================================================================
// Key resolution
// ============================================================================

SignerResult<wallet::ExtendedKey> SigningSession::ResolveRootKey() {
    using Result = SignerResult<wallet::ExtendedKey>;
    SubproviderConfig config = GetConfig();

    auto basePath = wallet::DerivationPath::FromString(config.baseDerivationPath);
    if (!basePath) {
        return Result::Fail(SignerError::InvalidDerivationPath,
                            "Malformed derivation path: " + config.baseDerivationPath);
    }
    const std::string parentPath = basePath->ToString();

    device::DeviceAddress answer;
    {
        auto session = Acquire();
        if (!session) {
            return Result::FailFrom(session);
        }
        try {
            answer = session.value->Client().GetAddress(
                parentPath, config.shouldAskForOnDeviceConfirmation, true);
        } catch (const std::exception& e) {
            LOG_WARN(lc::SIGNER) << "GetAddress(" << parentPath << ") failed: " << e.what();
            return Result::Fail(SignerError::DeviceCommunicationError, e.what());
        }
    }

    auto root = wallet::KeyDeriver::MakeRoot(answer.publicKey, answer.chainCode,
                                             parentPath, config.baseDerivationPath);
    if (!root) {
        LOG_WARN(lc::SIGNER) << "Device returned unusable key material for " << parentPath;
        return Result::Fail(SignerError::InvalidKeyMaterial,
                            "Device returned an invalid public key or chain code");
    }
    return Result::Ok(*root);
}

SignerResult<wallet::ExtendedKey> SigningSession::ResolveSigningKey(const std::string& address) {
    using Result = SignerResult<wallet::ExtendedKey>;

    auto target = eth::Address::FromHex(address);
    if (!target) {
        return Result::Fail(SignerError::FromAddressMissingOrInvalid,
                            "Malformed address: " + address);
    }

    auto root = ResolveRootKey();
    if (!root) {
        return root;
    }

    uint32_t limit = GetConfig().addressSearchLimit;
    wallet::AddressSearchResult found = wallet::FindPathForAddress(*root.value, *target, limit);
    if (found.derivationFailed) {
        return Result::Fail(SignerError::InvalidKeyMaterial,
                            "Child key derivation failed during address search");
    }
    if (!found.Found()) {
        LOG_WARN(lc::SIGNER) << "Address " << target->ToString() << " not within first "
                             << limit << " children of " << root.value->derivationPath;
        return Result::Fail(SignerError::AddressNotFound, address);
    }
    return Result::Ok(*found.key);
}

SignerResult<std::vector<std::string>> SigningSession::GetAccounts(uint32_t count) {
    using Result = SignerResult<std::vector<std::string>>;

    if (count > wallet::MAX_CHILD_COUNT) {
        return Result::Fail(SignerError::InvalidConfiguration,
                            "Account count " + std::to_string(count) + " exceeds " +
                                std::to_string(wallet::MAX_CHILD_COUNT));
    }

    auto root = ResolveRootKey();
    if (!root) {
        return Result::FailFrom(root);
    }
    auto keys = wallet::ListAccounts(*root.value, count);
    if (!keys) {
        return Result::Fail(SignerError::InvalidKeyMaterial, "Child key derivation failed");
    }

    std::vector<std::string> accounts;
    accounts.reserve(keys->size());
    for (const auto& key : *keys) {
        accounts.push_back(key.address.ToString());
    }
    return Result::Ok(std::move(accounts));
}

// ============================================================================
// Signing
// ============================================================================

SignerResult<std::string> SigningSession::SignTransaction(const eth::TxParams& params) {
    using Result = SignerResult<std::string>;
    SubproviderConfig config = GetConfig();
    const eth::ChainRules rules = config.GetChainRules();

    std::optional<eth::Transaction> tx;
    try {
        tx = eth::Transaction::FromParams(params, rules);
    } catch (const std::invalid_argument& e) {
        LOG_DEBUG(lc::SIGNER) << "Rejected transaction params: " << e.what();
        return Result::Fail(SignerError::InvalidTransactionParams, e.what());
    }

    if (!params.from || !eth::IsValidAddress(*params.from)) {
        return Result::Fail(SignerError::FromAddressMissingOrInvalid,
                            params.from ? "Invalid from address: " + *params.from
                                        : "Missing from address");
    }
    const eth::Address from = *eth::Address::FromHex(*params.from);

    auto key = ResolveSigningKey(*params.from);
    if (!key) {
        return Result::FailFrom(key);
    }
    const std::string& path = key.value->derivationPath;

    // Stays open until the signature is validated
    auto session = Acquire();
    if (!session) {
        return Result::FailFrom(session);
    }

    device::DeviceSignature raw;
    const std::string digest = tx->GetSigningHash().ToHex();
    LOG_DEBUG(lc::SIGNER) << "Requesting signature over " << util::AbbreviateHex(digest)
                          << " at " << path;
    try {
        raw = session.value->Client().SignTransaction(path, digest);
    } catch (const std::exception& e) {
        LOG_WARN(lc::SIGNER) << "SignTransaction(" << path << ") failed: " << e.what();
        return Result::Fail(SignerError::DeviceCommunicationError, e.what());
    }

    auto sig = ParseSignature(raw, rules.chainId);
    if (!sig) {
        LOG_WARN(lc::SIGNER) << "Device returned malformed signature (v=" << raw.v << ")";
        return Result::Fail(SignerError::WrongSignature, "Malformed signature from device");
    }

    Bytes serialized = tx->WithSignature(sig->recid, sig->r, sig->s).Serialize();

    // Verify what will be broadcast, not the in-memory object
    std::string reason;
    std::optional<eth::Address> sender;
    try {
        eth::Transaction decoded = eth::Transaction::Deserialize(serialized);
        if (!decoded.ValidateSignature(&reason)) {
            LOG_WARN(lc::SIGNER) << "Signature rejected: " << reason;
            return Result::Fail(SignerError::WrongSignature, reason);
        }
        if (decoded.GetChainId() != rules.chainId) {
            return Result::Fail(SignerError::WrongSignature, "Signature bound to another chain");
        }
        sender = decoded.GetSenderAddress();
    } catch (const std::exception& e) {
        return Result::Fail(SignerError::WrongSignature, e.what());
    }

    if (!sender) {
        return Result::Fail(SignerError::WrongSignature, "Cannot recover signer");
    }
    if (*sender != from) {
        LOG_WARN(lc::SIGNER) << "Signed by " << sender->ToString() << ", expected "
                             << from.ToString();
        return Result::Fail(SignerError::WrongSigner,
                            "Recovered " + sender->ToString() + ", expected " + from.ToString());
    }

    LOG_INFO(lc::SIGNER) << "Signed transaction from " << from.ToString() << " at " << path;
    return Result::Ok(AddHexPrefix(BytesToHex(serialized)));
}

SignerResult<std::string> SigningSession::SignPersonalMessage(const std::optional<std::string>& data,
                                                              const std::string& address) {
    using Result = SignerResult<std::string>;

    if (!data) {
        return Result::Fail(SignerError::DataMissingForSignPersonalMessage,
                            "No data to sign");
    }

    auto key = ResolveSigningKey(address);
    if (!key) {
        return Result::FailFrom(key);
    }
    const std::string& path = key.value->derivationPath;

    auto session = Acquire();
    if (!session) {
        return Result::FailFrom(session);
    }

    device::DeviceSignature raw;
    LOG_DEBUG(lc::SIGNER) << "Requesting personal signature over "
                          << util::AbbreviateHex(*data) << " at " << path;
    try {
        raw = session.value->Client().SignPersonalMessage(path, StripHexPrefix(*data));
    } catch (const std::exception& e) {
        LOG_WARN(lc::SIGNER) << "SignPersonalMessage(" << path << ") failed: " << e.what();
        return Result::Fail(SignerError::DeviceCommunicationError, e.what());
    }

    auto sig = ParseSignature(raw, GetConfig().networkId);
    if (!sig) {
        LOG_WARN(lc::SIGNER) << "Device returned malformed signature (v=" << raw.v << ")";
        return Result::Fail(SignerError::WrongSignature, "Malformed signature from device");
    }

    std::string recid = PadLeftHex(sig->recid == 0 ? "0" : "1", 2);
    return Result::Ok("0x" + BytesToHex(sig->r) + BytesToHex(sig->s) + recid);
}

SignerResult<std::string> SigningSession::SignTypedData(const std::string& address,
                                                        const std::string& /*typedData*/) {
    LOG_DEBUG(lc::SIGNER) << "Typed data signing requested for " << address;
    return SignerResult<std::string>::Fail(SignerError::MethodNotSupported,
                                           "Typed data signing is not supported by the device");
}

} // namespace signer
} // namespace ethledger
