// ETHLEDGER - Signing Session
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Orchestrates one signing operation against the hardware device:
// acquire the connection, resolve the signing key from the device's
// extended public key, ask the device to sign, verify the result and
// release the connection on every path.

#ifndef ETHLEDGER_SIGNER_SIGNING_SESSION_H
#define ETHLEDGER_SIGNER_SIGNING_SESSION_H

#include <ethledger/device/connection_guard.h>
#include <ethledger/device/device.h>
#include <ethledger/eth/transaction.h>
#include <ethledger/signer/config.h>
#include <ethledger/signer/errors.h>
#include <ethledger/wallet/hdkey.h>

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ethledger {
namespace signer {

/**
 * Map a device v value to the recovery id (0 or 1).
 *
 * Accepts 0/1, 27/28 and EIP-155 values 35 + 2 * chainId + {0,1}.
 * @return nullopt for anything else
 */
std::optional<int> NormalizeRecoveryId(uint64_t v, uint64_t chainId);

class SigningSession {
public:
    /**
     * @param factory Opens device connections
     * @param config Must pass ValidateConfig
     * @throws std::invalid_argument on an invalid config or null factory
     */
    SigningSession(std::shared_ptr<device::IDeviceClientFactory> factory,
                   SubproviderConfig config);

    SigningSession(const SigningSession&) = delete;
    SigningSession& operator=(const SigningSession&) = delete;

    /// Extended public key at the base derivation path, fetched from the device
    SignerResult<wallet::ExtendedKey> ResolveRootKey();

    /// Child of the root key whose address is `address`
    SignerResult<wallet::ExtendedKey> ResolveSigningKey(const std::string& address);

    /// First `count` account addresses (lowercase, 0x-prefixed)
    SignerResult<std::vector<std::string>> GetAccounts(uint32_t count);

    /// 0x-prefixed hex of the signed serialized transaction
    SignerResult<std::string> SignTransaction(const eth::TxParams& params);

    /// 0x-prefixed r || s || v with v the two-digit recovery id
    SignerResult<std::string> SignPersonalMessage(const std::optional<std::string>& data,
                                                  const std::string& address);

    /// Always MethodNotSupported
    SignerResult<std::string> SignTypedData(const std::string& address,
                                            const std::string& typedData);

    std::string GetPath() const;

    /// @return InvalidDerivationPath for a malformed path (current path kept)
    SignerStatus SetPath(const std::string& baseDerivationPath);

    SubproviderConfig GetConfig() const;

    size_t OpenSessionCount() const { return guard_.OpenSessionCount(); }

private:
    struct ParsedSignature {
        std::array<Byte, 32> r{};
        std::array<Byte, 32> s{};
        int recid{0};
    };

    SignerResult<device::DeviceSession> Acquire();

    static std::optional<ParsedSignature> ParseSignature(const device::DeviceSignature& sig,
                                                         uint64_t chainId);

    mutable std::mutex configMutex_;
    SubproviderConfig config_;
    device::ConnectionGuard guard_;
};

} // namespace signer
} // namespace ethledger

#endif // ETHLEDGER_SIGNER_SIGNING_SESSION_H
