// ETHLEDGER - Software Debug Device
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// An in-process signing device backed by a BIP39 mnemonic or raw seed.
// Answers like hardware firmware does. Never use it with real funds.

#ifndef ETHLEDGER_DEVICE_DEBUG_DEVICE_H
#define ETHLEDGER_DEVICE_DEBUG_DEVICE_H

#include <ethledger/device/device.h>
#include <ethledger/wallet/hdkey.h>

#include <atomic>
#include <memory>
#include <string>

namespace ethledger {
namespace device {

/**
 * Software device client.
 *
 * SignTransaction returns v as the recovery id (0/1); SignPersonalMessage
 * returns v as 27/28.
 */
class DebugDeviceClient : public IDeviceClient {
public:
    explicit DebugDeviceClient(std::shared_ptr<const wallet::ExtendedPrivateKey> master,
                               bool rejectConfirmations = false);

    DeviceAddress GetAddress(const std::string& path,
                             bool confirm,
                             bool includeChainCode) override;

    DeviceSignature SignTransaction(const std::string& path,
                                    const std::string& digestHex) override;

    DeviceSignature SignPersonalMessage(const std::string& path,
                                        const std::string& dataHex) override;

private:
    wallet::ExtendedPrivateKey KeyAt(const std::string& path) const;
    DeviceSignature Sign(const std::string& path, const Hash256& hash, uint64_t vBase) const;

    std::shared_ptr<const wallet::ExtendedPrivateKey> master_;
    bool rejectConfirmations_;
};

/// Factory handing out DebugDeviceClient instances over one master key
class DebugDeviceFactory : public IDeviceClientFactory {
public:
    /// @throws DeviceError if the seed yields no valid master key
    explicit DebugDeviceFactory(const Bytes& seed);

    static std::shared_ptr<DebugDeviceFactory> FromMnemonic(const std::string& mnemonic,
                                                            const std::string& passphrase = "");

    std::unique_ptr<IDeviceClient> Open() override;
    void Close(IDeviceClient& client) override;

    /// Simulate the user pressing "reject" on every confirmation prompt
    void SetRejectConfirmations(bool reject) { rejectConfirmations_ = reject; }

    size_t OpenCount() const { return opened_.load(); }
    size_t CloseCount() const { return closed_.load(); }

private:
    std::shared_ptr<const wallet::ExtendedPrivateKey> master_;
    std::atomic<bool> rejectConfirmations_{false};
    std::atomic<size_t> opened_{0};
    std::atomic<size_t> closed_{0};
};

} // namespace device
} // namespace ethledger

#endif // ETHLEDGER_DEVICE_DEBUG_DEVICE_H
