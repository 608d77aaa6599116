// ETHLEDGER - Hardware Signing Device Interface
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Abstract transport to an Ethereum signing device. Implementations talk
// to real hardware (USB HID) or, for tests and tooling, a software key.

#ifndef ETHLEDGER_DEVICE_DEVICE_H
#define ETHLEDGER_DEVICE_DEVICE_H

#include <ethledger/core/types.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace ethledger {
namespace device {

/// Any failure reported by a device or its transport
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& msg)
        : std::runtime_error(msg) {}
};

/// Answer to a GetAddress request
struct DeviceAddress {
    /// SEC1 public key (33 or 65 bytes)
    Bytes publicKey;
    /// BIP32 chain code (32 bytes), empty unless requested
    Bytes chainCode;
    /// "0x"-prefixed account address
    std::string address;
};

/**
 * Raw signature as returned by the device. The meaning of v depends on the
 * firmware and the request (recovery id, 27/28, or EIP-155 encoded).
 */
struct DeviceSignature {
    /// 64 hex digits, no prefix
    std::string r;
    /// 64 hex digits, no prefix
    std::string s;
    uint64_t v{0};
};

/**
 * An open connection to a signing device.
 *
 * Paths are full BIP32 paths as sent by the signer ("m/44'/60'/0'/0/3").
 * Clients also accept them without the "m/" prefix. Every call may throw
 * DeviceError.
 */
class IDeviceClient {
public:
    virtual ~IDeviceClient() = default;

    virtual DeviceAddress GetAddress(const std::string& path,
                                     bool confirm,
                                     bool includeChainCode) = 0;

    /// Sign a 32-byte transaction digest given as 64 hex digits
    virtual DeviceSignature SignTransaction(const std::string& path,
                                            const std::string& digestHex) = 0;

    /// Sign arbitrary data (hex, no prefix) under the EIP-191 personal prefix
    virtual DeviceSignature SignPersonalMessage(const std::string& path,
                                                const std::string& dataHex) = 0;
};

/// Opens and closes device connections
class IDeviceClientFactory {
public:
    virtual ~IDeviceClientFactory() = default;

    /// @throws DeviceError when no device can be opened
    virtual std::unique_ptr<IDeviceClient> Open() = 0;

    /// @throws DeviceError when the transport fails to close cleanly
    virtual void Close(IDeviceClient& client) = 0;
};

} // namespace device
} // namespace ethledger

#endif // ETHLEDGER_DEVICE_DEVICE_H
