// ETHLEDGER - Device Connection Guard
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#ifndef ETHLEDGER_DEVICE_CONNECTION_GUARD_H
#define ETHLEDGER_DEVICE_CONNECTION_GUARD_H

#include <ethledger/device/device.h>

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace ethledger {
namespace device {

class ConnectionGuard;

/// Thrown when a thread that already holds the device asks for it again
class MultipleConnectionsError : public std::logic_error {
public:
    explicit MultipleConnectionsError(const std::string& msg)
        : std::logic_error(msg) {}
};

// ============================================================================
// Device Session
// ============================================================================

/**
 * Exclusive use of the open device. Move-only; the device is closed and
 * the guard's permit returned when the session is released or destroyed.
 */
class DeviceSession {
public:
    DeviceSession() = default;
    ~DeviceSession();

    DeviceSession(DeviceSession&& other) noexcept;
    DeviceSession& operator=(DeviceSession&& other) noexcept;

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    bool IsValid() const { return guard_ != nullptr; }

    /// @throws std::logic_error on a released session
    IDeviceClient& Client() const;

    /// Close the device and return the permit. Idempotent.
    void Release();

private:
    friend class ConnectionGuard;
    DeviceSession(ConnectionGuard* guard, uint64_t id, IDeviceClient* client)
        : guard_(guard), id_(id), client_(client) {}

    ConnectionGuard* guard_{nullptr};
    uint64_t id_{0};
    IDeviceClient* client_{nullptr};
};

// ============================================================================
// Connection Guard
// ============================================================================

/**
 * Serializes access to a single device connection.
 *
 * At most one handle is open at any time. Acquire blocks while another
 * thread holds the session and fails immediately if the calling thread
 * already holds it. The guard must outlive every session it hands out.
 */
class ConnectionGuard {
public:
    explicit ConnectionGuard(std::shared_ptr<IDeviceClientFactory> factory);
    ~ConnectionGuard();

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

    /**
     * Wait for the permit and open the device.
     *
     * @throws MultipleConnectionsError if this thread already holds a session
     * @throws DeviceError if the device cannot be opened (no handle is kept)
     */
    DeviceSession Acquire();

    /// Same as session.Release()
    void Release(DeviceSession& session) { session.Release(); }

    /// Number of open device handles (0 or 1)
    size_t OpenSessionCount() const;

private:
    friend class DeviceSession;
    void ReleaseSession(uint64_t id);

    std::shared_ptr<IDeviceClientFactory> factory_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::unique_ptr<IDeviceClient> client_;
    bool held_{false};
    std::thread::id owner_;
    uint64_t currentId_{0};
    uint64_t nextId_{1};
};

} // namespace device
} // namespace ethledger

#endif // ETHLEDGER_DEVICE_CONNECTION_GUARD_H
