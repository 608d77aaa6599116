// ETHLEDGER - Device Connection Guard Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/device/connection_guard.h>
#include <ethledger/util/logging.h>

namespace ethledger {
namespace device {

// ============================================================================
// DeviceSession
// ============================================================================

DeviceSession::~DeviceSession() {
    Release();
}

DeviceSession::DeviceSession(DeviceSession&& other) noexcept
    : guard_(other.guard_), id_(other.id_), client_(other.client_) {
    other.guard_ = nullptr;
    other.id_ = 0;
    other.client_ = nullptr;
}

DeviceSession& DeviceSession::operator=(DeviceSession&& other) noexcept {
    if (this != &other) {
        Release();
        guard_ = other.guard_;
        id_ = other.id_;
        client_ = other.client_;
        other.guard_ = nullptr;
        other.id_ = 0;
        other.client_ = nullptr;
    }
    return *this;
}

IDeviceClient& DeviceSession::Client() const {
    if (!client_) {
        throw std::logic_error("Device session already released");
    }
    return *client_;
}

void DeviceSession::Release() {
    if (!guard_) {
        return;
    }
    ConnectionGuard* guard = guard_;
    uint64_t id = id_;
    guard_ = nullptr;
    id_ = 0;
    client_ = nullptr;
    guard->ReleaseSession(id);
}

// ============================================================================
// ConnectionGuard
// ============================================================================

ConnectionGuard::ConnectionGuard(std::shared_ptr<IDeviceClientFactory> factory)
    : factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("ConnectionGuard requires a device factory");
    }
}

ConnectionGuard::~ConnectionGuard() {
    std::unique_ptr<IDeviceClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = std::move(client_);
    }
    if (client) {
        LOG_WARN(util::LogCategory::DEVICE) << "Guard destroyed with an open session";
        try {
            factory_->Close(*client);
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::DEVICE) << "Device close failed: " << e.what();
        }
    }
}

DeviceSession ConnectionGuard::Acquire() {
    const std::thread::id self = std::this_thread::get_id();
    uint64_t id = 0;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (held_ && owner_ == self) {
            throw MultipleConnectionsError("Device session already held by this thread");
        }
        released_.wait(lock, [this] { return !held_; });
        held_ = true;
        owner_ = self;
        id = nextId_++;
        currentId_ = id;
    }

    std::unique_ptr<IDeviceClient> client;
    std::string failure;
    try {
        client = factory_->Open();
        if (!client) {
            failure = "factory returned no client";
        }
    } catch (const std::exception& e) {
        failure = e.what();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!failure.empty()) {
        held_ = false;
        owner_ = std::thread::id();
        currentId_ = 0;
        released_.notify_one();
        LOG_WARN(util::LogCategory::DEVICE) << "Cannot open device: " << failure;
        throw DeviceError("Cannot open device: " + failure);
    }

    client_ = std::move(client);
    LOG_DEBUG(util::LogCategory::DEVICE) << "Device session " << id << " opened";
    return DeviceSession(this, id, client_.get());
}

void ConnectionGuard::ReleaseSession(uint64_t id) {
    std::unique_ptr<IDeviceClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!held_ || currentId_ != id) {
            return;
        }
        client = std::move(client_);
    }

    // Permit stays held until the handle is closed
    if (client) {
        try {
            factory_->Close(*client);
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::DEVICE) << "Device close failed: " << e.what();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
        owner_ = std::thread::id();
        currentId_ = 0;
    }
    released_.notify_one();
    LOG_DEBUG(util::LogCategory::DEVICE) << "Device session " << id << " closed";
}

size_t ConnectionGuard::OpenSessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_ ? 1 : 0;
}

} // namespace device
} // namespace ethledger
