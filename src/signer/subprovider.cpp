// ETHLEDGER - Signing Subprovider Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/signer/subprovider.h>
#include <ethledger/util/logging.h>

namespace ethledger {
namespace signer {

namespace {

/// Run `work` on the pool; a rejected submission becomes a failed result
template<typename T, typename F>
std::future<SignerResult<T>> Dispatch(util::ThreadPool& pool, F&& work) {
    try {
        return pool.Submit(std::forward<F>(work));
    } catch (const util::PoolRejectedError& e) {
        LOG_WARN(util::LogCategory::SIGNER) << e.what();
        std::promise<SignerResult<T>> rejected;
        rejected.set_value(SignerResult<T>::Fail(SignerError::DeviceCommunicationError, e.what()));
        return rejected.get_future();
    }
}

} // anonymous namespace

SigningSubprovider::SigningSubprovider(std::shared_ptr<device::IDeviceClientFactory> factory,
                                       SubproviderConfig config,
                                       size_t workerThreads)
    : session_(std::make_unique<SigningSession>(std::move(factory), std::move(config))) {
    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = workerThreads == 0 ? 1 : workerThreads;
    poolConfig.name = "signer";
    pool_ = std::make_unique<util::ThreadPool>(poolConfig);
}

SignerResult<std::shared_ptr<SigningSubprovider>>
SigningSubprovider::Create(std::shared_ptr<device::IDeviceClientFactory> factory,
                           const SubproviderConfig& config) {
    using Result = SignerResult<std::shared_ptr<SigningSubprovider>>;
    if (!factory) {
        return Result::Fail(SignerError::InvalidConfiguration, "No device factory");
    }
    SignerStatus status = ValidateConfig(config);
    if (!status) {
        return Result::Fail(status.error, status.message);
    }
    return Result::Ok(std::make_shared<SigningSubprovider>(std::move(factory), config));
}

SigningSubprovider::~SigningSubprovider() {
    // Queued requests still need the session
    pool_->Shutdown();
}

// ============================================================================
// Synchronous API
// ============================================================================

SignerResult<std::vector<std::string>> SigningSubprovider::GetAccounts(std::optional<uint32_t> count) {
    uint32_t n = count.value_or(session_->GetConfig().numAddressesToFetch);
    return session_->GetAccounts(n);
}

SignerResult<std::string> SigningSubprovider::SignTransaction(const eth::TxParams& params) {
    return session_->SignTransaction(params);
}

SignerResult<std::string> SigningSubprovider::SignPersonalMessage(const std::optional<std::string>& data,
                                                                  const std::string& address) {
    return session_->SignPersonalMessage(data, address);
}

SignerResult<std::string> SigningSubprovider::SignTypedData(const std::string& address,
                                                            const std::string& typedData) {
    return session_->SignTypedData(address, typedData);
}

// ============================================================================
// Asynchronous API
// ============================================================================

std::future<SignerResult<std::vector<std::string>>>
SigningSubprovider::GetAccountsAsync(std::optional<uint32_t> count) {
    return Dispatch<std::vector<std::string>>(*pool_, [this, count]() { return GetAccounts(count); });
}

std::future<SignerResult<std::string>> SigningSubprovider::SignTransactionAsync(eth::TxParams params) {
    return Dispatch<std::string>(*pool_, [this, params = std::move(params)]() {
        return SignTransaction(params);
    });
}

std::future<SignerResult<std::string>>
SigningSubprovider::SignPersonalMessageAsync(std::optional<std::string> data, std::string address) {
    return Dispatch<std::string>(*pool_, [this, data = std::move(data), address = std::move(address)]() {
        return SignPersonalMessage(data, address);
    });
}

std::future<SignerResult<std::string>>
SigningSubprovider::SignTypedDataAsync(std::string address, std::string typedData) {
    return Dispatch<std::string>(*pool_, [this, address = std::move(address),
                                          typedData = std::move(typedData)]() {
        return SignTypedData(address, typedData);
    });
}

} // namespace signer
} // namespace ethledger
