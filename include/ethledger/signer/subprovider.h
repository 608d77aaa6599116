// ETHLEDGER - Signing Subprovider
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Public face of the signer: account listing and signing, synchronous or
// on a private worker pool. All device traffic is serialized.

#ifndef ETHLEDGER_SIGNER_SUBPROVIDER_H
#define ETHLEDGER_SIGNER_SUBPROVIDER_H

#include <ethledger/signer/signing_session.h>
#include <ethledger/util/threadpool.h>

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ethledger {
namespace signer {

class SigningSubprovider {
public:
    /// Worker threads used by the *Async methods
    static constexpr size_t DEFAULT_WORKER_THREADS = 2;

    /**
     * @throws std::invalid_argument on an invalid config or null factory
     */
    SigningSubprovider(std::shared_ptr<device::IDeviceClientFactory> factory,
                       SubproviderConfig config,
                       size_t workerThreads = DEFAULT_WORKER_THREADS);

    /// Validating constructor that reports failures as a result
    static SignerResult<std::shared_ptr<SigningSubprovider>>
    Create(std::shared_ptr<device::IDeviceClientFactory> factory,
           const SubproviderConfig& config);

    ~SigningSubprovider();

    SigningSubprovider(const SigningSubprovider&) = delete;
    SigningSubprovider& operator=(const SigningSubprovider&) = delete;

    // ========================================================================
    // Synchronous API
    // ========================================================================

    /// First `count` accounts; nullopt uses numAddressesToFetch
    SignerResult<std::vector<std::string>> GetAccounts(std::optional<uint32_t> count = std::nullopt);

    SignerResult<std::string> SignTransaction(const eth::TxParams& params);

    SignerResult<std::string> SignPersonalMessage(const std::optional<std::string>& data,
                                                  const std::string& address);

    SignerResult<std::string> SignTypedData(const std::string& address,
                                            const std::string& typedData);

    // ========================================================================
    // Asynchronous API
    // ========================================================================

    std::future<SignerResult<std::vector<std::string>>>
    GetAccountsAsync(std::optional<uint32_t> count = std::nullopt);

    std::future<SignerResult<std::string>> SignTransactionAsync(eth::TxParams params);

    std::future<SignerResult<std::string>>
    SignPersonalMessageAsync(std::optional<std::string> data, std::string address);

    std::future<SignerResult<std::string>>
    SignTypedDataAsync(std::string address, std::string typedData);

    // ========================================================================
    // Configuration
    // ========================================================================

    std::string GetPath() const { return session_->GetPath(); }
    SignerStatus SetPath(const std::string& baseDerivationPath) {
        return session_->SetPath(baseDerivationPath);
    }

    SubproviderConfig GetConfig() const { return session_->GetConfig(); }

    size_t OpenSessionCount() const { return session_->OpenSessionCount(); }

private:
    std::unique_ptr<SigningSession> session_;
    // Declared last so queued work finishes before the session goes away
    std::unique_ptr<util::ThreadPool> pool_;
};

} // namespace signer
} // namespace ethledger

#endif // ETHLEDGER_SIGNER_SUBPROVIDER_H
