// ETHLEDGER - Signer Configuration
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#ifndef ETHLEDGER_SIGNER_CONFIG_H
#define ETHLEDGER_SIGNER_CONFIG_H

#include <ethledger/eth/transaction.h>
#include <ethledger/signer/errors.h>
#include <ethledger/util/config.h>
#include <ethledger/wallet/address_search.h>
#include <ethledger/wallet/hdkey.h>

#include <cstdint>
#include <string>

namespace ethledger {
namespace signer {

/// Settings of a SigningSubprovider
struct SubproviderConfig {
    /// Chain id bound into every transaction signature
    uint64_t networkId{0};
    /// Account-level path the device is asked for, "m/" optional
    std::string baseDerivationPath{wallet::DEFAULT_BASE_DERIVATION_PATH};
    bool shouldAskForOnDeviceConfirmation{false};
    uint32_t addressSearchLimit{wallet::DEFAULT_ADDRESS_SEARCH_LIMIT};
    uint32_t numAddressesToFetch{wallet::DEFAULT_NUM_ADDRESSES_TO_FETCH};
    eth::Hardfork hardfork{eth::Hardfork::London};

    eth::ChainRules GetChainRules() const { return {networkId, hardfork}; }
};

/**
 * Check ranges and formats: networkId non-zero, base path parseable,
 * search limit and fetch count non-zero.
 */
SignerStatus ValidateConfig(const SubproviderConfig& config);

/**
 * Read a SubproviderConfig from the "networkid", "derivationpath",
 * "askconfirmation", "addresssearchlimit", "numaddresses" and "hardfork"
 * keys. Missing optional keys keep their defaults; networkid is required.
 */
SignerResult<SubproviderConfig> LoadSubproviderConfig(const util::ConfigManager& config);

} // namespace signer
} // namespace ethledger

#endif // ETHLEDGER_SIGNER_CONFIG_H
