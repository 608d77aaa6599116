// ETHLEDGER - Signer Configuration Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/signer/config.h>
#include <ethledger/util/logging.h>

#include <string>

namespace ethledger {
namespace signer {

namespace ck = util::ConfigKeys;

namespace {

SignerResult<uint32_t> ReadCount(const util::ConfigManager& config, const char* key,
                                 uint32_t defaultValue) {
    if (!config.HasKey(key)) {
        return SignerResult<uint32_t>::Ok(defaultValue);
    }
    auto value = config.TryGetUInt(key);
    if (!value || *value == 0 || *value > wallet::MAX_CHILD_COUNT) {
        return SignerResult<uint32_t>::Fail(
            SignerError::InvalidConfiguration,
            std::string(key) + " must be a positive integer, got '" +
                config.GetString(key, "") + "'");
    }
    return SignerResult<uint32_t>::Ok(static_cast<uint32_t>(*value));
}

} // anonymous namespace

SignerStatus ValidateConfig(const SubproviderConfig& config) {
    if (config.networkId == 0) {
        return SignerStatus::Fail(SignerError::InvalidConfiguration, "networkId must be non-zero");
    }
    if (!wallet::DerivationPath::FromString(config.baseDerivationPath)) {
        return SignerStatus::Fail(SignerError::InvalidDerivationPath,
                                  "Malformed derivation path: " + config.baseDerivationPath);
    }
    if (config.addressSearchLimit == 0 || config.addressSearchLimit > wallet::MAX_CHILD_COUNT) {
        return SignerStatus::Fail(SignerError::InvalidConfiguration,
                                  "addressSearchLimit must be in 1.." +
                                      std::to_string(wallet::MAX_CHILD_COUNT));
    }
    if (config.numAddressesToFetch == 0 || config.numAddressesToFetch > wallet::MAX_CHILD_COUNT) {
        return SignerStatus::Fail(SignerError::InvalidConfiguration,
                                  "numAddressesToFetch must be in 1.." +
                                      std::to_string(wallet::MAX_CHILD_COUNT));
    }
    return SignerStatus::Ok();
}

SignerResult<SubproviderConfig> LoadSubproviderConfig(const util::ConfigManager& config) {
    using Result = SignerResult<SubproviderConfig>;
    SubproviderConfig out;

    auto networkId = config.TryGetUInt(ck::NETWORKID);
    if (!networkId) {
        return Result::Fail(SignerError::InvalidConfiguration,
                            config.HasKey(ck::NETWORKID)
                                ? "networkid must be an unsigned integer"
                                : "networkid is required");
    }
    out.networkId = *networkId;

    out.baseDerivationPath = config.GetString(ck::DERIVATIONPATH, out.baseDerivationPath);

    if (config.HasKey(ck::ASKCONFIRMATION)) {
        auto ask = config.TryGetBool(ck::ASKCONFIRMATION);
        if (!ask) {
            return Result::Fail(SignerError::InvalidConfiguration,
                                "askconfirmation must be a boolean");
        }
        out.shouldAskForOnDeviceConfirmation = *ask;
    }

    auto limit = ReadCount(config, ck::ADDRESSSEARCHLIMIT, out.addressSearchLimit);
    if (!limit) return Result::FailFrom(limit);
    out.addressSearchLimit = *limit.value;

    auto count = ReadCount(config, ck::NUMADDRESSES, out.numAddressesToFetch);
    if (!count) return Result::FailFrom(count);
    out.numAddressesToFetch = *count.value;

    if (config.HasKey(ck::HARDFORK)) {
        std::string name = config.GetString(ck::HARDFORK, "");
        auto fork = eth::HardforkFromString(name);
        if (!fork) {
            return Result::Fail(SignerError::InvalidConfiguration, "Unknown hardfork: " + name);
        }
        out.hardfork = *fork;
    }

    SignerStatus status = ValidateConfig(out);
    if (!status) {
        return Result::Fail(status.error, status.message);
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Signer config: network " << out.networkId
                                         << ", path " << out.baseDerivationPath
                                         << ", hardfork " << eth::HardforkToString(out.hardfork);
    return Result::Ok(out);
}

} // namespace signer
} // namespace ethledger
