// ETHLEDGER - Address Search Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/wallet/address_search.h>
#include <ethledger/util/logging.h>

#include <algorithm>

namespace ethledger {
namespace wallet {

AddressSearchResult FindPathForAddress(const ExtendedKey& root,
                                       const eth::Address& target,
                                       uint32_t searchLimit) {
    AddressSearchResult result;
    searchLimit = std::min(searchLimit, MAX_CHILD_COUNT);

    for (uint32_t i = 0; i < searchLimit; ++i) {
        auto child = KeyDeriver::Derive(root, i);
        ++result.examined;
        if (!child) {
            LOG_WARN(util::LogCategory::WALLET) << "Cannot derive child " << i
                                                << " of " << root.derivationPath;
            result.derivationFailed = true;
            return result;
        }
        if (child->address == target) {
            LOG_DEBUG(util::LogCategory::WALLET) << "Found " << target.ToString()
                                                 << " at " << child->derivationPath;
            result.key = std::move(child);
            return result;
        }
    }

    LOG_DEBUG(util::LogCategory::WALLET) << "Address " << target.ToString()
                                         << " not within first " << searchLimit
                                         << " children of " << root.derivationPath;
    return result;
}

std::optional<std::vector<ExtendedKey>> ListAccounts(const ExtendedKey& root, uint32_t count) {
    if (count > MAX_CHILD_COUNT) {
        return std::nullopt;
    }

    std::vector<ExtendedKey> accounts;
    for (uint32_t i = 0; i < count; ++i) {
        auto child = KeyDeriver::Derive(root, i);
        if (!child) {
            return std::nullopt;
        }
        accounts.push_back(std::move(*child));
    }
    return accounts;
}

} // namespace wallet
} // namespace ethledger
