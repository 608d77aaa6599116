// ETHLEDGER - Address Search
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Maps an account address back to its derivation path below a root key.

#ifndef ETHLEDGER_WALLET_ADDRESS_SEARCH_H
#define ETHLEDGER_WALLET_ADDRESS_SEARCH_H

#include <ethledger/wallet/hdkey.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ethledger {
namespace wallet {

/// Default number of child indices examined by FindPathForAddress
constexpr uint32_t DEFAULT_ADDRESS_SEARCH_LIMIT = 1000;

/// Default number of addresses listed by ListAccounts
constexpr uint32_t DEFAULT_NUM_ADDRESSES_TO_FETCH = 20;

/// Non-hardened children available below one key (indices 0 .. 2^31-1)
constexpr uint32_t MAX_CHILD_COUNT = HARDENED_FLAG;

/// Outcome of an address search
struct AddressSearchResult {
    /// Matching child key, if found
    std::optional<ExtendedKey> key;
    /// Number of candidates derived
    uint32_t examined{0};
    /// True if a candidate could not be derived (malformed root)
    bool derivationFailed{false};

    bool Found() const { return key.has_value(); }
};

/**
 * Scan children 0, 1, ... searchLimit-1 of `root` and return the first
 * whose address equals `target` (case-insensitive).
 */
AddressSearchResult FindPathForAddress(const ExtendedKey& root,
                                       const eth::Address& target,
                                       uint32_t searchLimit = DEFAULT_ADDRESS_SEARCH_LIMIT);

/**
 * First `count` child keys of `root` in increasing index order.
 * Returns nullopt if any child cannot be derived.
 */
std::optional<std::vector<ExtendedKey>> ListAccounts(const ExtendedKey& root,
                                                     uint32_t count = DEFAULT_NUM_ADDRESSES_TO_FETCH);

} // namespace wallet
} // namespace ethledger

#endif // ETHLEDGER_WALLET_ADDRESS_SEARCH_H
