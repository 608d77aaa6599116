// ETHLEDGER - Recursive Length Prefix Encoding
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// RLP serialization as defined in the Ethereum Yellow Paper, appendix B.

#ifndef ETHLEDGER_ETH_RLP_H
#define ETHLEDGER_ETH_RLP_H

#include <ethledger/core/types.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ethledger {
namespace eth {

/// Thrown on malformed or non-canonical RLP input
class RLPError : public std::runtime_error {
public:
    explicit RLPError(const std::string& msg)
        : std::runtime_error("RLP: " + msg) {}
};

/**
 * A decoded RLP item: either a byte string or a list of items.
 */
class RLPItem {
public:
    RLPItem() = default;

    static RLPItem FromBytes(Bytes bytes);
    static RLPItem FromList(std::vector<RLPItem> items);

    bool IsList() const { return isList_; }

    /// @throws RLPError if this is a list
    const Bytes& GetBytes() const;

    /// @throws RLPError if this is a byte string
    const std::vector<RLPItem>& GetList() const;

private:
    bool isList_{false};
    Bytes bytes_;
    std::vector<RLPItem> items_;
};

namespace rlp {

/// Encode a byte string
Bytes EncodeBytes(const Bytes& data);

/// Encode an unsigned integer as its minimal big-endian byte string
Bytes EncodeUint(uint64_t value);

/// Wrap already-encoded items in a list header
Bytes EncodeList(const std::vector<Bytes>& encodedItems);

/// Encode an item tree
Bytes Encode(const RLPItem& item);

/**
 * Decode exactly one item spanning all of `data`.
 * @throws RLPError on truncation, trailing bytes or non-canonical lengths
 */
RLPItem Decode(const Bytes& data);

/**
 * Interpret a byte string as a canonical unsigned integer.
 * @throws RLPError on leading zeros or values wider than 64 bits
 */
uint64_t DecodeUint(const Bytes& data);

} // namespace rlp

} // namespace eth
} // namespace ethledger

#endif // ETHLEDGER_ETH_RLP_H
