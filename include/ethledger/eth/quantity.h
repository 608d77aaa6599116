// ETHLEDGER - Numeric Quantities
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Unsigned 256-bit quantities (wei amounts, gas, nonces) carried as
// minimal big-endian byte strings, the form RLP encodes them in.

#ifndef ETHLEDGER_ETH_QUANTITY_H
#define ETHLEDGER_ETH_QUANTITY_H

#include <ethledger/core/types.h>

#include <cstdint>
#include <string>

namespace ethledger {
namespace eth {

/// Largest quantity width in bytes
constexpr size_t MAX_QUANTITY_BYTES = 32;

/**
 * Parse "0x"-prefixed hex or plain decimal into minimal big-endian bytes.
 * Zero parses to an empty vector; "0x" alone is zero.
 *
 * @throws std::invalid_argument on empty input, bad digits, a sign, or
 *         values wider than 256 bits
 */
Bytes ParseQuantity(const std::string& str);

/// "0x"-prefixed minimal hex ("0x0" for zero)
std::string QuantityToHex(const Bytes& quantity);

/// Decimal string
std::string QuantityToDecimal(const Bytes& quantity);

/// @throws std::invalid_argument if the value does not fit in 64 bits
uint64_t QuantityToUint64(const Bytes& quantity);

/// Minimal big-endian encoding of a 64-bit value
Bytes Uint64ToQuantity(uint64_t value);

/// Strip leading zero bytes
Bytes TrimQuantity(const Bytes& bytes);

} // namespace eth
} // namespace ethledger

#endif // ETHLEDGER_ETH_QUANTITY_H
