// ETHLEDGER - Personal Messages
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#ifndef ETHLEDGER_ETH_MESSAGE_H
#define ETHLEDGER_ETH_MESSAGE_H

#include <ethledger/core/types.h>

namespace ethledger {
namespace eth {

/// Prefix for EIP-191 version 0x45 ("E") signed data
constexpr const char* PERSONAL_MESSAGE_PREFIX = "\x19" "Ethereum Signed Message:\n";

/// prefix || decimal(len(message)) || message
Bytes PersonalMessagePayload(const Bytes& message);

/// Keccak-256 of PersonalMessagePayload(message)
Hash256 PersonalMessageHash(const Bytes& message);

} // namespace eth
} // namespace ethledger

#endif // ETHLEDGER_ETH_MESSAGE_H
