// ETHLEDGER - Personal Message Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/eth/message.h>
#include <ethledger/crypto/keccak.h>

#include <cstring>
#include <string>

namespace ethledger {
namespace eth {

Bytes PersonalMessagePayload(const Bytes& message) {
    std::string header = std::string(PERSONAL_MESSAGE_PREFIX) + std::to_string(message.size());
    Bytes payload(header.begin(), header.end());
    payload.insert(payload.end(), message.begin(), message.end());
    return payload;
}

Hash256 PersonalMessageHash(const Bytes& message) {
    return Keccak256Hash(PersonalMessagePayload(message));
}

} // namespace eth
} // namespace ethledger
