// ETHLEDGER - Core Types Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/core/types.h>
#include <ethledger/core/hex.h>

namespace ethledger {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    auto bytes = HexToBytes(digits);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<512>;
template class BaseHash<160>;

} // namespace ethledger
