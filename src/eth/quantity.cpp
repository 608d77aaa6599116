// ETHLEDGER - Quantity Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/eth/quantity.h>
#include <ethledger/core/hex.h>

#include <memory>
#include <stdexcept>

#include <openssl/bn.h>
#include <openssl/crypto.h>

namespace ethledger {
namespace eth {

namespace {

struct BNDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;

bool AllOf(const std::string& s, bool hex) {
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool letter = (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!digit && !(hex && letter)) return false;
    }
    return true;
}

Bytes ToBytes(const BIGNUM* bn) {
    Bytes out(static_cast<size_t>(BN_num_bytes(bn)));
    if (!out.empty()) {
        BN_bn2bin(bn, out.data());
    }
    return out;
}

BNPtr FromBytes(const Bytes& quantity) {
    BNPtr bn(BN_bin2bn(quantity.data(), static_cast<int>(quantity.size()), nullptr));
    if (!bn) throw std::runtime_error("BN_bin2bn failed");
    return bn;
}

} // anonymous namespace

Bytes ParseQuantity(const std::string& str) {
    if (str.empty()) {
        throw std::invalid_argument("Empty quantity");
    }

    const bool hex = IsHexPrefixed(str);
    std::string digits = hex ? str.substr(2) : str;
    if (hex && digits.empty()) {
        return Bytes();
    }
    if (digits.empty() || !AllOf(digits, hex)) {
        throw std::invalid_argument("Invalid quantity: " + str);
    }

    BIGNUM* raw = nullptr;
    int parsed = hex ? BN_hex2bn(&raw, digits.c_str()) : BN_dec2bn(&raw, digits.c_str());
    BNPtr bn(raw);
    if (!bn || parsed != static_cast<int>(digits.size())) {
        throw std::invalid_argument("Invalid quantity: " + str);
    }
    if (BN_num_bytes(bn.get()) > static_cast<int>(MAX_QUANTITY_BYTES)) {
        throw std::invalid_argument("Quantity exceeds 256 bits: " + str);
    }
    return ToBytes(bn.get());
}

std::string QuantityToHex(const Bytes& quantity) {
    Bytes trimmed = TrimQuantity(quantity);
    if (trimmed.empty()) {
        return "0x0";
    }
    std::string hex = BytesToHex(trimmed);
    size_t firstNonZero = hex.find_first_not_of('0');
    return "0x" + hex.substr(firstNonZero);
}

std::string QuantityToDecimal(const Bytes& quantity) {
    BNPtr bn = FromBytes(quantity);
    char* dec = BN_bn2dec(bn.get());
    if (!dec) throw std::runtime_error("BN_bn2dec failed");
    std::string result(dec);
    OPENSSL_free(dec);
    return result;
}

uint64_t QuantityToUint64(const Bytes& quantity) {
    Bytes trimmed = TrimQuantity(quantity);
    if (trimmed.size() > 8) {
        throw std::invalid_argument("Quantity exceeds 64 bits");
    }
    uint64_t value = 0;
    for (Byte b : trimmed) {
        value = (value << 8) | b;
    }
    return value;
}

Bytes Uint64ToQuantity(uint64_t value) {
    Bytes out;
    while (value > 0) {
        out.insert(out.begin(), static_cast<Byte>(value & 0xFF));
        value >>= 8;
    }
    return out;
}

Bytes TrimQuantity(const Bytes& bytes) {
    size_t i = 0;
    while (i < bytes.size() && bytes[i] == 0) ++i;
    return Bytes(bytes.begin() + i, bytes.end());
}

} // namespace eth
} // namespace ethledger
