// ETHLEDGER - HMAC Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/crypto/hmac.h>
#include <stdexcept>

#include <openssl/hmac.h>
#include <openssl/evp.h>

namespace ethledger {

void SecureClear(void* ptr, size_t len) {
    volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
    while (len--) *p++ = 0;
}

Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    Hash512 result;
    unsigned int outLen = 0;
    if (!HMAC(EVP_sha512(), key, static_cast<int>(keyLen), data, dataLen,
              result.data(), &outLen) || outLen != hmac::SHA512_SIZE) {
        throw std::runtime_error("HMAC-SHA512 computation failed");
    }
    return result;
}

std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::vector<Byte>& salt,
                                uint32_t iterations,
                                size_t keyLen) {
    std::vector<Byte> out(keyLen);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha512(),
                          static_cast<int>(keyLen), out.data()) != 1) {
        throw std::runtime_error("PBKDF2-HMAC-SHA512 computation failed");
    }
    return out;
}

} // namespace ethledger
