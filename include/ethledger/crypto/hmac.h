// ETHLEDGER - HMAC and Key Stretching
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// HMAC-SHA512 (RFC 2104) and PBKDF2-HMAC-SHA512 (RFC 8018), backed by OpenSSL.
// These are the primitives behind BIP32 child derivation and BIP39 seeds.

#ifndef ETHLEDGER_CRYPTO_HMAC_H
#define ETHLEDGER_CRYPTO_HMAC_H

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>
#include <ethledger/core/types.h>

namespace ethledger {

namespace hmac {
    /// HMAC-SHA512 output size
    constexpr size_t SHA512_SIZE = 64;
}

/**
 * Compute HMAC-SHA512 in one call.
 *
 * @param key Secret key
 * @param keyLen Key length
 * @param data Data to authenticate
 * @param dataLen Data length
 * @return 64-byte MAC
 * @throws std::runtime_error if the OpenSSL call fails
 */
Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

/// Compute HMAC-SHA512 with vectors
inline Hash512 ComputeHMAC_SHA512(const std::vector<Byte>& key,
                                  const std::vector<Byte>& data) {
    return ComputeHMAC_SHA512(key.data(), key.size(), data.data(), data.size());
}

/**
 * PBKDF2 with HMAC-SHA512.
 *
 * @param password Password bytes
 * @param salt Salt bytes
 * @param iterations Iteration count
 * @param keyLen Desired key length
 * @return Derived key
 * @throws std::runtime_error if the OpenSSL call fails
 */
std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::vector<Byte>& salt,
                                uint32_t iterations,
                                size_t keyLen);

/// Overwrite a buffer with zeros in a way the optimizer keeps
void SecureClear(void* ptr, size_t len);

} // namespace ethledger

#endif // ETHLEDGER_CRYPTO_HMAC_H
