// ETHLEDGER - secp256k1 Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/crypto/secp256k1.h>
#include <cstring>
#include <stdexcept>

#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/bn.h>
#include <openssl/obj_mac.h>

namespace ethledger {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

const std::array<uint8_t, 32> CURVE_ORDER = {{
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
}};

const std::array<uint8_t, 32> HALF_CURVE_ORDER = {{
    0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4, 0x50, 0x1D,
    0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0
}};

namespace {

struct BNDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
struct BNCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
struct GroupDeleter { void operator()(EC_GROUP* p) const { EC_GROUP_free(p); } };
struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
struct KeyDeleter { void operator()(EC_KEY* p) const { EC_KEY_free(p); } };
struct SigDeleter { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;
using BNCtxPtr = std::unique_ptr<BN_CTX, BNCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using ECPointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using KeyPtr = std::unique_ptr<EC_KEY, KeyDeleter>;
using SigPtr = std::unique_ptr<ECDSA_SIG, SigDeleter>;

int Compare32(const uint8_t* a, const uint8_t* b) {
    return std::memcmp(a, b, 32);
}

bool IsZero32(const uint8_t* a) {
    for (int i = 0; i < 32; ++i) {
        if (a[i] != 0) return false;
    }
    return true;
}

BNPtr ToBN(const uint8_t* data, size_t len) {
    BNPtr bn(BN_bin2bn(data, static_cast<int>(len), nullptr));
    if (!bn) throw std::runtime_error("BN_bin2bn failed");
    return bn;
}

/// Write a BIGNUM into exactly 32 big-endian bytes
bool FromBN(const BIGNUM* bn, uint8_t out[32]) {
    return BN_bn2binpad(bn, out, 32) == 32;
}

GroupPtr NewGroup() {
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!group) throw std::runtime_error("secp256k1 group unavailable");
    return group;
}

} // anonymous namespace

// ============================================================================
// Point Implementation
// ============================================================================

struct Point::Impl {
    GroupPtr group;
    ECPointPtr point;
    BNCtxPtr ctx;

    Impl() : group(NewGroup()), ctx(BN_CTX_new()) {
        point.reset(EC_POINT_new(group.get()));
        if (!point || !ctx) throw std::runtime_error("EC point allocation failed");
        EC_POINT_set_to_infinity(group.get(), point.get());
    }

    Impl(const Impl& other) : group(NewGroup()), ctx(BN_CTX_new()) {
        point.reset(EC_POINT_dup(other.point.get(), group.get()));
        if (!point || !ctx) throw std::runtime_error("EC point allocation failed");
    }
};

Point::Point() : impl_(std::make_unique<Impl>()) {}

Point::~Point() = default;

Point::Point(const Point& other) : impl_(std::make_unique<Impl>(*other.impl_)) {}

Point& Point::operator=(const Point& other) {
    if (this != &other) {
        impl_ = std::make_unique<Impl>(*other.impl_);
    }
    return *this;
}

Point::Point(Point&& other) noexcept = default;
Point& Point::operator=(Point&& other) noexcept = default;

std::optional<Point> Point::FromBytes(const uint8_t* data, size_t len) {
    if (!data) return std::nullopt;
    if (len == COMPRESSED_PUBKEY_SIZE) {
        if (data[0] != 0x02 && data[0] != 0x03) return std::nullopt;
    } else if (len == UNCOMPRESSED_PUBKEY_SIZE) {
        if (data[0] != 0x04) return std::nullopt;
    } else {
        return std::nullopt;
    }

    Point result;
    if (EC_POINT_oct2point(result.impl_->group.get(), result.impl_->point.get(),
                           data, len, result.impl_->ctx.get()) != 1) {
        return std::nullopt;
    }
    return result;
}

std::optional<Point> Point::FromBytes(const std::vector<uint8_t>& data) {
    return FromBytes(data.data(), data.size());
}

bool Point::IsInfinity() const {
    return EC_POINT_is_at_infinity(impl_->group.get(), impl_->point.get()) == 1;
}

CompressedPubKey Point::ToCompressed() const {
    CompressedPubKey result{};
    if (!IsInfinity()) {
        EC_POINT_point2oct(impl_->group.get(), impl_->point.get(),
                           POINT_CONVERSION_COMPRESSED,
                           result.data(), result.size(), impl_->ctx.get());
    }
    return result;
}

UncompressedPubKey Point::ToUncompressed() const {
    UncompressedPubKey result{};
    if (!IsInfinity()) {
        EC_POINT_point2oct(impl_->group.get(), impl_->point.get(),
                           POINT_CONVERSION_UNCOMPRESSED,
                           result.data(), result.size(), impl_->ctx.get());
    }
    return result;
}

Point Point::operator+(const Point& other) const {
    Point result;
    if (EC_POINT_add(impl_->group.get(), result.impl_->point.get(),
                     impl_->point.get(), other.impl_->point.get(),
                     impl_->ctx.get()) != 1) {
        throw std::runtime_error("EC_POINT_add failed");
    }
    return result;
}

bool Point::operator==(const Point& other) const {
    return EC_POINT_cmp(impl_->group.get(), impl_->point.get(),
                        other.impl_->point.get(), impl_->ctx.get()) == 0;
}

Point Point::Generator() {
    Point result;
    const EC_POINT* gen = EC_GROUP_get0_generator(result.impl_->group.get());
    if (!gen || EC_POINT_copy(result.impl_->point.get(), gen) != 1) {
        throw std::runtime_error("secp256k1 generator unavailable");
    }
    return result;
}

// ============================================================================
// Key Operations
// ============================================================================

std::optional<Point> ScalarBaseMultiply(const uint8_t* scalar) {
    if (!IsValidPrivateKey(scalar)) return std::nullopt;
    Point result;
    BNPtr k = ToBN(scalar, 32);
    if (EC_POINT_mul(result.impl_->group.get(), result.impl_->point.get(),
                     k.get(), nullptr, nullptr, result.impl_->ctx.get()) != 1) {
        return std::nullopt;
    }
    return result;
}

bool IsValidPrivateKey(const uint8_t* key) {
    if (!key || IsZero32(key)) return false;
    return Compare32(key, CURVE_ORDER.data()) < 0;
}

bool IsValidPublicKey(const uint8_t* point, size_t len) {
    auto p = Point::FromBytes(point, len);
    return p && !p->IsInfinity();
}

bool IsValidPublicKey(const std::vector<uint8_t>& point) {
    return IsValidPublicKey(point.data(), point.size());
}

std::optional<CompressedPubKey> PublicKeyFromPrivate(const uint8_t* privateKey) {
    auto P = ScalarBaseMultiply(privateKey);
    if (!P) return std::nullopt;
    return P->ToCompressed();
}

std::optional<UncompressedPubKey> DecompressPublicKey(const uint8_t* pubkey, size_t len) {
    auto P = Point::FromBytes(pubkey, len);
    if (!P || P->IsInfinity()) return std::nullopt;
    return P->ToUncompressed();
}

bool PrivateKeyTweakAdd(const uint8_t* key, const uint8_t* tweak, uint8_t* result) {
    if (Compare32(tweak, CURVE_ORDER.data()) >= 0) return false;

    BNCtxPtr ctx(BN_CTX_new());
    BNPtr k = ToBN(key, 32);
    BNPtr t = ToBN(tweak, 32);
    BNPtr n = ToBN(CURVE_ORDER.data(), 32);
    BNPtr sum(BN_new());
    if (!ctx || !sum) return false;

    if (BN_mod_add(sum.get(), k.get(), t.get(), n.get(), ctx.get()) != 1) return false;
    if (BN_is_zero(sum.get())) return false;
    return FromBN(sum.get(), result);
}

bool PublicKeyTweakAdd(const uint8_t* pubkey, size_t pubkeyLen,
                       const uint8_t* tweak, uint8_t* result) {
    if (Compare32(tweak, CURVE_ORDER.data()) >= 0) return false;

    auto P = Point::FromBytes(pubkey, pubkeyLen);
    if (!P) return false;

    // A zero tweak leaves P unchanged
    Point R = *P;
    if (!IsZero32(tweak)) {
        auto tG = ScalarBaseMultiply(tweak);
        if (!tG) return false;
        R = *P + *tG;
    }
    if (R.IsInfinity()) return false;

    if (pubkeyLen == COMPRESSED_PUBKEY_SIZE) {
        auto compressed = R.ToCompressed();
        std::memcpy(result, compressed.data(), compressed.size());
    } else {
        auto uncompressed = R.ToUncompressed();
        std::memcpy(result, uncompressed.data(), uncompressed.size());
    }
    return true;
}

// ============================================================================
// ECDSA Operations
// ============================================================================

bool IsValidSignatureScalar(const uint8_t* value) {
    return IsValidPrivateKey(value);
}

bool IsLowS(const uint8_t* s) {
    return Compare32(s, HALF_CURVE_ORDER.data()) <= 0;
}

bool ECDSASignRecoverable(const uint8_t* hash, const uint8_t* privateKey,
                          RecoverableSignature& out) {
    auto P = ScalarBaseMultiply(privateKey);
    if (!P) return false;
    const UncompressedPubKey expected = P->ToUncompressed();

    KeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key) return false;

    BNPtr priv = ToBN(privateKey, 32);
    if (EC_KEY_set_private_key(key.get(), priv.get()) != 1) return false;

    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    ECPointPtr pub(EC_POINT_new(group));
    if (!pub ||
        EC_POINT_oct2point(group, pub.get(), expected.data(), expected.size(), nullptr) != 1 ||
        EC_KEY_set_public_key(key.get(), pub.get()) != 1) {
        return false;
    }

    SigPtr sig(ECDSA_do_sign(hash, 32, key.get()));
    if (!sig) return false;

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    if (!FromBN(r, out.r.data()) || !FromBN(s, out.s.data())) return false;

    // Normalize to low-s: s' = n - s
    if (!IsLowS(out.s.data())) {
        BNPtr n = ToBN(CURVE_ORDER.data(), 32);
        BNPtr lowS(BN_new());
        if (!lowS || BN_sub(lowS.get(), n.get(), s) != 1) return false;
        if (!FromBN(lowS.get(), out.s.data())) return false;
    }

    // Find the recovery id that yields our own public key
    for (int recid = 0; recid < 4; ++recid) {
        auto recovered = ECDSARecover(hash, out.r.data(), out.s.data(), recid);
        if (recovered && *recovered == expected) {
            out.recid = recid;
            return true;
        }
    }
    return false;
}

std::optional<UncompressedPubKey> ECDSARecover(const uint8_t* hash,
                                               const uint8_t* r,
                                               const uint8_t* s,
                                               int recid) {
    if (recid < 0 || recid > 3) return std::nullopt;
    if (!IsValidSignatureScalar(r) || !IsValidSignatureScalar(s)) return std::nullopt;

    GroupPtr group = NewGroup();
    BNCtxPtr ctx(BN_CTX_new());
    if (!ctx) return std::nullopt;

    BNPtr bnR = ToBN(r, 32);
    BNPtr bnS = ToBN(s, 32);
    BNPtr n = ToBN(CURVE_ORDER.data(), 32);
    BNPtr e = ToBN(hash, 32);

    // x = r + (recid / 2) * n
    BNPtr x(BN_dup(bnR.get()));
    if (!x) return std::nullopt;
    if (recid >= 2 && BN_add(x.get(), x.get(), n.get()) != 1) return std::nullopt;

    ECPointPtr R(EC_POINT_new(group.get()));
    ECPointPtr Q(EC_POINT_new(group.get()));
    if (!R || !Q) return std::nullopt;

    // Fails when x is not a valid field element or has no curve point
    if (EC_POINT_set_compressed_coordinates(group.get(), R.get(), x.get(),
                                            recid & 1, ctx.get()) != 1) {
        return std::nullopt;
    }

    // Q = r^-1 * (s*R - e*G)
    BNPtr rInv(BN_mod_inverse(nullptr, bnR.get(), n.get(), ctx.get()));
    BNPtr u1(BN_new());
    BNPtr u2(BN_new());
    if (!rInv || !u1 || !u2) return std::nullopt;

    if (BN_mod_mul(u2.get(), bnS.get(), rInv.get(), n.get(), ctx.get()) != 1 ||
        BN_mod_mul(u1.get(), e.get(), rInv.get(), n.get(), ctx.get()) != 1 ||
        BN_mod_sub(u1.get(), n.get(), u1.get(), n.get(), ctx.get()) != 1) {
        return std::nullopt;
    }

    if (EC_POINT_mul(group.get(), Q.get(), u1.get(), R.get(), u2.get(), ctx.get()) != 1) {
        return std::nullopt;
    }
    if (EC_POINT_is_at_infinity(group.get(), Q.get())) return std::nullopt;

    UncompressedPubKey publicKey{};
    if (EC_POINT_point2oct(group.get(), Q.get(), POINT_CONVERSION_UNCOMPRESSED,
                           publicKey.data(), publicKey.size(), ctx.get()) != publicKey.size()) {
        return std::nullopt;
    }
    return publicKey;
}

} // namespace secp256k1
} // namespace ethledger
