// ETHLEDGER - Transaction Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/eth/transaction.h>
#include <ethledger/eth/quantity.h>
#include <ethledger/core/hex.h>
#include <ethledger/crypto/keccak.h>
#include <ethledger/crypto/secp256k1.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace ethledger {
namespace eth {

namespace {

constexpr uint64_t LEGACY_V_BASE = 27;
constexpr uint64_t EIP155_V_BASE = 35;

Bytes ParseField(const std::optional<std::string>& field, const char* name) {
    try {
        return ParseQuantity(*field);
    } catch (const std::invalid_argument& e) {
        throw TransactionError(std::string("Invalid ") + name + ": " + e.what());
    }
}

bool IsBlank(const std::optional<std::string>& field) {
    return !field || field->empty() || *field == "0x" || *field == "0X";
}

/// a < b for minimal big-endian quantities
bool QuantityLess(const Bytes& a, const Bytes& b) {
    Bytes ta = TrimQuantity(a);
    Bytes tb = TrimQuantity(b);
    if (ta.size() != tb.size()) return ta.size() < tb.size();
    return std::lexicographical_compare(ta.begin(), ta.end(), tb.begin(), tb.end());
}

/// Canonical quantity from a decoded RLP field
Bytes ReadQuantity(const RLPItem& item, const char* name) {
    const Bytes& bytes = item.GetBytes();
    if (bytes.size() > MAX_QUANTITY_BYTES) {
        throw TransactionError(std::string(name) + " exceeds 256 bits");
    }
    if (!bytes.empty() && bytes[0] == 0) {
        throw TransactionError(std::string(name) + " has leading zero");
    }
    return bytes;
}

std::optional<Address> ReadTo(const RLPItem& item) {
    const Bytes& bytes = item.GetBytes();
    if (bytes.empty()) {
        return std::nullopt;
    }
    if (bytes.size() != Address::SIZE) {
        throw TransactionError("Recipient must be 20 bytes");
    }
    return Address(bytes.data(), bytes.size());
}

Bytes EncodeTo(const std::optional<Address>& to) {
    return rlp::EncodeBytes(to ? to->ToBytes() : Bytes());
}

/// Left-pad r or s to 32 bytes; nullopt if wider
std::optional<std::array<Byte, 32>> ToScalar(const Bytes& value) {
    if (value.size() > 32) {
        return std::nullopt;
    }
    std::array<Byte, 32> out{};
    std::memcpy(out.data() + (32 - value.size()), value.data(), value.size());
    return out;
}

} // anonymous namespace

// ============================================================================
// Hardfork
// ============================================================================

const char* HardforkToString(Hardfork fork) {
    switch (fork) {
        case Hardfork::SpuriousDragon: return "spuriousDragon";
        case Hardfork::Berlin:         return "berlin";
        case Hardfork::London:         return "london";
    }
    return "unknown";
}

std::optional<Hardfork> HardforkFromString(const std::string& str) {
    std::string lower = ToLowerHex(str);
    if (lower == "spuriousdragon") return Hardfork::SpuriousDragon;
    if (lower == "berlin") return Hardfork::Berlin;
    if (lower == "london") return Hardfork::London;
    return std::nullopt;
}

// ============================================================================
// Construction
// ============================================================================

Transaction Transaction::FromParams(const TxParams& params, const ChainRules& rules) {
    Transaction tx;
    tx.chainId_ = rules.chainId;
    tx.replayProtected_ = true;

    if (IsBlank(params.nonce)) {
        throw TransactionError("Missing nonce");
    }
    tx.nonce_ = ParseField(params.nonce, "nonce");

    const auto& gas = !IsBlank(params.gasLimit) ? params.gasLimit : params.gas;
    if (IsBlank(gas)) {
        throw TransactionError("Missing gas limit");
    }
    tx.gasLimit_ = ParseField(gas, "gas limit");

    if (params.chainId) {
        Bytes chainId = ParseField(params.chainId, "chainId");
        if (TrimQuantity(chainId).size() > 8 || QuantityToUint64(chainId) != rules.chainId) {
            throw TransactionError("chainId " + *params.chainId +
                                   " does not match network " + std::to_string(rules.chainId));
        }
    }

    const bool hasFeeMarket = !IsBlank(params.maxFeePerGas) ||
                              !IsBlank(params.maxPriorityFeePerGas);
    const bool hasGasPrice = !IsBlank(params.gasPrice);

    if (hasFeeMarket && hasGasPrice) {
        throw TransactionError("gasPrice cannot be combined with EIP-1559 fee fields");
    }

    if (hasFeeMarket) {
        if (!rules.SupportsFeeMarket()) {
            throw TransactionError(std::string("EIP-1559 fee fields require london, network is at ") +
                                   HardforkToString(rules.hardfork));
        }
        if (IsBlank(params.maxFeePerGas) || IsBlank(params.maxPriorityFeePerGas)) {
            throw TransactionError("Both maxFeePerGas and maxPriorityFeePerGas are required");
        }
        tx.type_ = TxType::FeeMarket;
        tx.maxFeePerGas_ = ParseField(params.maxFeePerGas, "maxFeePerGas");
        tx.maxPriorityFeePerGas_ = ParseField(params.maxPriorityFeePerGas, "maxPriorityFeePerGas");
        if (QuantityLess(tx.maxFeePerGas_, tx.maxPriorityFeePerGas_)) {
            throw TransactionError("maxPriorityFeePerGas exceeds maxFeePerGas");
        }
    } else if (hasGasPrice) {
        tx.type_ = TxType::Legacy;
        tx.gasPrice_ = ParseField(params.gasPrice, "gasPrice");
    } else {
        throw TransactionError("Missing fee fields (gasPrice or maxFeePerGas/maxPriorityFeePerGas)");
    }

    if (params.type) {
        Bytes type = ParseField(params.type, "type");
        uint64_t expected = static_cast<uint64_t>(tx.type_);
        if (TrimQuantity(type).size() > 1 || QuantityToUint64(type) != expected) {
            throw TransactionError("type " + *params.type + " does not match the supplied fee fields");
        }
    }

    if (!IsBlank(params.to)) {
        if (!IsValidAddress(*params.to)) {
            throw TransactionError("Invalid recipient address: " + *params.to);
        }
        tx.to_ = Address::FromHex(*params.to);
    }

    if (!IsBlank(params.value)) {
        tx.value_ = ParseField(params.value, "value");
    }

    if (!IsBlank(params.data)) {
        std::string digits = StripHexPrefix(*params.data);
        if (!IsValidHex(digits)) {
            throw TransactionError("data must be an even-length hex string");
        }
        tx.data_ = HexToBytes(digits);
    }

    if (!tx.to_ && tx.data_.empty()) {
        throw TransactionError("Contract creation requires data");
    }

    return tx;
}

// ============================================================================
// Encoding
// ============================================================================

std::vector<Bytes> Transaction::EncodeCommonFields() const {
    std::vector<Bytes> fields;
    if (type_ == TxType::FeeMarket) {
        fields.push_back(rlp::EncodeUint(chainId_));
        fields.push_back(rlp::EncodeBytes(nonce_));
        fields.push_back(rlp::EncodeBytes(maxPriorityFeePerGas_));
        fields.push_back(rlp::EncodeBytes(maxFeePerGas_));
        fields.push_back(rlp::EncodeBytes(gasLimit_));
        fields.push_back(EncodeTo(to_));
        fields.push_back(rlp::EncodeBytes(value_));
        fields.push_back(rlp::EncodeBytes(data_));
        fields.push_back(rlp::Encode(accessList_));
    } else {
        fields.push_back(rlp::EncodeBytes(nonce_));
        fields.push_back(rlp::EncodeBytes(gasPrice_));
        fields.push_back(rlp::EncodeBytes(gasLimit_));
        fields.push_back(EncodeTo(to_));
        fields.push_back(rlp::EncodeBytes(value_));
        fields.push_back(rlp::EncodeBytes(data_));
    }
    return fields;
}

Bytes Transaction::EncodeEnvelope(const std::vector<Bytes>& fields) const {
    Bytes list = rlp::EncodeList(fields);
    if (type_ == TxType::Legacy) {
        return list;
    }
    Bytes out{static_cast<Byte>(type_)};
    out.insert(out.end(), list.begin(), list.end());
    return out;
}

Bytes Transaction::GetMessageToSign() const {
    std::vector<Bytes> fields = EncodeCommonFields();
    if (type_ == TxType::Legacy && replayProtected_) {
        // EIP-155: (chainId, 0, 0) appended to the six legacy fields
        fields.push_back(rlp::EncodeUint(chainId_));
        fields.push_back(rlp::EncodeUint(0));
        fields.push_back(rlp::EncodeUint(0));
    }
    return EncodeEnvelope(fields);
}

Hash256 Transaction::GetSigningHash() const {
    return Keccak256Hash(GetMessageToSign());
}

Bytes Transaction::Serialize() const {
    std::vector<Bytes> fields = EncodeCommonFields();
    if (signed_) {
        fields.push_back(rlp::EncodeUint(v_));
        fields.push_back(rlp::EncodeBytes(r_));
        fields.push_back(rlp::EncodeBytes(s_));
    } else if (type_ == TxType::Legacy) {
        fields.push_back(rlp::EncodeUint(0));
        fields.push_back(rlp::EncodeUint(0));
        fields.push_back(rlp::EncodeUint(0));
    }
    return EncodeEnvelope(fields);
}

// ============================================================================
// Signatures
// ============================================================================

Transaction Transaction::WithSignature(int recid,
                                       const std::array<Byte, 32>& r,
                                       const std::array<Byte, 32>& s) const {
    if (recid != 0 && recid != 1) {
        throw TransactionError("Recovery id must be 0 or 1");
    }

    Transaction signedTx = *this;
    signedTx.signed_ = true;
    signedTx.r_ = TrimQuantity(Bytes(r.begin(), r.end()));
    signedTx.s_ = TrimQuantity(Bytes(s.begin(), s.end()));

    if (type_ == TxType::FeeMarket) {
        signedTx.v_ = static_cast<uint64_t>(recid);
    } else if (replayProtected_) {
        signedTx.v_ = static_cast<uint64_t>(recid) + EIP155_V_BASE + 2 * chainId_;
    } else {
        signedTx.v_ = static_cast<uint64_t>(recid) + LEGACY_V_BASE;
    }
    return signedTx;
}

std::optional<int> Transaction::GetRecoveryId() const {
    if (!signed_) {
        return std::nullopt;
    }
    if (type_ == TxType::FeeMarket) {
        if (v_ > 1) return std::nullopt;
        return static_cast<int>(v_);
    }
    if (!replayProtected_) {
        if (v_ != LEGACY_V_BASE && v_ != LEGACY_V_BASE + 1) return std::nullopt;
        return static_cast<int>(v_ - LEGACY_V_BASE);
    }
    uint64_t base = EIP155_V_BASE + 2 * chainId_;
    if (v_ != base && v_ != base + 1) return std::nullopt;
    return static_cast<int>(v_ - base);
}

bool Transaction::ValidateSignature(std::string* reason) const {
    auto fail = [reason](const char* msg) {
        if (reason) *reason = msg;
        return false;
    };

    if (!signed_) {
        return fail("transaction is not signed");
    }
    auto r = ToScalar(r_);
    auto s = ToScalar(s_);
    if (!r || !secp256k1::IsValidSignatureScalar(r->data())) {
        return fail("r is zero or not below the curve order");
    }
    if (!s || !secp256k1::IsValidSignatureScalar(s->data())) {
        return fail("s is zero or not below the curve order");
    }
    if (!secp256k1::IsLowS(s->data())) {
        return fail("s is in the upper half of the curve order");
    }
    if (!GetRecoveryId()) {
        return fail("v is out of range for this transaction");
    }
    return true;
}

std::optional<Address> Transaction::GetSenderAddress() const {
    auto recid = GetRecoveryId();
    auto r = ToScalar(r_);
    auto s = ToScalar(s_);
    if (!recid || !r || !s) {
        return std::nullopt;
    }

    Hash256 hash = GetSigningHash();
    auto pubkey = secp256k1::ECDSARecover(hash.data(), r->data(), s->data(), *recid);
    if (!pubkey) {
        return std::nullopt;
    }
    return Address::FromPublicKey(*pubkey);
}

// ============================================================================
// Decoding
// ============================================================================

Transaction Transaction::Deserialize(const Bytes& data) {
    if (data.empty()) {
        throw TransactionError("Empty transaction");
    }

    Transaction tx;

    if (data[0] >= 0xc0) {
        const RLPItem decoded = rlp::Decode(data);
        const auto& fields = decoded.GetList();
        if (fields.size() != 9) {
            throw TransactionError("Legacy transaction must have 9 fields");
        }
        tx.type_ = TxType::Legacy;
        tx.nonce_ = ReadQuantity(fields[0], "nonce");
        tx.gasPrice_ = ReadQuantity(fields[1], "gasPrice");
        tx.gasLimit_ = ReadQuantity(fields[2], "gas limit");
        tx.to_ = ReadTo(fields[3]);
        tx.value_ = ReadQuantity(fields[4], "value");
        tx.data_ = fields[5].GetBytes();

        uint64_t v = rlp::DecodeUint(fields[6].GetBytes());
        tx.r_ = ReadQuantity(fields[7], "r");
        tx.s_ = ReadQuantity(fields[8], "s");

        if (v == 0 && tx.r_.empty() && tx.s_.empty()) {
            tx.signed_ = false;
            tx.replayProtected_ = false;
            return tx;
        }

        tx.signed_ = true;
        tx.v_ = v;
        if (v == LEGACY_V_BASE || v == LEGACY_V_BASE + 1) {
            tx.replayProtected_ = false;
            tx.chainId_ = 0;
        } else if (v >= EIP155_V_BASE) {
            tx.replayProtected_ = true;
            tx.chainId_ = (v - EIP155_V_BASE) / 2;
        } else {
            throw TransactionError("Invalid legacy v value " + std::to_string(v));
        }
        return tx;
    }

    if (data[0] != static_cast<Byte>(TxType::FeeMarket)) {
        throw TransactionError("Unsupported transaction type 0x" + BytesToHex(data.data(), 1));
    }

    const RLPItem decoded = rlp::Decode(Bytes(data.begin() + 1, data.end()));
    const auto& fields = decoded.GetList();
    if (fields.size() != 9 && fields.size() != 12) {
        throw TransactionError("EIP-1559 transaction must have 9 or 12 fields");
    }

    tx.type_ = TxType::FeeMarket;
    tx.chainId_ = rlp::DecodeUint(fields[0].GetBytes());
    tx.nonce_ = ReadQuantity(fields[1], "nonce");
    tx.maxPriorityFeePerGas_ = ReadQuantity(fields[2], "maxPriorityFeePerGas");
    tx.maxFeePerGas_ = ReadQuantity(fields[3], "maxFeePerGas");
    tx.gasLimit_ = ReadQuantity(fields[4], "gas limit");
    tx.to_ = ReadTo(fields[5]);
    tx.value_ = ReadQuantity(fields[6], "value");
    tx.data_ = fields[7].GetBytes();
    if (!fields[8].IsList()) {
        throw TransactionError("Access list must be a list");
    }
    tx.accessList_ = fields[8];

    if (fields.size() == 12) {
        tx.signed_ = true;
        tx.v_ = rlp::DecodeUint(fields[9].GetBytes());
        tx.r_ = ReadQuantity(fields[10], "r");
        tx.s_ = ReadQuantity(fields[11], "s");
    }
    return tx;
}

} // namespace eth
} // namespace ethledger
