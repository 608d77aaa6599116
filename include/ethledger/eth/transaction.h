// ETHLEDGER - Ethereum Transactions
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Legacy (EIP-155 replay-protected) and EIP-1559 fee-market transactions:
// construction from caller parameters, signing payloads, signature
// assembly, serialization and sender recovery.

#ifndef ETHLEDGER_ETH_TRANSACTION_H
#define ETHLEDGER_ETH_TRANSACTION_H

#include <ethledger/core/types.h>
#include <ethledger/eth/address.h>
#include <ethledger/eth/rlp.h>

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ethledger {
namespace eth {

// ============================================================================
// Chain Rules
// ============================================================================

/// Protocol upgrades that change transaction envelopes
enum class Hardfork {
    SpuriousDragon,  // EIP-155 replay protection
    Berlin,          // typed envelopes (EIP-2718)
    London           // fee market (EIP-1559)
};

const char* HardforkToString(Hardfork fork);

/// Case-insensitive; nullopt for unknown names
std::optional<Hardfork> HardforkFromString(const std::string& str);

/// Network parameters bound into every signing payload
struct ChainRules {
    uint64_t chainId{1};
    Hardfork hardfork{Hardfork::London};

    bool SupportsFeeMarket() const { return hardfork == Hardfork::London; }
};

// ============================================================================
// Transaction Parameters
// ============================================================================

/**
 * Transaction fields as supplied by a caller (JSON-RPC, CLI), all optional
 * strings. Quantities may be 0x-hex or decimal.
 */
struct TxParams {
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<std::string> nonce;
    std::optional<std::string> gas;
    std::optional<std::string> gasLimit;
    std::optional<std::string> gasPrice;
    std::optional<std::string> maxFeePerGas;
    std::optional<std::string> maxPriorityFeePerGas;
    std::optional<std::string> value;
    std::optional<std::string> data;
    std::optional<std::string> chainId;
    std::optional<std::string> type;
};

/// Thrown when transaction parameters or an encoded transaction are invalid
class TransactionError : public std::invalid_argument {
public:
    explicit TransactionError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

// ============================================================================
// Transaction
// ============================================================================

enum class TxType : uint8_t {
    Legacy = 0x00,
    FeeMarket = 0x02
};

class Transaction {
public:
    /**
     * Build an unsigned transaction.
     *
     * Fee-market fields select the EIP-1559 envelope (London only); a lone
     * gasPrice selects the EIP-155 legacy envelope.
     *
     * @throws TransactionError on missing or malformed fields, or a chainId
     *         that differs from rules.chainId
     */
    static Transaction FromParams(const TxParams& params, const ChainRules& rules);

    /**
     * Decode a serialized transaction (legacy RLP list or 0x02 envelope).
     * @throws TransactionError or RLPError on malformed input
     */
    static Transaction Deserialize(const Bytes& data);

    TxType GetType() const { return type_; }
    uint64_t GetChainId() const { return chainId_; }
    const Bytes& GetNonce() const { return nonce_; }
    const Bytes& GetGasLimit() const { return gasLimit_; }
    const Bytes& GetGasPrice() const { return gasPrice_; }
    const Bytes& GetMaxFeePerGas() const { return maxFeePerGas_; }
    const Bytes& GetMaxPriorityFeePerGas() const { return maxPriorityFeePerGas_; }
    const std::optional<Address>& GetTo() const { return to_; }
    const Bytes& GetValue() const { return value_; }
    const Bytes& GetData() const { return data_; }

    /// Payload the signature commits to
    Bytes GetMessageToSign() const;

    /// Keccak-256 of GetMessageToSign()
    Hash256 GetSigningHash() const;

    /// Copy with the signature attached (recid 0 or 1)
    Transaction WithSignature(int recid,
                              const std::array<Byte, 32>& r,
                              const std::array<Byte, 32>& s) const;

    bool IsSigned() const { return signed_; }

    /// Raw v as it appears on the wire (legacy: 27/28 or 35+; typed: yParity)
    uint64_t GetV() const { return v_; }
    const Bytes& GetR() const { return r_; }
    const Bytes& GetS() const { return s_; }

    /// Recovery id derived from v, if v is well formed for this transaction
    std::optional<int> GetRecoveryId() const;

    /// Wire encoding (signed or unsigned)
    Bytes Serialize() const;

    /// Recover the signer; nullopt if unsigned or recovery fails
    std::optional<Address> GetSenderAddress() const;

    /**
     * Check signature fields: r and s in [1, n-1], s in the lower half
     * of the order, v consistent with the envelope and chain id.
     *
     * @param reason Receives a description of the first failure
     */
    bool ValidateSignature(std::string* reason = nullptr) const;

private:
    TxType type_{TxType::Legacy};
    uint64_t chainId_{0};
    /// Legacy only: chain id included in the signing payload
    bool replayProtected_{true};

    Bytes nonce_;
    Bytes gasPrice_;
    Bytes maxPriorityFeePerGas_;
    Bytes maxFeePerGas_;
    Bytes gasLimit_;
    std::optional<Address> to_;
    Bytes value_;
    Bytes data_;
    RLPItem accessList_{RLPItem::FromList({})};

    bool signed_{false};
    uint64_t v_{0};
    Bytes r_;
    Bytes s_;

    std::vector<Bytes> EncodeCommonFields() const;
    Bytes EncodeEnvelope(const std::vector<Bytes>& fields) const;
};

} // namespace eth
} // namespace ethledger

#endif // ETHLEDGER_ETH_TRANSACTION_H
