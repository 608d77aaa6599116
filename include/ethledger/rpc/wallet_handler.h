// ETHLEDGER - JSON-RPC Wallet Handler
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License
//
// Answers the account and signing methods of the Ethereum JSON-RPC API
// from a SigningSubprovider. Every other method is left to the caller
// to forward to a node.

#ifndef ETHLEDGER_RPC_WALLET_HANDLER_H
#define ETHLEDGER_RPC_WALLET_HANDLER_H

#include <ethledger/rpc/json.h>
#include <ethledger/signer/subprovider.h>

#include <memory>
#include <optional>
#include <string>

namespace ethledger {
namespace rpc {

// ============================================================================
// RPC Error Codes (JSON-RPC 2.0 standard + custom)
// ============================================================================

namespace ErrorCode {
    // Standard JSON-RPC 2.0 errors
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;

    // EIP-1193 provider errors
    constexpr int UNSUPPORTED_METHOD = 4200;

    // Signer errors (-1 to -99)
    constexpr int SIGNER_ERROR = -1;
    constexpr int ADDRESS_NOT_FOUND = -5;
    constexpr int SIGNATURE_REJECTED = -6;
    constexpr int DEVICE_ERROR = -10;
    constexpr int DEVICE_BUSY = -11;
}

// ============================================================================
// RPC Request
// ============================================================================

/**
 * A JSON-RPC 2.0 request.
 */
class RPCRequest {
public:
    RPCRequest() = default;
    RPCRequest(const std::string& method, const JSONValue& params = JSONValue(),
               const JSONValue& id = JSONValue());

    const std::string& GetMethod() const { return method_; }
    const JSONValue& GetParams() const { return params_; }
    const JSONValue& GetId() const { return id_; }

    /// Positional parameter, Null() if absent
    const JSONValue& GetParam(size_t index) const;
    bool HasParam(size_t index) const;

    std::string ToJSON() const;

    /// nullopt unless a JSON object with "jsonrpc":"2.0" and a string method
    static std::optional<RPCRequest> Parse(const std::string& json);
    static std::optional<RPCRequest> FromJSON(const JSONValue& value);

private:
    std::string method_;
    JSONValue params_;
    JSONValue id_;
};

// ============================================================================
// RPC Response
// ============================================================================

class RPCResponse {
public:
    static RPCResponse Success(const JSONValue& result, const JSONValue& id);

    static RPCResponse Error(int code, const std::string& message,
                             const JSONValue& id, const JSONValue& data = JSONValue());

    bool IsError() const { return isError_; }
    const JSONValue& GetResult() const { return result_; }
    int GetErrorCode() const { return errorCode_; }
    const std::string& GetErrorMessage() const { return errorMessage_; }
    const JSONValue& GetErrorData() const { return errorData_; }
    const JSONValue& GetId() const { return id_; }

    JSONValue ToJSONValue() const;
    std::string ToJSON() const { return ToJSONValue().ToJSON(); }

private:
    bool isError_{false};
    JSONValue result_;
    int errorCode_{0};
    std::string errorMessage_;
    JSONValue errorData_;
    JSONValue id_;
};

// ============================================================================
// Wallet Request Handler
// ============================================================================

/**
 * Routes wallet methods to a SigningSubprovider.
 *
 * Handled: eth_accounts, eth_requestAccounts, eth_coinbase,
 * eth_signTransaction, eth_sign ([address, data]), personal_sign
 * ([data, address]) and eth_signTypedData{,_v3,_v4}.
 */
class WalletRequestHandler {
public:
    explicit WalletRequestHandler(std::shared_ptr<signer::SigningSubprovider> subprovider);

    static bool IsWalletMethod(const std::string& method);

    /// Response for a wallet method, nullopt for any other method
    std::optional<RPCResponse> Handle(const RPCRequest& request);

    /**
     * Parse and answer a request or batch. Methods that are not wallet
     * methods get METHOD_NOT_FOUND.
     */
    std::string HandleJSON(const std::string& json);

    /// JSON-RPC error code for a signer failure
    static int ErrorCodeFor(signer::SignerError error);

private:
    RPCResponse HandleOne(const JSONValue& value);

    template<typename T>
    static RPCResponse FromResult(const signer::SignerResult<T>& result, const JSONValue& id);

    std::shared_ptr<signer::SigningSubprovider> subprovider_;
};

/**
 * Convert a JSON transaction object to TxParams. Strings are taken as-is,
 * non-negative integers become decimal strings.
 *
 * @return nullopt if the value is not an object or a field has another type
 */
std::optional<eth::TxParams> TxParamsFromJSON(const JSONValue& value, std::string* error = nullptr);

} // namespace rpc
} // namespace ethledger

#endif // ETHLEDGER_RPC_WALLET_HANDLER_H
