// ETHLEDGER - JSON-RPC Wallet Handler Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/rpc/wallet_handler.h>
#include <ethledger/util/logging.h>

#include <set>

namespace ethledger {
namespace rpc {

namespace {

JSONValue ToJSONResult(const std::string& value) {
    return JSONValue(value);
}

JSONValue ToJSONResult(const std::vector<std::string>& values) {
    JSONValue::Array arr;
    arr.reserve(values.size());
    for (const auto& v : values) {
        arr.emplace_back(v);
    }
    return JSONValue(std::move(arr));
}

const std::set<std::string>& WalletMethods() {
    static const std::set<std::string> methods = {
        "eth_accounts",
        "eth_requestAccounts",
        "eth_coinbase",
        "eth_signTransaction",
        "eth_sign",
        "personal_sign",
        "eth_signTypedData",
        "eth_signTypedData_v3",
        "eth_signTypedData_v4",
    };
    return methods;
}

bool ReadField(const JSONValue& obj, const char* name,
               std::optional<std::string>& out, std::string* error) {
    const JSONValue& field = obj[name];
    if (field.IsNull()) {
        return true;
    }
    if (field.IsString()) {
        out = field.GetString();
        return true;
    }
    if (field.IsInt() && field.GetInt() >= 0) {
        out = std::to_string(field.GetInt());
        return true;
    }
    if (error) {
        *error = std::string("Field '") + name + "' must be a string or non-negative integer";
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// RPCRequest
// ============================================================================

RPCRequest::RPCRequest(const std::string& method, const JSONValue& params,
                       const JSONValue& id)
    : method_(method), params_(params), id_(id) {}

const JSONValue& RPCRequest::GetParam(size_t index) const {
    if (params_.IsArray()) {
        return params_[index];
    }
    return JSONValue::Null();
}

bool RPCRequest::HasParam(size_t index) const {
    return params_.IsArray() && index < params_.Size();
}

std::string RPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = "2.0";
    obj["method"] = method_;
    if (!params_.IsNull()) {
        obj["params"] = params_;
    }
    if (!id_.IsNull()) {
        obj["id"] = id_;
    }
    return JSONValue(obj).ToJSON();
}

std::optional<RPCRequest> RPCRequest::FromJSON(const JSONValue& obj) {
    if (!obj.IsObject()) return std::nullopt;
    if (!obj["jsonrpc"].IsString() || obj["jsonrpc"].GetString() != "2.0") {
        return std::nullopt;
    }
    if (!obj["method"].IsString()) return std::nullopt;

    RPCRequest req;
    req.method_ = obj["method"].GetString();
    req.params_ = obj["params"];
    req.id_ = obj["id"];
    return req;
}

std::optional<RPCRequest> RPCRequest::Parse(const std::string& json) {
    auto parsed = JSONValue::TryParse(json);
    if (!parsed) return std::nullopt;
    return FromJSON(*parsed);
}

// ============================================================================
// RPCResponse
// ============================================================================

RPCResponse RPCResponse::Success(const JSONValue& result, const JSONValue& id) {
    RPCResponse resp;
    resp.isError_ = false;
    resp.result_ = result;
    resp.id_ = id;
    return resp;
}

RPCResponse RPCResponse::Error(int code, const std::string& message,
                               const JSONValue& id, const JSONValue& data) {
    RPCResponse resp;
    resp.isError_ = true;
    resp.errorCode_ = code;
    resp.errorMessage_ = message;
    resp.errorData_ = data;
    resp.id_ = id;
    return resp;
}

JSONValue RPCResponse::ToJSONValue() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = "2.0";

    if (isError_) {
        JSONValue::Object error;
        error["code"] = errorCode_;
        error["message"] = errorMessage_;
        if (!errorData_.IsNull()) {
            error["data"] = errorData_;
        }
        obj["error"] = error;
    } else {
        obj["result"] = result_;
    }

    obj["id"] = id_;
    return JSONValue(std::move(obj));
}

// ============================================================================
// Transaction parameters
// ============================================================================

std::optional<eth::TxParams> TxParamsFromJSON(const JSONValue& value, std::string* error) {
    if (!value.IsObject()) {
        if (error) *error = "Transaction must be an object";
        return std::nullopt;
    }

    eth::TxParams params;
    if (!ReadField(value, "from", params.from, error) ||
        !ReadField(value, "to", params.to, error) ||
        !ReadField(value, "nonce", params.nonce, error) ||
        !ReadField(value, "gas", params.gas, error) ||
        !ReadField(value, "gasLimit", params.gasLimit, error) ||
        !ReadField(value, "gasPrice", params.gasPrice, error) ||
        !ReadField(value, "maxFeePerGas", params.maxFeePerGas, error) ||
        !ReadField(value, "maxPriorityFeePerGas", params.maxPriorityFeePerGas, error) ||
        !ReadField(value, "value", params.value, error) ||
        !ReadField(value, "data", params.data, error) ||
        !ReadField(value, "chainId", params.chainId, error) ||
        !ReadField(value, "type", params.type, error)) {
        return std::nullopt;
    }
    // "input" is the newer name for "data"
    if (!params.data && !ReadField(value, "input", params.data, error)) {
        return std::nullopt;
    }
    return params;
}

// ============================================================================
// WalletRequestHandler
// ============================================================================

WalletRequestHandler::WalletRequestHandler(std::shared_ptr<signer::SigningSubprovider> subprovider)
    : subprovider_(std::move(subprovider)) {
    if (!subprovider_) {
        throw std::invalid_argument("WalletRequestHandler requires a subprovider");
    }
}

bool WalletRequestHandler::IsWalletMethod(const std::string& method) {
    return WalletMethods().count(method) > 0;
}

int WalletRequestHandler::ErrorCodeFor(signer::SignerError error) {
    using signer::SignerError;
    switch (error) {
        case SignerError::InvalidTransactionParams:
        case SignerError::FromAddressMissingOrInvalid:
        case SignerError::DataMissingForSignPersonalMessage:
        case SignerError::InvalidDerivationPath:
            return ErrorCode::INVALID_PARAMS;
        case SignerError::AddressNotFound:
            return ErrorCode::ADDRESS_NOT_FOUND;
        case SignerError::WrongSigner:
        case SignerError::WrongSignature:
            return ErrorCode::SIGNATURE_REJECTED;
        case SignerError::DeviceCommunicationError:
            return ErrorCode::DEVICE_ERROR;
        case SignerError::MultipleOpenConnectionsDisallowed:
            return ErrorCode::DEVICE_BUSY;
        case SignerError::MethodNotSupported:
            return ErrorCode::UNSUPPORTED_METHOD;
        case SignerError::InvalidKeyMaterial:
        case SignerError::InvalidConfiguration:
        case SignerError::None:
            return ErrorCode::SIGNER_ERROR;
    }
    return ErrorCode::SIGNER_ERROR;
}

template<typename T>
RPCResponse WalletRequestHandler::FromResult(const signer::SignerResult<T>& result,
                                             const JSONValue& id) {
    if (result.success) {
        return RPCResponse::Success(ToJSONResult(*result.value), id);
    }
    JSONValue data = result.message.empty() ? JSONValue() : JSONValue(result.message);
    return RPCResponse::Error(ErrorCodeFor(result.error),
                              signer::SignerErrorToString(result.error), id, data);
}

std::optional<RPCResponse> WalletRequestHandler::Handle(const RPCRequest& request) {
    const std::string& method = request.GetMethod();
    const JSONValue& id = request.GetId();

    if (!IsWalletMethod(method)) {
        return std::nullopt;
    }
    LOG_DEBUG(util::LogCategory::RPC) << "Handling " << method;

    if (method == "eth_accounts" || method == "eth_requestAccounts") {
        return FromResult(subprovider_->GetAccounts(), id);
    }

    if (method == "eth_coinbase") {
        auto accounts = subprovider_->GetAccounts(1u);
        if (!accounts) {
            return FromResult(accounts, id);
        }
        if (accounts.value->empty()) {
            return RPCResponse::Success(JSONValue(), id);
        }
        return RPCResponse::Success(JSONValue(accounts.value->front()), id);
    }

    if (method == "eth_signTransaction") {
        std::string error;
        auto params = TxParamsFromJSON(request.GetParam(0), &error);
        if (!params) {
            return RPCResponse::Error(ErrorCode::INVALID_PARAMS, "InvalidTransactionParams",
                                      id, JSONValue(error));
        }
        return FromResult(subprovider_->SignTransaction(*params), id);
    }

    if (method == "eth_sign" || method == "personal_sign") {
        const bool addressFirst = method == "eth_sign";
        const JSONValue& address = request.GetParam(addressFirst ? 0 : 1);
        const JSONValue& data = request.GetParam(addressFirst ? 1 : 0);
        if (!address.IsString()) {
            return RPCResponse::Error(ErrorCode::INVALID_PARAMS, "FromAddressMissingOrInvalid", id);
        }
        if (!data.IsNull() && !data.IsString()) {
            return RPCResponse::Error(ErrorCode::INVALID_PARAMS, "DataMissingForSignPersonalMessage", id);
        }
        std::optional<std::string> message;
        if (data.IsString()) {
            message = data.GetString();
        }
        return FromResult(subprovider_->SignPersonalMessage(message, address.GetString()), id);
    }

    // eth_signTypedData family
    const JSONValue& address = request.GetParam(0);
    const JSONValue& typedData = request.GetParam(1);
    return FromResult(subprovider_->SignTypedData(address.GetString(),
                                                  typedData.IsString() ? typedData.GetString()
                                                                       : typedData.ToJSON()),
                      id);
}

RPCResponse WalletRequestHandler::HandleOne(const JSONValue& value) {
    auto request = RPCRequest::FromJSON(value);
    if (!request) {
        return RPCResponse::Error(ErrorCode::INVALID_REQUEST, "Invalid Request",
                                  value.IsObject() ? value["id"] : JSONValue());
    }
    auto response = Handle(*request);
    if (!response) {
        return RPCResponse::Error(ErrorCode::METHOD_NOT_FOUND,
                                  "Method not found: " + request->GetMethod(),
                                  request->GetId());
    }
    return *response;
}

std::string WalletRequestHandler::HandleJSON(const std::string& json) {
    auto parsed = JSONValue::TryParse(json);
    if (!parsed) {
        return RPCResponse::Error(ErrorCode::PARSE_ERROR, "Parse error", JSONValue()).ToJSON();
    }

    if (!parsed->IsArray()) {
        return HandleOne(*parsed).ToJSON();
    }
    if (parsed->Size() == 0) {
        return RPCResponse::Error(ErrorCode::INVALID_REQUEST, "Empty batch", JSONValue()).ToJSON();
    }

    JSONValue::Array responses;
    for (const auto& item : parsed->GetArray()) {
        responses.push_back(HandleOne(item).ToJSONValue());
    }
    return JSONValue(std::move(responses)).ToJSON();
}

} // namespace rpc
} // namespace ethledger
