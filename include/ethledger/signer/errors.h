// ETHLEDGER - Signer Errors
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#ifndef ETHLEDGER_SIGNER_ERRORS_H
#define ETHLEDGER_SIGNER_ERRORS_H

#include <optional>
#include <string>
#include <utility>

namespace ethledger {
namespace signer {

/// Every reason a signer operation can fail
enum class SignerError {
    None,
    InvalidTransactionParams,
    FromAddressMissingOrInvalid,
    DataMissingForSignPersonalMessage,
    InvalidKeyMaterial,
    InvalidDerivationPath,
    InvalidConfiguration,
    MultipleOpenConnectionsDisallowed,
    AddressNotFound,
    WrongSigner,
    WrongSignature,
    DeviceCommunicationError,
    MethodNotSupported
};

/// Broad classes of SignerError
enum class ErrorKind {
    None,
    Configuration,
    ProtocolViolation,
    Lookup,
    Validation,
    DeviceCommunication,
    Unsupported
};

/// Stable name, e.g. "AddressNotFound"
const char* SignerErrorToString(SignerError error);

const char* ErrorKindToString(ErrorKind kind);

ErrorKind GetErrorKind(SignerError error);

/**
 * Value or named failure.
 */
template<typename T>
struct SignerResult {
    bool success{false};
    SignerError error{SignerError::None};
    std::string message;
    std::optional<T> value;

    static SignerResult Ok(T v) {
        SignerResult r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }

    static SignerResult Fail(SignerError e, const std::string& msg) {
        SignerResult r;
        r.error = e;
        r.message = msg;
        return r;
    }

    /// Carry another result's failure over
    template<typename U>
    static SignerResult FailFrom(const SignerResult<U>& other) {
        return Fail(other.error, other.message);
    }

    explicit operator bool() const { return success; }
    ErrorKind Kind() const { return GetErrorKind(error); }
};

/// Result without a value
struct SignerStatus {
    bool success{false};
    SignerError error{SignerError::None};
    std::string message;

    static SignerStatus Ok() { return {true, SignerError::None, ""}; }
    static SignerStatus Fail(SignerError e, const std::string& msg) { return {false, e, msg}; }

    explicit operator bool() const { return success; }
};

} // namespace signer
} // namespace ethledger

#endif // ETHLEDGER_SIGNER_ERRORS_H
