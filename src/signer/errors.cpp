// ETHLEDGER - Signer Errors Implementation
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#include <ethledger/signer/errors.h>

namespace ethledger {
namespace signer {

const char* SignerErrorToString(SignerError error) {
    switch (error) {
        case SignerError::None: return "None";
        case SignerError::InvalidTransactionParams: return "InvalidTransactionParams";
        case SignerError::FromAddressMissingOrInvalid: return "FromAddressMissingOrInvalid";
        case SignerError::DataMissingForSignPersonalMessage: return "DataMissingForSignPersonalMessage";
        case SignerError::InvalidKeyMaterial: return "InvalidKeyMaterial";
        case SignerError::InvalidDerivationPath: return "InvalidDerivationPath";
        case SignerError::InvalidConfiguration: return "InvalidConfiguration";
        case SignerError::MultipleOpenConnectionsDisallowed: return "MultipleOpenConnectionsDisallowed";
        case SignerError::AddressNotFound: return "AddressNotFound";
        case SignerError::WrongSigner: return "WrongSigner";
        case SignerError::WrongSignature: return "WrongSignature";
        case SignerError::DeviceCommunicationError: return "DeviceCommunicationError";
        case SignerError::MethodNotSupported: return "MethodNotSupported";
    }
    return "Unknown";
}

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Configuration: return "Configuration";
        case ErrorKind::ProtocolViolation: return "ProtocolViolation";
        case ErrorKind::Lookup: return "Lookup";
        case ErrorKind::Validation: return "Validation";
        case ErrorKind::DeviceCommunication: return "DeviceCommunication";
        case ErrorKind::Unsupported: return "Unsupported";
    }
    return "Unknown";
}

ErrorKind GetErrorKind(SignerError error) {
    switch (error) {
        case SignerError::None:
            return ErrorKind::None;
        case SignerError::InvalidTransactionParams:
        case SignerError::FromAddressMissingOrInvalid:
        case SignerError::DataMissingForSignPersonalMessage:
        case SignerError::InvalidKeyMaterial:
        case SignerError::InvalidDerivationPath:
        case SignerError::InvalidConfiguration:
            return ErrorKind::Configuration;
        case SignerError::MultipleOpenConnectionsDisallowed:
            return ErrorKind::ProtocolViolation;
        case SignerError::AddressNotFound:
            return ErrorKind::Lookup;
        case SignerError::WrongSigner:
        case SignerError::WrongSignature:
            return ErrorKind::Validation;
        case SignerError::DeviceCommunicationError:
            return ErrorKind::DeviceCommunication;
        case SignerError::MethodNotSupported:
            return ErrorKind::Unsupported;
    }
    return ErrorKind::None;
}

} // namespace signer
} // namespace ethledger
