#include "biteledger/errors.hpp"

namespace biteledger {

const char* kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::AlreadyInitialized: return "AlreadyInitialized";
        case ErrorKind::NotInitialized: return "NotInitialized";
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InvalidAmount: return "InvalidAmount";
        case ErrorKind::InvalidFee: return "InvalidFee";
        case ErrorKind::DuplicateOrder: return "DuplicateOrder";
        case ErrorKind::InvalidState: return "InvalidState";
        case ErrorKind::InvalidTransition: return "InvalidTransition";
        case ErrorKind::OrderClosed: return "OrderClosed";
        case ErrorKind::InsufficientBalance: return "InsufficientBalance";
        case ErrorKind::TransferFailed: return "TransferFailed";
        case ErrorKind::Overflow: return "Overflow";
        case ErrorKind::UnknownEntryPoint: return "UnknownEntryPoint";
        case ErrorKind::InvalidAddress: return "InvalidAddress";
    }
    return "Unknown";
}

grpc::StatusCode status_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
            return grpc::StatusCode::NOT_FOUND;
        case ErrorKind::Unauthorized:
            return grpc::StatusCode::PERMISSION_DENIED;
        case ErrorKind::InvalidAmount:
        case ErrorKind::InvalidFee:
        case ErrorKind::UnknownEntryPoint:
        case ErrorKind::InvalidAddress:
            return grpc::StatusCode::INVALID_ARGUMENT;
        case ErrorKind::Overflow:
            return grpc::StatusCode::OUT_OF_RANGE;
        case ErrorKind::DuplicateOrder:
        case ErrorKind::AlreadyInitialized:
            return grpc::StatusCode::ALREADY_EXISTS;
        default:
            return grpc::StatusCode::FAILED_PRECONDITION;
    }
}

grpc::Status ContractError::to_grpc_status() const {
    return grpc::Status(status_code_for(kind_), std::string(kind_name(kind_)) + ": " + what());
}

} // namespace biteledger
