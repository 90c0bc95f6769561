#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace biteledger {

/**
 * Base exception for all biteledger errors.
 */
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if this is a "not found" error.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if this is a "precondition failed" error.
     */
    virtual bool is_precondition_failed() const { return false; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if the caller lacked the required authorization.
     */
    virtual bool is_permission_denied() const { return false; }

    /**
     * Returns true if this is a connection or transport error.
     */
    virtual bool is_connection_error() const { return false; }
};

/**
 * Failure categories a contract entry point can report.
 */
enum class ErrorKind {
    AlreadyInitialized,
    NotInitialized,
    Unauthorized,
    NotFound,
    InvalidAmount,
    InvalidFee,
    DuplicateOrder,
    InvalidState,
    InvalidTransition,
    OrderClosed,
    InsufficientBalance,
    TransferFailed,
    Overflow,
    UnknownEntryPoint,
    InvalidAddress
};

/// Stable name of an error kind, e.g. "InsufficientBalance".
const char* kind_name(ErrorKind kind);

/// gRPC status code a contract error of this kind is reported with.
grpc::StatusCode status_code_for(ErrorKind kind);

/**
 * Thrown when a contract rejects an invocation.
 *
 * The whole transaction is discarded when this escapes the top-level call.
 */
class ContractError : public ClientError {
public:
    ContractError(ErrorKind kind, const std::string& message)
        : ClientError(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    static ContractError already_initialized(const std::string& message = "contract already initialized") {
        return ContractError(ErrorKind::AlreadyInitialized, message);
    }

    static ContractError not_initialized(const std::string& message = "contract not initialized") {
        return ContractError(ErrorKind::NotInitialized, message);
    }

    static ContractError unauthorized(const std::string& message) {
        return ContractError(ErrorKind::Unauthorized, message);
    }

    static ContractError not_found(const std::string& message) {
        return ContractError(ErrorKind::NotFound, message);
    }

    static ContractError invalid_amount(const std::string& message) {
        return ContractError(ErrorKind::InvalidAmount, message);
    }

    static ContractError invalid_fee(const std::string& message) {
        return ContractError(ErrorKind::InvalidFee, message);
    }

    static ContractError duplicate_order(const std::string& message) {
        return ContractError(ErrorKind::DuplicateOrder, message);
    }

    static ContractError invalid_state(const std::string& message) {
        return ContractError(ErrorKind::InvalidState, message);
    }

    static ContractError invalid_transition(const std::string& message) {
        return ContractError(ErrorKind::InvalidTransition, message);
    }

    static ContractError order_closed(const std::string& message) {
        return ContractError(ErrorKind::OrderClosed, message);
    }

    static ContractError insufficient_balance(const std::string& message) {
        return ContractError(ErrorKind::InsufficientBalance, message);
    }

    static ContractError transfer_failed(const std::string& message) {
        return ContractError(ErrorKind::TransferFailed, message);
    }

    static ContractError overflow(const std::string& message) {
        return ContractError(ErrorKind::Overflow, message);
    }

    static ContractError unknown_entry_point(const std::string& message) {
        return ContractError(ErrorKind::UnknownEntryPoint, message);
    }

    static ContractError invalid_address(const std::string& message) {
        return ContractError(ErrorKind::InvalidAddress, message);
    }

    /**
     * Map to a gRPC status. The message is "<Kind>: <what>".
     */
    grpc::Status to_grpc_status() const;

    bool is_not_found() const override { return kind_ == ErrorKind::NotFound; }

    bool is_precondition_failed() const override {
        return status_code_for(kind_) == grpc::StatusCode::FAILED_PRECONDITION;
    }

    bool is_invalid_argument() const override {
        return status_code_for(kind_) == grpc::StatusCode::INVALID_ARGUMENT;
    }

    bool is_permission_denied() const override { return kind_ == ErrorKind::Unauthorized; }

private:
    ErrorKind kind_;
};

/**
 * Thrown when a gRPC call fails.
 */
class GrpcError : public ClientError {
public:
    GrpcError(const std::string& message, grpc::StatusCode status_code)
        : ClientError(message), status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    bool is_not_found() const override {
        return status_code_ == grpc::StatusCode::NOT_FOUND;
    }

    bool is_precondition_failed() const override {
        return status_code_ == grpc::StatusCode::FAILED_PRECONDITION;
    }

    bool is_invalid_argument() const override {
        return status_code_ == grpc::StatusCode::INVALID_ARGUMENT;
    }

    bool is_permission_denied() const override {
        return status_code_ == grpc::StatusCode::PERMISSION_DENIED;
    }

    bool is_connection_error() const override {
        return status_code_ == grpc::StatusCode::UNAVAILABLE;
    }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when connection to the ledger node fails.
 */
class ConnectionError : public ClientError {
public:
    explicit ConnectionError(const std::string& message)
        : ClientError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Thrown when a request is malformed: unknown contract, unknown kind,
 * missing or undecodable command.
 */
class InvalidArgumentError : public ClientError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : ClientError(message) {}

    bool is_invalid_argument() const override { return true; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
    }
};

/**
 * Thrown when stored bytes cannot be decoded or a snapshot cannot be
 * read or written.
 */
class StorageError : public ClientError {
public:
    explicit StorageError(const std::string& message)
        : ClientError(message) {}
};

} // namespace biteledger
