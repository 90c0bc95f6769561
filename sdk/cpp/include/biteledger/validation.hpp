#pragma once

#include <optional>
#include <utility>
#include <string>
#include "amount.hpp"
#include "errors.hpp"

namespace biteledger {
namespace validation {

/**
 * Require that initialize has run on this instance.
 */
inline void require_initialized(bool initialized, const std::string& message = "contract not initialized") {
    if (!initialized) {
        throw ContractError::not_initialized(message);
    }
}

/**
 * Require that initialize has not run yet.
 */
inline void require_not_initialized(bool initialized, const std::string& message = "contract already initialized") {
    if (initialized) {
        throw ContractError::already_initialized(message);
    }
}

/**
 * Require that an amount is non-zero.
 */
inline void require_positive(const Amount& value, const std::string& field_name = "amount") {
    if (value.is_zero()) {
        throw ContractError::invalid_amount(field_name + " must be positive");
    }
}

/**
 * Require that an address is set.
 */
inline void require_address(const std::string& value, const std::string& field_name = "address") {
    if (value.empty()) {
        throw ContractError::invalid_address(field_name + " must not be empty");
    }
}

/**
 * Unwrap the result of checked arithmetic.
 */
inline Amount require_no_overflow(const std::optional<Amount>& value, const std::string& what) {
    if (!value) {
        throw ContractError::overflow(what + " overflows");
    }
    return *value;
}

/**
 * Require that a record was found.
 */
template<typename T>
T require_found(std::optional<T> record, const std::string& message) {
    if (!record) {
        throw ContractError::not_found(message);
    }
    return std::move(*record);
}

} // namespace validation
} // namespace biteledger
