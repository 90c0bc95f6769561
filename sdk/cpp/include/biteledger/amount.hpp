#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include "biteledger/types.pb.h"

namespace biteledger {

/**
 * Unsigned 128-bit token quantity in base units (stroops for 7-decimal
 * assets).
 *
 * Arithmetic is checked: operations that could wrap return an empty
 * optional instead, and callers turn that into an Overflow or
 * InsufficientBalance error.
 */
class Amount {
public:
    using value_type = unsigned __int128;

    Amount() = default;
    explicit Amount(uint64_t value) : value_(value) {}

    static Amount from_parts(uint64_t hi, uint64_t lo);
    static Amount from_proto(const U128& proto);
    static Amount max();

    U128 to_proto() const;

    uint64_t hi() const { return static_cast<uint64_t>(value_ >> 64); }
    uint64_t lo() const { return static_cast<uint64_t>(value_); }
    bool is_zero() const { return value_ == 0; }

    std::optional<Amount> checked_add(const Amount& other) const;
    std::optional<Amount> checked_sub(const Amount& other) const;
    std::optional<Amount> checked_mul(const Amount& other) const;

    /// Floor division. Throws std::domain_error on a zero divisor.
    Amount operator/(const Amount& divisor) const;

    bool operator==(const Amount& other) const { return value_ == other.value_; }
    bool operator!=(const Amount& other) const { return value_ != other.value_; }
    bool operator<(const Amount& other) const { return value_ < other.value_; }
    bool operator<=(const Amount& other) const { return value_ <= other.value_; }
    bool operator>(const Amount& other) const { return value_ > other.value_; }
    bool operator>=(const Amount& other) const { return value_ >= other.value_; }

    /// Decimal representation of the full 128-bit value.
    std::string to_string() const;

private:
    value_type value_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Amount& amount);

} // namespace biteledger
