#include "biteledger/amount.hpp"
#include <algorithm>
#include <stdexcept>

namespace biteledger {

Amount Amount::from_parts(uint64_t hi, uint64_t lo) {
    Amount amount;
    amount.value_ = (static_cast<value_type>(hi) << 64) | lo;
    return amount;
}

Amount Amount::from_proto(const U128& proto) {
    return from_parts(proto.hi(), proto.lo());
}

Amount Amount::max() {
    return from_parts(UINT64_MAX, UINT64_MAX);
}

U128 Amount::to_proto() const {
    U128 proto;
    proto.set_hi(hi());
    proto.set_lo(lo());
    return proto;
}

std::optional<Amount> Amount::checked_add(const Amount& other) const {
    Amount result;
    result.value_ = value_ + other.value_;
    if (result.value_ < value_) {
        return std::nullopt;
    }
    return result;
}

std::optional<Amount> Amount::checked_sub(const Amount& other) const {
    if (other.value_ > value_) {
        return std::nullopt;
    }
    Amount result;
    result.value_ = value_ - other.value_;
    return result;
}

std::optional<Amount> Amount::checked_mul(const Amount& other) const {
    if (value_ == 0 || other.value_ == 0) {
        return Amount();
    }
    Amount result;
    result.value_ = value_ * other.value_;
    if (result.value_ / other.value_ != value_) {
        return std::nullopt;
    }
    return result;
}

Amount Amount::operator/(const Amount& divisor) const {
    if (divisor.value_ == 0) {
        throw std::domain_error("Amount division by zero");
    }
    Amount result;
    result.value_ = value_ / divisor.value_;
    return result;
}

std::string Amount::to_string() const {
    if (value_ == 0) return "0";

    std::string digits;
    value_type remaining = value_;
    while (remaining > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(remaining % 10)));
        remaining /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::ostream& operator<<(std::ostream& os, const Amount& amount) {
    return os << amount.to_string();
}

} // namespace biteledger
