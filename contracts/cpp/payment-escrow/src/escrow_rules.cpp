#include "escrow_rules.hpp"
#include "biteledger/errors.hpp"
#include "biteledger/validation.hpp"

namespace escrow {

using biteledger::Amount;

namespace {

struct Transition {
    contracts::EscrowStatus from;
    contracts::EscrowStatus to;
};

constexpr Transition TRANSITIONS[] = {
    {contracts::ESCROWED, contracts::RELEASED},
    {contracts::ESCROWED, contracts::REFUNDED},
};

} // anonymous namespace

bool transition_allowed(contracts::EscrowStatus from, contracts::EscrowStatus to) {
    for (const auto& transition : TRANSITIONS) {
        if (transition.from == from && transition.to == to) return true;
    }
    return false;
}

bool is_terminal(contracts::EscrowStatus status) {
    for (const auto& transition : TRANSITIONS) {
        if (transition.from == status) return false;
    }
    return true;
}

FeeSplit split_fee(const Amount& amount, uint32_t fee_bps) {
    if (fee_bps > MAX_FEE_BPS) {
        throw biteledger::ContractError::invalid_fee(
            "fee_bps " + std::to_string(fee_bps) + " exceeds " + std::to_string(MAX_FEE_BPS));
    }
    Amount product = biteledger::validation::require_no_overflow(
        amount.checked_mul(Amount(fee_bps)), "fee computation");

    FeeSplit split;
    split.fee = product / Amount(MAX_FEE_BPS);
    // fee <= amount because fee_bps <= 10000
    split.restaurant_share = *amount.checked_sub(split.fee);
    return split;
}

} // namespace escrow
