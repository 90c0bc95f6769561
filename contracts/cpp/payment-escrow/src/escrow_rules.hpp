#pragma once

#include <cstdint>
#include "biteledger/amount.hpp"
#include "contracts/payment_escrow.pb.h"

namespace escrow {

constexpr uint32_t DEFAULT_FEE_BPS = 250;
constexpr uint32_t MAX_FEE_BPS = 10000;

/// Escrowed -> {Released, Refunded}; both targets are terminal.
bool transition_allowed(contracts::EscrowStatus from, contracts::EscrowStatus to);

bool is_terminal(contracts::EscrowStatus status);

struct FeeSplit {
    biteledger::Amount fee;
    biteledger::Amount restaurant_share;
};

/**
 * fee = floor(amount * fee_bps / 10000), restaurant_share = amount - fee.
 * @throws ContractError InvalidFee above MAX_FEE_BPS, Overflow if the
 *         product does not fit in 128 bits
 */
FeeSplit split_fee(const biteledger::Amount& amount, uint32_t fee_bps);

} // namespace escrow
