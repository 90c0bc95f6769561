#pragma once

#include <cstdint>
#include "biteledger/amount.hpp"
#include "contracts/order_lifecycle.pb.h"

namespace orders {

/// Minimum reward, 1 BITE at 7 decimals.
constexpr uint64_t MIN_BITE_REWARD = 10'000'000;
constexpr uint64_t REWARD_DIVISOR = 10'000;

/**
 * Placed -> Confirmed -> Preparing -> OutForDelivery -> Delivered, plus
 * Placed|Confirmed -> Cancelled.
 */
bool transition_allowed(contracts::OrderStatus from, contracts::OrderStatus to);

/// Delivered and Cancelled admit no further transition.
bool is_terminal(contracts::OrderStatus status);

/// max(floor(total_amount / 10000), 10_000_000)
biteledger::Amount bite_reward(const biteledger::Amount& total_amount);

} // namespace orders
