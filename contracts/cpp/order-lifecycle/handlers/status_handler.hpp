#pragma once

#include "order_state.hpp"
#include "token_capabilities.hpp"
#include "biteledger/contract.hpp"
#include "contracts/order_lifecycle.pb.h"

namespace orders {
namespace handlers {

/**
 * Move an order one step forward. Entering Delivered mints the BITE
 * reward once when rewards are enabled; a failed mint fails the call.
 */
contracts::OrderStatusAdvanced handle_advance_status(const contracts::AdvanceStatus& cmd,
                                                     biteledger::Env& env, const OrderState& state,
                                                     const token::MintableTokenResolver& tokens);

/// Admin cancels from Placed or Confirmed; the customer only from Placed.
contracts::OrderCancelled handle_cancel(const contracts::CancelOrder& cmd, biteledger::Env& env,
                                        const OrderState& state);

} // namespace handlers
} // namespace orders
