#pragma once

#include "order_state.hpp"
#include "biteledger/contract.hpp"
#include "contracts/order_lifecycle.pb.h"

namespace orders {
namespace handlers {

/// Handle PlaceOrder command. Requires authorization of the customer.
contracts::OrderPlaced handle_place_order(const contracts::PlaceOrder& cmd, biteledger::Env& env,
                                          const OrderState& state);

} // namespace handlers
} // namespace orders
