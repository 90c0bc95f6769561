#pragma once

#include "order_state.hpp"
#include "biteledger/contract.hpp"
#include "contracts/order_lifecycle.pb.h"

namespace orders {
namespace handlers {

contracts::OrdersInitialized handle_initialize(const contracts::InitializeOrders& cmd,
                                               biteledger::Env& env, const OrderState& state);

// Admin-only configuration updates.

contracts::OrderConfigChanged handle_set_rewards_enabled(const contracts::SetRewardsEnabled& cmd,
                                                         biteledger::Env& env, const OrderState& state);

contracts::OrderConfigChanged handle_set_restaurant_registry(const contracts::SetRestaurantRegistry& cmd,
                                                             biteledger::Env& env, const OrderState& state);

contracts::OrderConfigChanged handle_set_admin(const contracts::SetOrderAdmin& cmd,
                                               biteledger::Env& env, const OrderState& state);

contracts::OperatorChanged handle_set_operator(const contracts::SetOperator& cmd,
                                               biteledger::Env& env, const OrderState& state);

contracts::Order query_order(const contracts::GetOrder& query, const biteledger::Env& env,
                             const OrderState& state);

contracts::OrderConfig query_config(const contracts::GetOrderConfig& query, const biteledger::Env& env,
                                    const OrderState& state);

contracts::OrderIdList query_customer_orders(const contracts::ListCustomerOrders& query,
                                             const biteledger::Env& env, const OrderState& state);

contracts::OrderIdList query_restaurant_orders(const contracts::ListRestaurantOrders& query,
                                               const biteledger::Env& env, const OrderState& state);

} // namespace handlers
} // namespace orders
