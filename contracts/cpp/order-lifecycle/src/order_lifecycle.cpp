#include "order_lifecycle.hpp"
#include "../handlers/config_handlers.hpp"
#include "../handlers/place_order_handler.hpp"
#include "../handlers/status_handler.hpp"

namespace orders {

using biteledger::Env;

OrderLifecycle::OrderLifecycle(token::MintableTokenResolver tokens)
    : router_(KIND, OrderState::build, OrderState::apply_event) {
    router_
        .on<contracts::InitializeOrders, contracts::OrdersInitialized>(handlers::handle_initialize)
        .on<contracts::PlaceOrder, contracts::OrderPlaced>(handlers::handle_place_order)
        .on<contracts::AdvanceStatus, contracts::OrderStatusAdvanced>(
            [tokens](const contracts::AdvanceStatus& cmd, Env& env, const OrderState& state) {
                return handlers::handle_advance_status(cmd, env, state, tokens);
            })
        .on<contracts::CancelOrder, contracts::OrderCancelled>(handlers::handle_cancel)
        .on<contracts::SetRewardsEnabled, contracts::OrderConfigChanged>(handlers::handle_set_rewards_enabled)
        .on<contracts::SetRestaurantRegistry, contracts::OrderConfigChanged>(handlers::handle_set_restaurant_registry)
        .on<contracts::SetOperator, contracts::OperatorChanged>(handlers::handle_set_operator)
        .on<contracts::SetOrderAdmin, contracts::OrderConfigChanged>(handlers::handle_set_admin)
        .view<contracts::GetOrder, contracts::Order>(handlers::query_order)
        .view<contracts::GetOrderConfig, contracts::OrderConfig>(handlers::query_config)
        .view<contracts::ListCustomerOrders, contracts::OrderIdList>(handlers::query_customer_orders)
        .view<contracts::ListRestaurantOrders, contracts::OrderIdList>(handlers::query_restaurant_orders);
}

google::protobuf::Any OrderLifecycle::dispatch(const google::protobuf::Any& command, Env& env) {
    return router_.dispatch(command, env);
}

} // namespace orders
