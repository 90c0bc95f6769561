#include "config_handlers.hpp"
#include "biteledger/validation.hpp"

namespace orders {
namespace handlers {

namespace validation = biteledger::validation;

namespace {

void require_admin(const biteledger::Env& env, const OrderState& state) {
    validation::require_initialized(state.initialized());
    env.require_invoker(state.admin(), "admin");
}

contracts::OrderConfigChanged changed(const OrderState& state, const contracts::OrderConfig& config) {
    contracts::OrderConfigChanged event;
    *event.mutable_previous() = *state.config;
    *event.mutable_config() = config;
    return event;
}

} // anonymous namespace

contracts::OrdersInitialized handle_initialize(const contracts::InitializeOrders& cmd,
                                               biteledger::Env&, const OrderState& state) {
    validation::require_not_initialized(state.initialized());
    validation::require_address(cmd.admin(), "admin");
    validation::require_address(cmd.loyalty_token(), "loyalty_token");

    contracts::OrdersInitialized event;
    auto* config = event.mutable_config();
    config->set_admin(cmd.admin());
    config->set_loyalty_token(cmd.loyalty_token());
    config->set_rewards_enabled(cmd.rewards_enabled());
    return event;
}

contracts::OrderConfigChanged handle_set_rewards_enabled(const contracts::SetRewardsEnabled& cmd,
                                                         biteledger::Env& env, const OrderState& state) {
    require_admin(env, state);
    auto config = *state.config;
    config.set_rewards_enabled(cmd.enabled());
    return changed(state, config);
}

contracts::OrderConfigChanged handle_set_restaurant_registry(const contracts::SetRestaurantRegistry& cmd,
                                                             biteledger::Env& env, const OrderState& state) {
    require_admin(env, state);
    auto config = *state.config;
    config.set_restaurant_registry(cmd.restaurant_registry());
    return changed(state, config);
}

contracts::OrderConfigChanged handle_set_admin(const contracts::SetOrderAdmin& cmd,
                                               biteledger::Env& env, const OrderState& state) {
    require_admin(env, state);
    validation::require_address(cmd.new_admin(), "new_admin");
    auto config = *state.config;
    config.set_admin(cmd.new_admin());
    return changed(state, config);
}

contracts::OperatorChanged handle_set_operator(const contracts::SetOperator& cmd,
                                               biteledger::Env& env, const OrderState& state) {
    require_admin(env, state);
    validation::require_address(cmd.operator_address(), "operator_address");

    contracts::OperatorChanged event;
    event.set_operator_address(cmd.operator_address());
    event.set_enabled(cmd.enabled());
    return event;
}

contracts::Order query_order(const contracts::GetOrder& query, const biteledger::Env& env,
                             const OrderState& state) {
    validation::require_initialized(state.initialized());
    return validation::require_found(OrderState::find(env.storage(), query.order_id()),
                                     "order " + std::to_string(query.order_id()) + " not found");
}

contracts::OrderConfig query_config(const contracts::GetOrderConfig&, const biteledger::Env&,
                                    const OrderState& state) {
    validation::require_initialized(state.initialized());
    return *state.config;
}

contracts::OrderIdList query_customer_orders(const contracts::ListCustomerOrders& query,
                                             const biteledger::Env& env, const OrderState&) {
    return OrderState::customer_orders(env.storage(), query.customer());
}

contracts::OrderIdList query_restaurant_orders(const contracts::ListRestaurantOrders& query,
                                               const biteledger::Env& env, const OrderState&) {
    return OrderState::restaurant_orders(env.storage(), query.restaurant_id());
}

} // namespace handlers
} // namespace orders
