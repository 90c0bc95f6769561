#include "status_handler.hpp"
#include "order_rules.hpp"
#include "biteledger/logging.hpp"
#include "biteledger/validation.hpp"

namespace orders {
namespace handlers {

using biteledger::Amount;
using biteledger::ContractError;
namespace validation = biteledger::validation;

namespace {

constexpr const char* ORDER_DOMAIN = "order_lifecycle";

contracts::Order require_order(const biteledger::Env& env, uint64_t order_id) {
    return validation::require_found(OrderState::find(env.storage(), order_id),
                                     "order " + std::to_string(order_id) + " not found");
}

std::string describe(contracts::OrderStatus from, contracts::OrderStatus to) {
    return contracts::OrderStatus_Name(from) + " -> " + contracts::OrderStatus_Name(to);
}

} // anonymous namespace

contracts::OrderStatusAdvanced handle_advance_status(const contracts::AdvanceStatus& cmd,
                                                     biteledger::Env& env, const OrderState& state,
                                                     const token::MintableTokenResolver& tokens) {
    // Guard
    validation::require_initialized(state.initialized());
    if (env.invoker() != state.admin() && !OrderState::is_operator(env.storage(), env.invoker())) {
        throw ContractError::unauthorized(env.invoker() + " is neither admin nor operator");
    }

    // Validate
    auto order = require_order(env, cmd.order_id());
    if (is_terminal(order.status())) {
        throw ContractError::order_closed(
            "order " + std::to_string(order.id()) + " is " + contracts::OrderStatus_Name(order.status()));
    }
    if (cmd.next_status() == contracts::CANCELLED || !transition_allowed(order.status(), cmd.next_status())) {
        throw ContractError::invalid_transition(describe(order.status(), cmd.next_status()));
    }

    // Compute
    contracts::OrderStatusAdvanced event;
    event.set_order_id(order.id());
    event.set_from(order.status());
    event.set_to(cmd.next_status());
    event.set_updated_at(env.timestamp());

    if (cmd.next_status() == contracts::DELIVERED && state.config->rewards_enabled() &&
        !order.reward_minted()) {
        Amount reward = bite_reward(Amount::from_proto(order.total_amount()));
        auto token = tokens(env, state.config->loyalty_token());
        token->mint(order.customer(), reward);

        event.set_reward_minted(true);
        *event.mutable_bite_reward() = reward.to_proto();

        biteledger::log_debug(ORDER_DOMAIN, "reward mint staged", {
            {"order_id", order.id()},
            {"customer", order.customer()},
            {"bite_reward", reward.to_string()}
        });
    }
    return event;
}

contracts::OrderCancelled handle_cancel(const contracts::CancelOrder& cmd, biteledger::Env& env,
                                        const OrderState& state) {
    // Guard
    validation::require_initialized(state.initialized());
    auto order = require_order(env, cmd.order_id());
    const bool is_admin = env.invoker() == state.admin();
    if (!is_admin && !env.is_authorized(order.customer())) {
        throw ContractError::unauthorized(env.invoker() + " may not cancel order " + std::to_string(order.id()));
    }

    // Validate
    if (!transition_allowed(order.status(), contracts::CANCELLED)) {
        throw ContractError::invalid_transition(describe(order.status(), contracts::CANCELLED));
    }
    if (!is_admin && order.status() != contracts::PLACED) {
        throw ContractError::unauthorized("customers may cancel only placed orders");
    }

    // Compute
    contracts::OrderCancelled event;
    event.set_order_id(order.id());
    event.set_from(order.status());
    event.set_cancelled_by(env.invoker());
    event.set_updated_at(env.timestamp());
    return event;
}

} // namespace handlers
} // namespace orders
