#include "place_order_handler.hpp"
#include "biteledger/validation.hpp"
#include "contracts/restaurant_registry.pb.h"

namespace orders {
namespace handlers {

using biteledger::Amount;
using biteledger::ContractError;
namespace validation = biteledger::validation;

namespace {

void validate_items(const contracts::PlaceOrder& cmd, const Amount& total) {
    if (cmd.items_size() == 0) return;

    Amount sum;
    for (const auto& item : cmd.items()) {
        Amount unit_price = Amount::from_proto(item.unit_price());
        if (item.quantity() == 0 || unit_price.is_zero()) {
            throw ContractError::invalid_amount(
                "item " + std::to_string(item.menu_item_id()) + " needs a quantity and a price");
        }
        Amount line = validation::require_no_overflow(
            unit_price.checked_mul(Amount(item.quantity())), "item total");
        sum = validation::require_no_overflow(sum.checked_add(line), "order total");
    }
    if (sum != total) {
        throw ContractError::invalid_amount(
            "items add up to " + sum.to_string() + ", order total is " + total.to_string());
    }
}

void require_active_restaurant(biteledger::Env& env, const std::string& registry,
                               uint64_t restaurant_id) {
    contracts::GetRestaurant query;
    query.set_id(restaurant_id);
    auto restaurant = env.call<contracts::Restaurant>(registry, query);
    if (!restaurant.active()) {
        throw ContractError::invalid_state(
            "restaurant " + std::to_string(restaurant_id) + " is not active");
    }
}

} // anonymous namespace

contracts::OrderPlaced handle_place_order(const contracts::PlaceOrder& cmd, biteledger::Env& env,
                                          const OrderState& state) {
    // Guard
    validation::require_initialized(state.initialized());
    env.require_auth(cmd.customer());

    // Validate
    Amount total = Amount::from_proto(cmd.total_amount());
    validation::require_positive(total, "total_amount");
    validate_items(cmd, total);
    if (cmd.restaurant_id() == 0) {
        throw ContractError::not_found("restaurant ids start at 1");
    }
    if (!state.config->restaurant_registry().empty()) {
        require_active_restaurant(env, state.config->restaurant_registry(), cmd.restaurant_id());
    }

    // Compute
    contracts::OrderPlaced event;
    auto* order = event.mutable_order();
    order->set_id(state.next_id);
    order->set_customer(cmd.customer());
    order->set_restaurant_id(cmd.restaurant_id());
    *order->mutable_total_amount() = cmd.total_amount();
    order->set_status(contracts::PLACED);
    order->set_reward_minted(false);
    *order->mutable_bite_reward() = Amount().to_proto();
    *order->mutable_items() = cmd.items();
    order->set_notes(cmd.notes());
    order->set_created_at(env.timestamp());
    order->set_updated_at(env.timestamp());
    return event;
}

} // namespace handlers
} // namespace orders
