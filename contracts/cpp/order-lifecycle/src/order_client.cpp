#include "order_client.hpp"

namespace orders {

using biteledger::Amount;

void OrderLifecycleClient::initialize(const std::string& caller, const std::string& admin,
                                      const std::string& loyalty_token, bool rewards_enabled) {
    contracts::InitializeOrders cmd;
    cmd.set_admin(admin);
    cmd.set_loyalty_token(loyalty_token);
    cmd.set_rewards_enabled(rewards_enabled);
    execute<contracts::OrdersInitialized>(caller, cmd);
}

uint64_t OrderLifecycleClient::place_order(const std::string& caller, const std::string& customer,
                                           uint64_t restaurant_id, const Amount& total_amount,
                                           const std::vector<contracts::OrderItem>& items,
                                           const std::string& notes) {
    contracts::PlaceOrder cmd;
    cmd.set_customer(customer);
    cmd.set_restaurant_id(restaurant_id);
    *cmd.mutable_total_amount() = total_amount.to_proto();
    for (const auto& item : items) {
        *cmd.add_items() = item;
    }
    cmd.set_notes(notes);
    return execute<contracts::OrderPlaced>(caller, cmd).order().id();
}

contracts::OrderStatusAdvanced OrderLifecycleClient::advance_status(const std::string& caller,
                                                                    uint64_t order_id,
                                                                    contracts::OrderStatus next_status) {
    contracts::AdvanceStatus cmd;
    cmd.set_order_id(order_id);
    cmd.set_next_status(next_status);
    return execute<contracts::OrderStatusAdvanced>(caller, cmd);
}

contracts::OrderCancelled OrderLifecycleClient::cancel(const std::string& caller, uint64_t order_id) {
    contracts::CancelOrder cmd;
    cmd.set_order_id(order_id);
    return execute<contracts::OrderCancelled>(caller, cmd);
}

void OrderLifecycleClient::set_rewards_enabled(const std::string& caller, bool enabled) {
    contracts::SetRewardsEnabled cmd;
    cmd.set_enabled(enabled);
    execute<contracts::OrderConfigChanged>(caller, cmd);
}

void OrderLifecycleClient::set_restaurant_registry(const std::string& caller,
                                                   const std::string& registry) {
    contracts::SetRestaurantRegistry cmd;
    cmd.set_restaurant_registry(registry);
    execute<contracts::OrderConfigChanged>(caller, cmd);
}

void OrderLifecycleClient::set_operator(const std::string& caller,
                                        const std::string& operator_address, bool enabled) {
    contracts::SetOperator cmd;
    cmd.set_operator_address(operator_address);
    cmd.set_enabled(enabled);
    execute<contracts::OperatorChanged>(caller, cmd);
}

void OrderLifecycleClient::set_admin(const std::string& caller, const std::string& new_admin) {
    contracts::SetOrderAdmin cmd;
    cmd.set_new_admin(new_admin);
    execute<contracts::OrderConfigChanged>(caller, cmd);
}

contracts::Order OrderLifecycleClient::get_order(uint64_t order_id) const {
    contracts::GetOrder query_message;
    query_message.set_order_id(order_id);
    return query<contracts::Order>(query_message);
}

contracts::OrderConfig OrderLifecycleClient::config() const {
    return query<contracts::OrderConfig>(contracts::GetOrderConfig());
}

std::vector<uint64_t> OrderLifecycleClient::orders_by_customer(const std::string& customer) const {
    contracts::ListCustomerOrders query_message;
    query_message.set_customer(customer);
    auto ids = query<contracts::OrderIdList>(query_message);
    return {ids.ids().begin(), ids.ids().end()};
}

std::vector<uint64_t> OrderLifecycleClient::orders_by_restaurant(uint64_t restaurant_id) const {
    contracts::ListRestaurantOrders query_message;
    query_message.set_restaurant_id(restaurant_id);
    auto ids = query<contracts::OrderIdList>(query_message);
    return {ids.ids().begin(), ids.ids().end()};
}

} // namespace orders
