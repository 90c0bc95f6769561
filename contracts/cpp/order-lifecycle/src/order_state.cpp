#include "order_state.hpp"
#include "biteledger/helpers.hpp"

namespace orders {

using biteledger::ContractStorage;
namespace helpers = biteledger::helpers;

namespace {

void append_id(ContractStorage& storage, const std::string& key, uint64_t order_id) {
    auto ids = storage.get<contracts::OrderIdList>(key).value_or(contracts::OrderIdList());
    ids.add_ids(order_id);
    storage.put(key, ids);
}

void put_order(ContractStorage& storage, const contracts::Order& order) {
    storage.put(helpers::record_key(keys::ORDER, order.id()), order);
}

} // anonymous namespace

OrderState OrderState::build(const ContractStorage& storage) {
    OrderState state;
    state.config = storage.get<contracts::OrderConfig>(keys::CONFIG);
    if (auto counter = storage.get<contracts::OrderCounter>(keys::COUNTER)) {
        state.next_id = counter->next_id();
    }
    return state;
}

std::optional<contracts::Order> OrderState::find(const ContractStorage& storage, uint64_t order_id) {
    return storage.get<contracts::Order>(helpers::record_key(keys::ORDER, order_id));
}

bool OrderState::is_operator(const ContractStorage& storage, const std::string& address) {
    return storage.has(helpers::address_key(keys::OPERATOR, address));
}

contracts::OrderIdList OrderState::customer_orders(const ContractStorage& storage,
                                                   const std::string& customer) {
    return storage.get<contracts::OrderIdList>(helpers::address_key(keys::BY_CUSTOMER, customer))
        .value_or(contracts::OrderIdList());
}

contracts::OrderIdList OrderState::restaurant_orders(const ContractStorage& storage,
                                                     uint64_t restaurant_id) {
    return storage.get<contracts::OrderIdList>(helpers::record_key(keys::BY_RESTAURANT, restaurant_id))
        .value_or(contracts::OrderIdList());
}

void OrderState::apply_event(ContractStorage& storage, const google::protobuf::Any& event_any) {
    if (helpers::is_a<contracts::OrdersInitialized>(event_any)) {
        auto event = helpers::unpack<contracts::OrdersInitialized>(event_any);
        storage.put(keys::CONFIG, event.config());
        contracts::OrderCounter counter;
        counter.set_next_id(1);
        storage.put(keys::COUNTER, counter);
    } else if (helpers::is_a<contracts::OrderConfigChanged>(event_any)) {
        auto event = helpers::unpack<contracts::OrderConfigChanged>(event_any);
        storage.put(keys::CONFIG, event.config());
    } else if (helpers::is_a<contracts::OperatorChanged>(event_any)) {
        auto event = helpers::unpack<contracts::OperatorChanged>(event_any);
        const auto key = helpers::address_key(keys::OPERATOR, event.operator_address());
        if (event.enabled()) {
            contracts::OperatorGrant grant;
            grant.set_operator_address(event.operator_address());
            storage.put(key, grant);
        } else {
            storage.erase(key);
        }
    } else if (helpers::is_a<contracts::OrderPlaced>(event_any)) {
        auto event = helpers::unpack<contracts::OrderPlaced>(event_any);
        const auto& order = event.order();
        put_order(storage, order);

        contracts::OrderCounter counter;
        counter.set_next_id(order.id() + 1);
        storage.put(keys::COUNTER, counter);

        append_id(storage, helpers::address_key(keys::BY_CUSTOMER, order.customer()), order.id());
        append_id(storage, helpers::record_key(keys::BY_RESTAURANT, order.restaurant_id()), order.id());
    } else if (helpers::is_a<contracts::OrderStatusAdvanced>(event_any)) {
        auto event = helpers::unpack<contracts::OrderStatusAdvanced>(event_any);
        auto order = find(storage, event.order_id()).value();
        order.set_status(event.to());
        if (event.reward_minted()) {
            order.set_reward_minted(true);
            *order.mutable_bite_reward() = event.bite_reward();
        }
        order.set_updated_at(event.updated_at());
        put_order(storage, order);
    } else if (helpers::is_a<contracts::OrderCancelled>(event_any)) {
        auto event = helpers::unpack<contracts::OrderCancelled>(event_any);
        auto order = find(storage, event.order_id()).value();
        order.set_status(contracts::CANCELLED);
        order.set_updated_at(event.updated_at());
        put_order(storage, order);
    }
}

} // namespace orders
