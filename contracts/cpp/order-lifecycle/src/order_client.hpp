#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "biteledger/amount.hpp"
#include "biteledger/contract_client.hpp"
#include "contracts/order_lifecycle.pb.h"

namespace orders {

/// Typed in-process access to an order lifecycle instance.
class OrderLifecycleClient : public biteledger::ContractClient {
public:
    using ContractClient::ContractClient;

    void initialize(const std::string& caller, const std::string& admin,
                    const std::string& loyalty_token, bool rewards_enabled);

    /// @return The new order's id
    uint64_t place_order(const std::string& caller, const std::string& customer,
                         uint64_t restaurant_id, const biteledger::Amount& total_amount,
                         const std::vector<contracts::OrderItem>& items = {},
                         const std::string& notes = "");
    contracts::OrderStatusAdvanced advance_status(const std::string& caller, uint64_t order_id,
                                                  contracts::OrderStatus next_status);
    contracts::OrderCancelled cancel(const std::string& caller, uint64_t order_id);

    void set_rewards_enabled(const std::string& caller, bool enabled);
    void set_restaurant_registry(const std::string& caller, const std::string& registry);
    void set_operator(const std::string& caller, const std::string& operator_address, bool enabled);
    void set_admin(const std::string& caller, const std::string& new_admin);

    contracts::Order get_order(uint64_t order_id) const;
    contracts::OrderConfig config() const;
    std::vector<uint64_t> orders_by_customer(const std::string& customer) const;
    std::vector<uint64_t> orders_by_restaurant(uint64_t restaurant_id) const;
};

} // namespace orders
