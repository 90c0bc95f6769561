#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <google/protobuf/any.pb.h>
#include "biteledger/contract.hpp"
#include "contracts/order_lifecycle.pb.h"

namespace orders {

namespace keys {
constexpr const char* CONFIG = "config";
constexpr const char* COUNTER = "counter";
constexpr const char* ORDER = "order";
constexpr const char* BY_CUSTOMER = "customer";
constexpr const char* BY_RESTAURANT = "restaurant";
constexpr const char* OPERATOR = "operator";
} // namespace keys

/// Order lifecycle instance state. Orders, indexes and operator grants
/// are read on demand.
struct OrderState {
    std::optional<contracts::OrderConfig> config;
    uint64_t next_id = 1;

    bool initialized() const { return config.has_value(); }
    const std::string& admin() const { return config->admin(); }

    static OrderState build(const biteledger::ContractStorage& storage);

    static std::optional<contracts::Order> find(const biteledger::ContractStorage& storage,
                                                uint64_t order_id);

    static bool is_operator(const biteledger::ContractStorage& storage, const std::string& address);

    static contracts::OrderIdList customer_orders(const biteledger::ContractStorage& storage,
                                                  const std::string& customer);

    static contracts::OrderIdList restaurant_orders(const biteledger::ContractStorage& storage,
                                                    uint64_t restaurant_id);

    static void apply_event(biteledger::ContractStorage& storage,
                            const google::protobuf::Any& event_any);
};

} // namespace orders
