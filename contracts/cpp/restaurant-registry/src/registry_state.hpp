#pragma once

#include <cstdint>
#include <optional>
#include <google/protobuf/any.pb.h>
#include "biteledger/contract.hpp"
#include "contracts/restaurant_registry.pb.h"

namespace registry {

namespace keys {
constexpr const char* CONFIG = "config";
constexpr const char* COUNTER = "counter";
constexpr const char* RESTAURANT = "restaurant";
constexpr const char* OWNER = "owner";
} // namespace keys

/// Registry instance state.
struct RegistryState {
    std::optional<contracts::RegistryConfig> config;
    uint64_t next_id = 1;

    bool initialized() const { return config.has_value(); }
    const std::string& admin() const { return config->admin(); }
    uint64_t count() const { return next_id - 1; }

    static RegistryState build(const biteledger::ContractStorage& storage);

    static std::optional<contracts::Restaurant> find(const biteledger::ContractStorage& storage,
                                                     uint64_t id);

    static std::optional<contracts::OwnerIndex> find_owner(const biteledger::ContractStorage& storage,
                                                           const std::string& owner);

    static void apply_event(biteledger::ContractStorage& storage,
                            const google::protobuf::Any& event_any);
};

} // namespace registry
