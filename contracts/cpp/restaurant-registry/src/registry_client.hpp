#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "biteledger/contract_client.hpp"
#include "contracts/restaurant_registry.pb.h"

namespace registry {

/// Typed in-process access to a registry instance.
class RestaurantRegistryClient : public biteledger::ContractClient {
public:
    using ContractClient::ContractClient;

    void initialize(const std::string& caller, const std::string& admin);

    /// @return The new restaurant's id
    uint64_t register_restaurant(const std::string& caller, const std::string& owner,
                                 const std::string& metadata);
    void deactivate(const std::string& caller, uint64_t id);
    void activate(const std::string& caller, uint64_t id);
    void update_metadata(const std::string& caller, uint64_t id, const std::string& metadata);

    contracts::Restaurant get(uint64_t id) const;
    uint64_t owner_restaurant(const std::string& owner) const;
    uint64_t count() const;
    std::vector<contracts::Restaurant> list() const;
};

} // namespace registry
