#pragma once

#include "registry_state.hpp"
#include "biteledger/contract.hpp"
#include "contracts/restaurant_registry.pb.h"

namespace registry {
namespace handlers {

contracts::RegistryInitialized handle_initialize(const contracts::InitializeRegistry& cmd,
                                                 biteledger::Env& env, const RegistryState& state);

/// Admin registers a restaurant under the next id.
contracts::RestaurantRegistered handle_register(const contracts::RegisterRestaurant& cmd,
                                                biteledger::Env& env, const RegistryState& state);

contracts::RestaurantActivationChanged handle_deactivate(const contracts::DeactivateRestaurant& cmd,
                                                         biteledger::Env& env,
                                                         const RegistryState& state);

contracts::RestaurantActivationChanged handle_activate(const contracts::ActivateRestaurant& cmd,
                                                       biteledger::Env& env,
                                                       const RegistryState& state);

/// The record's owner or the admin may replace its metadata.
contracts::RestaurantMetadataUpdated handle_update_metadata(
    const contracts::UpdateRestaurantMetadata& cmd, biteledger::Env& env,
    const RegistryState& state);

contracts::Restaurant query_restaurant(const contracts::GetRestaurant& query,
                                       const biteledger::Env& env, const RegistryState& state);

/// Id of the first restaurant registered to an owner.
contracts::OwnerRestaurant query_owner_restaurant(const contracts::GetOwnerRestaurant& query,
                                                  const biteledger::Env& env,
                                                  const RegistryState& state);

contracts::RestaurantCount query_count(const contracts::CountRestaurants& query,
                                       const biteledger::Env& env, const RegistryState& state);

contracts::RestaurantList query_list(const contracts::ListRestaurants& query,
                                     const biteledger::Env& env, const RegistryState& state);

} // namespace handlers
} // namespace registry
