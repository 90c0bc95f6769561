#include "registry_handlers.hpp"
#include "biteledger/validation.hpp"

namespace registry {
namespace handlers {

namespace validation = biteledger::validation;

namespace {

contracts::Restaurant require_restaurant(const biteledger::ContractStorage& storage, uint64_t id) {
    return validation::require_found(RegistryState::find(storage, id),
                                     "restaurant " + std::to_string(id) + " not found");
}

contracts::RestaurantActivationChanged set_active(uint64_t id, bool active, biteledger::Env& env,
                                                  const RegistryState& state) {
    // Guard
    validation::require_initialized(state.initialized());
    env.require_invoker(state.admin(), "admin");

    // Validate
    require_restaurant(env.storage(), id);

    // Compute
    contracts::RestaurantActivationChanged event;
    event.set_id(id);
    event.set_active(active);
    return event;
}

} // anonymous namespace

contracts::RegistryInitialized handle_initialize(const contracts::InitializeRegistry& cmd,
                                                 biteledger::Env&, const RegistryState& state) {
    validation::require_not_initialized(state.initialized());
    validation::require_address(cmd.admin(), "admin");

    contracts::RegistryInitialized event;
    event.set_admin(cmd.admin());
    return event;
}

contracts::RestaurantRegistered handle_register(const contracts::RegisterRestaurant& cmd,
                                                biteledger::Env& env, const RegistryState& state) {
    // Guard
    validation::require_initialized(state.initialized());
    env.require_invoker(state.admin(), "admin");

    // Validate
    validation::require_address(cmd.owner(), "owner");

    // Compute
    contracts::RestaurantRegistered event;
    auto* restaurant = event.mutable_restaurant();
    restaurant->set_id(state.next_id);
    restaurant->set_owner(cmd.owner());
    restaurant->set_metadata(cmd.metadata());
    restaurant->set_active(true);
    restaurant->set_created_at(env.timestamp());
    return event;
}

contracts::RestaurantActivationChanged handle_deactivate(const contracts::DeactivateRestaurant& cmd,
                                                         biteledger::Env& env,
                                                         const RegistryState& state) {
    return set_active(cmd.id(), false, env, state);
}

contracts::RestaurantActivationChanged handle_activate(const contracts::ActivateRestaurant& cmd,
                                                       biteledger::Env& env,
                                                       const RegistryState& state) {
    return set_active(cmd.id(), true, env, state);
}

contracts::RestaurantMetadataUpdated handle_update_metadata(
    const contracts::UpdateRestaurantMetadata& cmd, biteledger::Env& env,
    const RegistryState& state) {
    // Guard
    validation::require_initialized(state.initialized());
    auto restaurant = require_restaurant(env.storage(), cmd.id());
    if (!env.is_authorized(restaurant.owner()) && env.invoker() != state.admin()) {
        throw biteledger::ContractError::unauthorized(
            "only the owner or the admin may update restaurant " + std::to_string(cmd.id()));
    }

    // Compute
    contracts::RestaurantMetadataUpdated event;
    event.set_id(cmd.id());
    event.set_metadata(cmd.metadata());
    event.set_updated_by(env.invoker());
    return event;
}

contracts::Restaurant query_restaurant(const contracts::GetRestaurant& query,
                                       const biteledger::Env& env, const RegistryState& state) {
    validation::require_initialized(state.initialized());
    return require_restaurant(env.storage(), query.id());
}

contracts::OwnerRestaurant query_owner_restaurant(const contracts::GetOwnerRestaurant& query,
                                                  const biteledger::Env& env,
                                                  const RegistryState& state) {
    validation::require_initialized(state.initialized());
    auto index = validation::require_found(RegistryState::find_owner(env.storage(), query.owner()),
                                           "no restaurant for owner " + query.owner());

    contracts::OwnerRestaurant result;
    result.set_owner(query.owner());
    result.set_restaurant_id(index.restaurant_id());
    return result;
}

contracts::RestaurantCount query_count(const contracts::CountRestaurants&,
                                       const biteledger::Env&, const RegistryState& state) {
    contracts::RestaurantCount result;
    result.set_count(state.count());
    return result;
}

contracts::RestaurantList query_list(const contracts::ListRestaurants&,
                                     const biteledger::Env& env, const RegistryState&) {
    contracts::RestaurantList result;
    for (auto& restaurant : env.storage().scan<contracts::Restaurant>(std::string(keys::RESTAURANT) + "/")) {
        *result.add_restaurants() = std::move(restaurant);
    }
    return result;
}

} // namespace handlers
} // namespace registry
