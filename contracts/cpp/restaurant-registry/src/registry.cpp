#include "registry.hpp"
#include "../handlers/registry_handlers.hpp"

namespace registry {

RestaurantRegistry::RestaurantRegistry()
    : router_(KIND, RegistryState::build, RegistryState::apply_event) {
    router_
        .on<contracts::InitializeRegistry, contracts::RegistryInitialized>(handlers::handle_initialize)
        .on<contracts::RegisterRestaurant, contracts::RestaurantRegistered>(handlers::handle_register)
        .on<contracts::DeactivateRestaurant, contracts::RestaurantActivationChanged>(handlers::handle_deactivate)
        .on<contracts::ActivateRestaurant, contracts::RestaurantActivationChanged>(handlers::handle_activate)
        .on<contracts::UpdateRestaurantMetadata, contracts::RestaurantMetadataUpdated>(handlers::handle_update_metadata)
        .view<contracts::GetRestaurant, contracts::Restaurant>(handlers::query_restaurant)
        .view<contracts::GetOwnerRestaurant, contracts::OwnerRestaurant>(handlers::query_owner_restaurant)
        .view<contracts::CountRestaurants, contracts::RestaurantCount>(handlers::query_count)
        .view<contracts::ListRestaurants, contracts::RestaurantList>(handlers::query_list);
}

google::protobuf::Any RestaurantRegistry::dispatch(const google::protobuf::Any& command,
                                                   biteledger::Env& env) {
    return router_.dispatch(command, env);
}

} // namespace registry
