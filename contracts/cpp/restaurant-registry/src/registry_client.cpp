#include "registry_client.hpp"

namespace registry {

void RestaurantRegistryClient::initialize(const std::string& caller, const std::string& admin) {
    contracts::InitializeRegistry cmd;
    cmd.set_admin(admin);
    execute<contracts::RegistryInitialized>(caller, cmd);
}

uint64_t RestaurantRegistryClient::register_restaurant(const std::string& caller,
                                                       const std::string& owner,
                                                       const std::string& metadata) {
    contracts::RegisterRestaurant cmd;
    cmd.set_owner(owner);
    cmd.set_metadata(metadata);
    return execute<contracts::RestaurantRegistered>(caller, cmd).restaurant().id();
}

void RestaurantRegistryClient::deactivate(const std::string& caller, uint64_t id) {
    contracts::DeactivateRestaurant cmd;
    cmd.set_id(id);
    execute<contracts::RestaurantActivationChanged>(caller, cmd);
}

void RestaurantRegistryClient::activate(const std::string& caller, uint64_t id) {
    contracts::ActivateRestaurant cmd;
    cmd.set_id(id);
    execute<contracts::RestaurantActivationChanged>(caller, cmd);
}

void RestaurantRegistryClient::update_metadata(const std::string& caller, uint64_t id,
                                               const std::string& metadata) {
    contracts::UpdateRestaurantMetadata cmd;
    cmd.set_id(id);
    cmd.set_metadata(metadata);
    execute<contracts::RestaurantMetadataUpdated>(caller, cmd);
}

contracts::Restaurant RestaurantRegistryClient::get(uint64_t id) const {
    contracts::GetRestaurant query_message;
    query_message.set_id(id);
    return query<contracts::Restaurant>(query_message);
}

uint64_t RestaurantRegistryClient::owner_restaurant(const std::string& owner) const {
    contracts::GetOwnerRestaurant query_message;
    query_message.set_owner(owner);
    return query<contracts::OwnerRestaurant>(query_message).restaurant_id();
}

uint64_t RestaurantRegistryClient::count() const {
    return query<contracts::RestaurantCount>(contracts::CountRestaurants()).count();
}

std::vector<contracts::Restaurant> RestaurantRegistryClient::list() const {
    auto result = query<contracts::RestaurantList>(contracts::ListRestaurants());
    return {result.restaurants().begin(), result.restaurants().end()};
}

} // namespace registry
