#include "registry_state.hpp"
#include "biteledger/helpers.hpp"

namespace registry {

using biteledger::ContractStorage;
namespace helpers = biteledger::helpers;

RegistryState RegistryState::build(const ContractStorage& storage) {
    RegistryState state;
    state.config = storage.get<contracts::RegistryConfig>(keys::CONFIG);
    if (auto counter = storage.get<contracts::RegistryCounter>(keys::COUNTER)) {
        state.next_id = counter->next_id();
    }
    return state;
}

std::optional<contracts::Restaurant> RegistryState::find(const ContractStorage& storage, uint64_t id) {
    return storage.get<contracts::Restaurant>(helpers::record_key(keys::RESTAURANT, id));
}

namespace {

std::string owner_key(const std::string& owner) {
    return std::string(keys::OWNER) + "/" + owner;
}

} // anonymous namespace

std::optional<contracts::OwnerIndex> RegistryState::find_owner(const ContractStorage& storage,
                                                               const std::string& owner) {
    return storage.get<contracts::OwnerIndex>(owner_key(owner));
}

void RegistryState::apply_event(ContractStorage& storage, const google::protobuf::Any& event_any) {
    if (helpers::is_a<contracts::RegistryInitialized>(event_any)) {
        auto event = helpers::unpack<contracts::RegistryInitialized>(event_any);
        contracts::RegistryConfig config;
        config.set_admin(event.admin());
        storage.put(keys::CONFIG, config);

        contracts::RegistryCounter counter;
        counter.set_next_id(1);
        storage.put(keys::COUNTER, counter);
    } else if (helpers::is_a<contracts::RestaurantRegistered>(event_any)) {
        auto event = helpers::unpack<contracts::RestaurantRegistered>(event_any);
        const auto& restaurant = event.restaurant();
        storage.put(helpers::record_key(keys::RESTAURANT, restaurant.id()), restaurant);

        if (!find_owner(storage, restaurant.owner())) {
            contracts::OwnerIndex index;
            index.set_restaurant_id(restaurant.id());
            storage.put(owner_key(restaurant.owner()), index);
        }

        contracts::RegistryCounter counter;
        counter.set_next_id(restaurant.id() + 1);
        storage.put(keys::COUNTER, counter);
    } else if (helpers::is_a<contracts::RestaurantActivationChanged>(event_any)) {
        auto event = helpers::unpack<contracts::RestaurantActivationChanged>(event_any);
        auto restaurant = find(storage, event.id()).value();
        restaurant.set_active(event.active());
        storage.put(helpers::record_key(keys::RESTAURANT, event.id()), restaurant);
    } else if (helpers::is_a<contracts::RestaurantMetadataUpdated>(event_any)) {
        auto event = helpers::unpack<contracts::RestaurantMetadataUpdated>(event_any);
        auto restaurant = find(storage, event.id()).value();
        restaurant.set_metadata(event.metadata());
        storage.put(helpers::record_key(keys::RESTAURANT, event.id()), restaurant);
    }
}

} // namespace registry
