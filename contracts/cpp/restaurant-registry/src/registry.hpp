#pragma once

#include <string>
#include <vector>
#include "registry_state.hpp"
#include "biteledger/contract.hpp"
#include "biteledger/router.hpp"

namespace registry {

/// Admin-curated registry of restaurants with auto-incrementing ids.
class RestaurantRegistry : public biteledger::Contract {
public:
    static constexpr const char* KIND = "restaurant_registry";

    RestaurantRegistry();

    std::string kind() const override { return KIND; }
    std::vector<std::string> entry_points() const override { return router_.entry_points(); }
    google::protobuf::Any dispatch(const google::protobuf::Any& command, biteledger::Env& env) override;

private:
    biteledger::EntryPointRouter<RegistryState> router_;
};

} // namespace registry
