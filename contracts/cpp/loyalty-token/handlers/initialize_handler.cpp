#include "initialize_handler.hpp"
#include "biteledger/validation.hpp"

namespace token {
namespace handlers {

contracts::TokenInitialized handle_initialize(const contracts::InitializeToken& cmd,
                                              biteledger::Env&, const TokenState& state,
                                              const contracts::TokenMetadata& metadata) {
    // Guard
    biteledger::validation::require_not_initialized(state.initialized());

    // Validate
    biteledger::validation::require_address(cmd.admin(), "admin");
    biteledger::validation::require_address(cmd.minter(), "minter");

    // Compute
    contracts::TokenInitialized event;
    event.set_admin(cmd.admin());
    event.set_minter(cmd.minter());
    *event.mutable_metadata() = metadata;
    return event;
}

} // namespace handlers
} // namespace token
