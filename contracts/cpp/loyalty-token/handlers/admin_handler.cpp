#include "admin_handler.hpp"
#include "biteledger/validation.hpp"

namespace token {
namespace handlers {

namespace validation = biteledger::validation;

contracts::MinterChanged handle_set_minter(const contracts::SetMinter& cmd, biteledger::Env& env,
                                           const TokenState& state) {
    validation::require_initialized(state.initialized());
    env.require_invoker(state.admin(), "admin");
    validation::require_address(cmd.new_minter(), "new_minter");

    contracts::MinterChanged event;
    event.set_previous_minter(state.minter());
    event.set_minter(cmd.new_minter());
    return event;
}

contracts::TokenAdminChanged handle_set_admin(const contracts::SetTokenAdmin& cmd, biteledger::Env& env,
                                              const TokenState& state) {
    validation::require_initialized(state.initialized());
    env.require_invoker(state.admin(), "admin");
    validation::require_address(cmd.new_admin(), "new_admin");

    contracts::TokenAdminChanged event;
    event.set_previous_admin(state.admin());
    event.set_admin(cmd.new_admin());
    return event;
}

} // namespace handlers
} // namespace token
