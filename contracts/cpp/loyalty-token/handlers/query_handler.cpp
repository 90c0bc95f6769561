#include "query_handler.hpp"
#include "biteledger/validation.hpp"

namespace token {
namespace handlers {

contracts::TokenBalance query_balance(const contracts::GetBalance& query, const biteledger::Env& env,
                                      const TokenState&) {
    contracts::TokenBalance result;
    result.set_address(query.address());
    *result.mutable_amount() = TokenState::balance_of(env.storage(), query.address()).to_proto();
    return result;
}

contracts::TokenInfo query_info(const contracts::GetTokenInfo&, const biteledger::Env&,
                                const TokenState& state) {
    biteledger::validation::require_initialized(state.initialized());

    contracts::TokenInfo result;
    *result.mutable_metadata() = state.config->metadata();
    result.set_admin(state.admin());
    result.set_minter(state.minter());
    *result.mutable_total_supply() = state.total_supply.to_proto();
    return result;
}

} // namespace handlers
} // namespace token
