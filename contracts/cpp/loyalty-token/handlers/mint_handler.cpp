#include "mint_handler.hpp"
#include "biteledger/validation.hpp"

namespace token {
namespace handlers {

using biteledger::Amount;
namespace validation = biteledger::validation;

contracts::TokensMinted handle_mint(const contracts::Mint& cmd, biteledger::Env& env,
                                    const TokenState& state) {
    // Guard
    validation::require_initialized(state.initialized());
    env.require_invoker(state.minter(), "minter");

    // Validate
    validation::require_address(cmd.to(), "to");
    Amount amount = Amount::from_proto(cmd.amount());
    validation::require_positive(amount);

    // Compute
    Amount new_supply = validation::require_no_overflow(
        state.total_supply.checked_add(amount), "total supply");
    Amount new_balance = validation::require_no_overflow(
        TokenState::balance_of(env.storage(), cmd.to()).checked_add(amount), "balance of " + cmd.to());

    contracts::TokensMinted event;
    event.set_to(cmd.to());
    *event.mutable_amount() = amount.to_proto();
    *event.mutable_new_balance() = new_balance.to_proto();
    *event.mutable_new_total_supply() = new_supply.to_proto();
    return event;
}

contracts::TokensBurned handle_burn(const contracts::Burn& cmd, biteledger::Env& env,
                                    const TokenState& state) {
    // Guard
    validation::require_initialized(state.initialized());
    env.require_auth(cmd.from());

    // Validate
    Amount amount = Amount::from_proto(cmd.amount());
    validation::require_positive(amount);

    Amount balance = TokenState::balance_of(env.storage(), cmd.from());
    auto new_balance = balance.checked_sub(amount);
    if (!new_balance) {
        throw biteledger::ContractError::insufficient_balance(
            cmd.from() + " holds " + balance.to_string() + ", cannot burn " + amount.to_string());
    }

    // Compute
    auto new_supply = state.total_supply.checked_sub(amount);
    if (!new_supply) {
        throw biteledger::StorageError("total supply is below a holder balance");
    }

    contracts::TokensBurned event;
    event.set_from(cmd.from());
    *event.mutable_amount() = amount.to_proto();
    *event.mutable_new_balance() = new_balance->to_proto();
    *event.mutable_new_total_supply() = new_supply->to_proto();
    return event;
}

} // namespace handlers
} // namespace token
