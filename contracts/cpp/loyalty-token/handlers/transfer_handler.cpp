#include "transfer_handler.hpp"
#include "biteledger/validation.hpp"

namespace token {
namespace handlers {

using biteledger::Amount;
namespace validation = biteledger::validation;

contracts::TokensTransferred handle_transfer(const contracts::Transfer& cmd, biteledger::Env& env,
                                             const TokenState& state) {
    // Guard
    validation::require_initialized(state.initialized());
    env.require_auth(cmd.from());

    // Validate
    validation::require_address(cmd.to(), "to");
    Amount amount = Amount::from_proto(cmd.amount());
    validation::require_positive(amount);

    Amount from_balance = TokenState::balance_of(env.storage(), cmd.from());
    auto new_from_balance = from_balance.checked_sub(amount);
    if (!new_from_balance) {
        throw biteledger::ContractError::insufficient_balance(
            cmd.from() + " holds " + from_balance.to_string() + ", cannot send " + amount.to_string());
    }

    // Compute
    Amount to_before = cmd.to() == cmd.from()
        ? *new_from_balance
        : TokenState::balance_of(env.storage(), cmd.to());
    Amount new_to_balance = validation::require_no_overflow(
        to_before.checked_add(amount), "balance of " + cmd.to());

    contracts::TokensTransferred event;
    event.set_from(cmd.from());
    event.set_to(cmd.to());
    *event.mutable_amount() = amount.to_proto();
    *event.mutable_from_balance() = (cmd.to() == cmd.from() ? new_to_balance : *new_from_balance).to_proto();
    *event.mutable_to_balance() = new_to_balance.to_proto();
    return event;
}

} // namespace handlers
} // namespace token
