#include "config_handlers.hpp"
#include "escrow_rules.hpp"
#include "biteledger/validation.hpp"

namespace escrow {
namespace handlers {

namespace validation = biteledger::validation;

namespace {

contracts::PaymentConfigChanged changed(const EscrowState& state, const contracts::PaymentConfig& config) {
    contracts::PaymentConfigChanged event;
    *event.mutable_previous() = *state.config;
    *event.mutable_config() = config;
    return event;
}

void require_admin(const biteledger::Env& env, const EscrowState& state) {
    validation::require_initialized(state.initialized());
    env.require_invoker(state.admin(), "admin");
}

} // anonymous namespace

contracts::PaymentConfigChanged handle_set_fee_bps(const contracts::SetFeeBps& cmd,
                                                   biteledger::Env& env, const EscrowState& state) {
    require_admin(env, state);
    if (cmd.fee_bps() > MAX_FEE_BPS) {
        throw biteledger::ContractError::invalid_fee("fee_bps must not exceed " + std::to_string(MAX_FEE_BPS));
    }

    auto config = *state.config;
    config.set_fee_bps(cmd.fee_bps());
    return changed(state, config);
}

contracts::PaymentConfigChanged handle_set_admin(const contracts::SetPaymentAdmin& cmd,
                                                 biteledger::Env& env, const EscrowState& state) {
    require_admin(env, state);
    validation::require_address(cmd.new_admin(), "new_admin");

    auto config = *state.config;
    config.set_admin(cmd.new_admin());
    return changed(state, config);
}

contracts::PaymentConfigChanged handle_set_treasury(const contracts::SetTreasury& cmd,
                                                    biteledger::Env& env, const EscrowState& state) {
    require_admin(env, state);
    validation::require_address(cmd.treasury(), "treasury");

    auto config = *state.config;
    config.set_treasury(cmd.treasury());
    return changed(state, config);
}

contracts::PaymentConfigChanged handle_set_trusted_caller(const contracts::SetTrustedCaller& cmd,
                                                          biteledger::Env& env,
                                                          const EscrowState& state) {
    require_admin(env, state);

    auto config = *state.config;
    config.set_trusted_caller(cmd.trusted_caller());
    return changed(state, config);
}

contracts::EscrowRecord query_escrow(const contracts::GetEscrow& query, const biteledger::Env& env,
                                     const EscrowState& state) {
    validation::require_initialized(state.initialized());
    return validation::require_found(EscrowState::find(env.storage(), query.order_id()),
                                     "no escrow for order " + std::to_string(query.order_id()));
}

contracts::PaymentConfig query_config(const contracts::GetPaymentConfig&, const biteledger::Env&,
                                      const EscrowState& state) {
    validation::require_initialized(state.initialized());
    return *state.config;
}

} // namespace handlers
} // namespace escrow
