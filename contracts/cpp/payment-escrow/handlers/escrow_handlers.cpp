#include "escrow_handlers.hpp"
#include "escrow_rules.hpp"
#include "biteledger/logging.hpp"
#include "biteledger/validation.hpp"

namespace escrow {
namespace handlers {

using biteledger::Amount;
using biteledger::ContractError;
namespace validation = biteledger::validation;

namespace {

constexpr const char* ESCROW_DOMAIN = "payment_escrow";

/// Run an asset transfer, reporting any contract failure as TransferFailed.
void transfer(token::TransferableAsset& asset, const std::string& from, const std::string& to,
              const Amount& amount) {
    try {
        asset.transfer(from, to, amount);
    } catch (const ContractError& e) {
        throw ContractError::transfer_failed(std::string(biteledger::kind_name(e.kind())) + ": " + e.what());
    }
}

contracts::EscrowRecord require_escrowed(const biteledger::Env& env, uint64_t order_id,
                                         contracts::EscrowStatus target) {
    auto record = validation::require_found(EscrowState::find(env.storage(), order_id),
                                            "no escrow for order " + std::to_string(order_id));
    if (!transition_allowed(record.status(), target)) {
        throw ContractError::invalid_state(
            "escrow for order " + std::to_string(order_id) + " is " +
            contracts::EscrowStatus_Name(record.status()));
    }
    return record;
}

} // anonymous namespace

contracts::PaymentInitialized handle_initialize(const contracts::InitializePayment& cmd,
                                                biteledger::Env&, const EscrowState& state) {
    // Guard
    validation::require_not_initialized(state.initialized());

    // Validate
    validation::require_address(cmd.admin(), "admin");
    validation::require_address(cmd.treasury(), "treasury");
    validation::require_address(cmd.asset(), "asset");
    uint32_t fee_bps = cmd.has_fee_bps() ? cmd.fee_bps() : DEFAULT_FEE_BPS;
    if (fee_bps > MAX_FEE_BPS) {
        throw ContractError::invalid_fee("fee_bps must not exceed " + std::to_string(MAX_FEE_BPS));
    }

    // Compute
    contracts::PaymentInitialized event;
    auto* config = event.mutable_config();
    config->set_admin(cmd.admin());
    config->set_treasury(cmd.treasury());
    config->set_fee_bps(fee_bps);
    config->set_asset(cmd.asset());
    return event;
}

contracts::FundsEscrowed handle_escrow(const contracts::EscrowFunds& cmd, biteledger::Env& env,
                                       const EscrowState& state, const token::AssetResolver& assets) {
    // Guard
    validation::require_initialized(state.initialized());
    env.require_auth(cmd.payer());

    // Validate
    if (EscrowState::find(env.storage(), cmd.order_id())) {
        throw ContractError::duplicate_order(
            "order " + std::to_string(cmd.order_id()) + " is already escrowed");
    }
    Amount amount = Amount::from_proto(cmd.amount());
    validation::require_positive(amount);

    // Compute
    auto asset = assets(env, state.config->asset());
    transfer(*asset, cmd.payer(), env.contract_address(), amount);

    contracts::FundsEscrowed event;
    event.set_order_id(cmd.order_id());
    event.set_payer(cmd.payer());
    *event.mutable_amount() = cmd.amount();
    event.set_restaurant(cmd.restaurant());
    event.set_created_at(env.timestamp());
    return event;
}

contracts::FundsReleased handle_release(const contracts::ReleaseFunds& cmd, biteledger::Env& env,
                                        const EscrowState& state, const token::AssetResolver& assets) {
    // Guard
    validation::require_initialized(state.initialized());
    if (!state.may_release(env.invoker())) {
        throw ContractError::unauthorized(env.invoker() + " may not release escrowed funds");
    }

    // Validate
    auto record = require_escrowed(env, cmd.order_id(), contracts::RELEASED);
    std::string restaurant = cmd.restaurant().empty() ? record.restaurant() : cmd.restaurant();
    validation::require_address(restaurant, "restaurant");
    if (!record.restaurant().empty() && restaurant != record.restaurant()) {
        throw ContractError::unauthorized(
            "order " + std::to_string(cmd.order_id()) + " was escrowed for " + record.restaurant());
    }

    // Compute
    Amount amount = Amount::from_proto(record.amount());
    FeeSplit split = split_fee(amount, state.config->fee_bps());

    auto asset = assets(env, state.config->asset());
    if (!split.fee.is_zero()) {
        transfer(*asset, env.contract_address(), state.config->treasury(), split.fee);
    }
    if (!split.restaurant_share.is_zero()) {
        transfer(*asset, env.contract_address(), restaurant, split.restaurant_share);
    }

    biteledger::log_debug(ESCROW_DOMAIN, "release staged", {
        {"order_id", cmd.order_id()},
        {"restaurant", restaurant},
        {"amount", amount.to_string()},
        {"fee", split.fee.to_string()}
    });

    contracts::FundsReleased event;
    event.set_order_id(cmd.order_id());
    event.set_restaurant(restaurant);
    event.set_treasury(state.config->treasury());
    *event.mutable_amount() = record.amount();
    *event.mutable_fee() = split.fee.to_proto();
    *event.mutable_restaurant_share() = split.restaurant_share.to_proto();
    event.set_settled_at(env.timestamp());
    return event;
}

contracts::FundsRefunded handle_refund(const contracts::RefundFunds& cmd, biteledger::Env& env,
                                       const EscrowState& state, const token::AssetResolver& assets) {
    // Guard
    validation::require_initialized(state.initialized());
    env.require_invoker(state.admin(), "admin");

    // Validate
    auto record = require_escrowed(env, cmd.order_id(), contracts::REFUNDED);

    // Compute
    auto asset = assets(env, state.config->asset());
    transfer(*asset, env.contract_address(), record.payer(), Amount::from_proto(record.amount()));

    contracts::FundsRefunded event;
    event.set_order_id(cmd.order_id());
    event.set_payer(record.payer());
    *event.mutable_amount() = record.amount();
    event.set_settled_at(env.timestamp());
    return event;
}

} // namespace handlers
} // namespace escrow
