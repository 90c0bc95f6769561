#include "escrow.hpp"
#include "../handlers/config_handlers.hpp"
#include "../handlers/escrow_handlers.hpp"

namespace escrow {

using biteledger::Env;

PaymentEscrow::PaymentEscrow(token::AssetResolver assets)
    : router_(KIND, EscrowState::build, EscrowState::apply_event) {
    router_
        .on<contracts::InitializePayment, contracts::PaymentInitialized>(handlers::handle_initialize)
        .on<contracts::EscrowFunds, contracts::FundsEscrowed>(
            [assets](const contracts::EscrowFunds& cmd, Env& env, const EscrowState& state) {
                return handlers::handle_escrow(cmd, env, state, assets);
            })
        .on<contracts::ReleaseFunds, contracts::FundsReleased>(
            [assets](const contracts::ReleaseFunds& cmd, Env& env, const EscrowState& state) {
                return handlers::handle_release(cmd, env, state, assets);
            })
        .on<contracts::RefundFunds, contracts::FundsRefunded>(
            [assets](const contracts::RefundFunds& cmd, Env& env, const EscrowState& state) {
                return handlers::handle_refund(cmd, env, state, assets);
            })
        .on<contracts::SetFeeBps, contracts::PaymentConfigChanged>(handlers::handle_set_fee_bps)
        .on<contracts::SetPaymentAdmin, contracts::PaymentConfigChanged>(handlers::handle_set_admin)
        .on<contracts::SetTreasury, contracts::PaymentConfigChanged>(handlers::handle_set_treasury)
        .on<contracts::SetTrustedCaller, contracts::PaymentConfigChanged>(handlers::handle_set_trusted_caller)
        .view<contracts::GetEscrow, contracts::EscrowRecord>(handlers::query_escrow)
        .view<contracts::GetPaymentConfig, contracts::PaymentConfig>(handlers::query_config);
}

google::protobuf::Any PaymentEscrow::dispatch(const google::protobuf::Any& command, Env& env) {
    return router_.dispatch(command, env);
}

} // namespace escrow
