#pragma once

#include "escrow_state.hpp"
#include "biteledger/contract.hpp"
#include "contracts/payment_escrow.pb.h"

namespace escrow {
namespace handlers {

// Admin-only configuration updates.

contracts::PaymentConfigChanged handle_set_fee_bps(const contracts::SetFeeBps& cmd,
                                                   biteledger::Env& env, const EscrowState& state);

contracts::PaymentConfigChanged handle_set_admin(const contracts::SetPaymentAdmin& cmd,
                                                 biteledger::Env& env, const EscrowState& state);

contracts::PaymentConfigChanged handle_set_treasury(const contracts::SetTreasury& cmd,
                                                    biteledger::Env& env, const EscrowState& state);

contracts::PaymentConfigChanged handle_set_trusted_caller(const contracts::SetTrustedCaller& cmd,
                                                          biteledger::Env& env,
                                                          const EscrowState& state);

contracts::EscrowRecord query_escrow(const contracts::GetEscrow& query, const biteledger::Env& env,
                                     const EscrowState& state);

contracts::PaymentConfig query_config(const contracts::GetPaymentConfig& query,
                                      const biteledger::Env& env, const EscrowState& state);

} // namespace handlers
} // namespace escrow
