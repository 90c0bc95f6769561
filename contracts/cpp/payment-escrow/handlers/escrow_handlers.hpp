#pragma once

#include "escrow_state.hpp"
#include "token_capabilities.hpp"
#include "biteledger/contract.hpp"
#include "contracts/payment_escrow.pb.h"

namespace escrow {
namespace handlers {

contracts::PaymentInitialized handle_initialize(const contracts::InitializePayment& cmd,
                                                biteledger::Env& env, const EscrowState& state);

/// Move the payer's funds into the escrow contract's custody.
contracts::FundsEscrowed handle_escrow(const contracts::EscrowFunds& cmd, biteledger::Env& env,
                                       const EscrowState& state, const token::AssetResolver& assets);

/// Pay out an escrow: fee to the treasury, the rest to the restaurant.
contracts::FundsReleased handle_release(const contracts::ReleaseFunds& cmd, biteledger::Env& env,
                                        const EscrowState& state, const token::AssetResolver& assets);

/// Return the full escrowed amount to the payer.
contracts::FundsRefunded handle_refund(const contracts::RefundFunds& cmd, biteledger::Env& env,
                                       const EscrowState& state, const token::AssetResolver& assets);

} // namespace handlers
} // namespace escrow
