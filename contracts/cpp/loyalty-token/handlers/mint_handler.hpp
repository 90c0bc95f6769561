#pragma once

#include "token_state.hpp"
#include "biteledger/contract.hpp"
#include "contracts/token.pb.h"

namespace token {
namespace handlers {

/// Handle Mint command. Only the minter may mint.
contracts::TokensMinted handle_mint(const contracts::Mint& cmd, biteledger::Env& env,
                                    const TokenState& state);

/// Handle Burn command. Requires authorization of the holder.
contracts::TokensBurned handle_burn(const contracts::Burn& cmd, biteledger::Env& env,
                                    const TokenState& state);

} // namespace handlers
} // namespace token
