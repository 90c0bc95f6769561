#pragma once

#include "token_state.hpp"
#include "biteledger/contract.hpp"
#include "contracts/token.pb.h"

namespace token {
namespace handlers {

/// Handle SetMinter command (admin only).
contracts::MinterChanged handle_set_minter(const contracts::SetMinter& cmd, biteledger::Env& env,
                                           const TokenState& state);

/// Handle SetTokenAdmin command (admin only).
contracts::TokenAdminChanged handle_set_admin(const contracts::SetTokenAdmin& cmd, biteledger::Env& env,
                                              const TokenState& state);

} // namespace handlers
} // namespace token
