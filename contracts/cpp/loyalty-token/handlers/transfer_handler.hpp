#pragma once

#include "token_state.hpp"
#include "biteledger/contract.hpp"
#include "contracts/token.pb.h"

namespace token {
namespace handlers {

/// Handle Transfer command.
contracts::TokensTransferred handle_transfer(const contracts::Transfer& cmd, biteledger::Env& env,
                                             const TokenState& state);

} // namespace handlers
} // namespace token
