#pragma once

#include "token_state.hpp"
#include "biteledger/contract.hpp"
#include "contracts/token.pb.h"

namespace token {
namespace handlers {

/// Handle InitializeToken command.
contracts::TokenInitialized handle_initialize(const contracts::InitializeToken& cmd,
                                              biteledger::Env& env, const TokenState& state,
                                              const contracts::TokenMetadata& metadata);

} // namespace handlers
} // namespace token
