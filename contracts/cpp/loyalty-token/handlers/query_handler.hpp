#pragma once

#include "token_state.hpp"
#include "biteledger/contract.hpp"
#include "contracts/token.pb.h"

namespace token {
namespace handlers {

/// Balance of an address. Never fails.
contracts::TokenBalance query_balance(const contracts::GetBalance& query, const biteledger::Env& env,
                                      const TokenState& state);

/// Metadata, roles and total supply.
contracts::TokenInfo query_info(const contracts::GetTokenInfo& query, const biteledger::Env& env,
                                const TokenState& state);

} // namespace handlers
} // namespace token
