#include "token.hpp"
#include "../handlers/admin_handler.hpp"
#include "../handlers/initialize_handler.hpp"
#include "../handlers/mint_handler.hpp"
#include "../handlers/query_handler.hpp"
#include "../handlers/transfer_handler.hpp"

namespace token {

contracts::TokenMetadata LoyaltyToken::bite_metadata() {
    contracts::TokenMetadata metadata;
    metadata.set_name("Bite Rewards");
    metadata.set_symbol("BITE");
    metadata.set_decimals(DECIMALS);
    return metadata;
}

contracts::TokenMetadata LoyaltyToken::lumens_metadata() {
    contracts::TokenMetadata metadata;
    metadata.set_name("Lumens");
    metadata.set_symbol("XLM");
    metadata.set_decimals(DECIMALS);
    return metadata;
}

std::shared_ptr<LoyaltyToken> LoyaltyToken::settlement_asset() {
    return std::make_shared<LoyaltyToken>(SETTLEMENT_ASSET_KIND, lumens_metadata());
}

LoyaltyToken::LoyaltyToken(std::string kind, contracts::TokenMetadata metadata)
    : kind_(std::move(kind)),
      metadata_(std::move(metadata)),
      router_(kind_, TokenState::build, TokenState::apply_event) {
    auto initial_metadata = metadata_;
    router_
        .on<contracts::InitializeToken, contracts::TokenInitialized>(
            [initial_metadata](const contracts::InitializeToken& cmd, biteledger::Env& env,
                               const TokenState& state) {
                return handlers::handle_initialize(cmd, env, state, initial_metadata);
            })
        .on<contracts::Mint, contracts::TokensMinted>(handlers::handle_mint)
        .on<contracts::Burn, contracts::TokensBurned>(handlers::handle_burn)
        .on<contracts::Transfer, contracts::TokensTransferred>(handlers::handle_transfer)
        .on<contracts::SetMinter, contracts::MinterChanged>(handlers::handle_set_minter)
        .on<contracts::SetTokenAdmin, contracts::TokenAdminChanged>(handlers::handle_set_admin)
        .view<contracts::GetBalance, contracts::TokenBalance>(handlers::query_balance)
        .view<contracts::GetTokenInfo, contracts::TokenInfo>(handlers::query_info);
}

google::protobuf::Any LoyaltyToken::dispatch(const google::protobuf::Any& command, biteledger::Env& env) {
    return router_.dispatch(command, env);
}

} // namespace token
