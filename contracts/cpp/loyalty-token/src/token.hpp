#pragma once

#include <memory>
#include <string>
#include <vector>
#include "token_state.hpp"
#include "biteledger/contract.hpp"
#include "biteledger/router.hpp"
#include "contracts/token.pb.h"

namespace token {

/// Fungible token with a single minter. Deployed as the BITE loyalty
/// token and, with different metadata, as the settlement asset.
class LoyaltyToken : public biteledger::Contract {
public:
    static constexpr const char* KIND = "loyalty_token";
    static constexpr const char* SETTLEMENT_ASSET_KIND = "settlement_asset";
    static constexpr uint32_t DECIMALS = 7;

    static contracts::TokenMetadata bite_metadata();
    static contracts::TokenMetadata lumens_metadata();

    /// The XLM-denominated base asset that payment escrow moves.
    static std::shared_ptr<LoyaltyToken> settlement_asset();

    explicit LoyaltyToken(std::string kind = KIND,
                          contracts::TokenMetadata metadata = bite_metadata());

    std::string kind() const override { return kind_; }
    std::vector<std::string> entry_points() const override { return router_.entry_points(); }
    google::protobuf::Any dispatch(const google::protobuf::Any& command, biteledger::Env& env) override;

private:
    std::string kind_;
    contracts::TokenMetadata metadata_;
    biteledger::EntryPointRouter<TokenState> router_;
};

} // namespace token
