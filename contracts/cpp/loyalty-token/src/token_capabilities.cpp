#include "token_capabilities.hpp"
#include "contracts/token.pb.h"

namespace token {

using biteledger::Amount;

Amount LedgerToken::mint(const std::string& to, const Amount& amount) {
    contracts::Mint cmd;
    cmd.set_to(to);
    *cmd.mutable_amount() = amount.to_proto();
    auto minted = env_.call<contracts::TokensMinted>(address_, cmd);
    return Amount::from_proto(minted.new_balance());
}

void LedgerToken::transfer(const std::string& from, const std::string& to, const Amount& amount) {
    contracts::Transfer cmd;
    cmd.set_from(from);
    cmd.set_to(to);
    *cmd.mutable_amount() = amount.to_proto();
    env_.call<contracts::TokensTransferred>(address_, cmd);
}

Amount LedgerToken::balance_of(const std::string& address) {
    contracts::GetBalance query;
    query.set_address(address);
    auto balance = env_.call<contracts::TokenBalance>(address_, query);
    return Amount::from_proto(balance.amount());
}

MintableTokenResolver ledger_mintable_token() {
    return [](biteledger::Env& env, const std::string& address) -> std::unique_ptr<MintableToken> {
        return std::make_unique<LedgerToken>(env, address);
    };
}

AssetResolver ledger_asset() {
    return [](biteledger::Env& env, const std::string& address) -> std::unique_ptr<TransferableAsset> {
        return std::make_unique<LedgerToken>(env, address);
    };
}

} // namespace token
