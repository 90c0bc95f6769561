#include "token_client.hpp"

namespace token {

using biteledger::Amount;

contracts::TokenInitialized LoyaltyTokenClient::initialize(const std::string& caller,
                                                           const std::string& admin,
                                                           const std::string& minter) {
    contracts::InitializeToken cmd;
    cmd.set_admin(admin);
    cmd.set_minter(minter);
    return execute<contracts::TokenInitialized>(caller, cmd);
}

contracts::TokensMinted LoyaltyTokenClient::mint(const std::string& caller, const std::string& to,
                                                 const Amount& amount) {
    contracts::Mint cmd;
    cmd.set_to(to);
    *cmd.mutable_amount() = amount.to_proto();
    return execute<contracts::TokensMinted>(caller, cmd);
}

contracts::TokensBurned LoyaltyTokenClient::burn(const std::string& caller, const std::string& from,
                                                 const Amount& amount) {
    contracts::Burn cmd;
    cmd.set_from(from);
    *cmd.mutable_amount() = amount.to_proto();
    return execute<contracts::TokensBurned>(caller, cmd);
}

contracts::TokensTransferred LoyaltyTokenClient::transfer(const std::string& caller,
                                                          const std::string& from,
                                                          const std::string& to,
                                                          const Amount& amount) {
    contracts::Transfer cmd;
    cmd.set_from(from);
    cmd.set_to(to);
    *cmd.mutable_amount() = amount.to_proto();
    return execute<contracts::TokensTransferred>(caller, cmd);
}

contracts::MinterChanged LoyaltyTokenClient::set_minter(const std::string& caller,
                                                        const std::string& new_minter) {
    contracts::SetMinter cmd;
    cmd.set_new_minter(new_minter);
    return execute<contracts::MinterChanged>(caller, cmd);
}

contracts::TokenAdminChanged LoyaltyTokenClient::set_admin(const std::string& caller,
                                                           const std::string& new_admin) {
    contracts::SetTokenAdmin cmd;
    cmd.set_new_admin(new_admin);
    return execute<contracts::TokenAdminChanged>(caller, cmd);
}

Amount LoyaltyTokenClient::balance_of(const std::string& address) const {
    contracts::GetBalance query_message;
    query_message.set_address(address);
    return Amount::from_proto(query<contracts::TokenBalance>(query_message).amount());
}

Amount LoyaltyTokenClient::total_supply() const {
    return Amount::from_proto(info().total_supply());
}

contracts::TokenInfo LoyaltyTokenClient::info() const {
    return query<contracts::TokenInfo>(contracts::GetTokenInfo());
}

} // namespace token
