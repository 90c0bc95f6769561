#pragma once

#include <string>
#include "biteledger/amount.hpp"
#include "biteledger/contract_client.hpp"
#include "contracts/token.pb.h"

namespace token {

/// Typed in-process access to a token instance.
class LoyaltyTokenClient : public biteledger::ContractClient {
public:
    using ContractClient::ContractClient;

    contracts::TokenInitialized initialize(const std::string& caller, const std::string& admin,
                                           const std::string& minter);
    contracts::TokensMinted mint(const std::string& caller, const std::string& to,
                                 const biteledger::Amount& amount);
    contracts::TokensBurned burn(const std::string& caller, const std::string& from,
                                 const biteledger::Amount& amount);
    contracts::TokensTransferred transfer(const std::string& caller, const std::string& from,
                                          const std::string& to, const biteledger::Amount& amount);
    contracts::MinterChanged set_minter(const std::string& caller, const std::string& new_minter);
    contracts::TokenAdminChanged set_admin(const std::string& caller, const std::string& new_admin);

    biteledger::Amount balance_of(const std::string& address) const;
    biteledger::Amount total_supply() const;
    contracts::TokenInfo info() const;
};

} // namespace token
