#include "token_state.hpp"
#include "biteledger/helpers.hpp"

namespace token {

using biteledger::Amount;
using biteledger::ContractStorage;
namespace helpers = biteledger::helpers;

namespace {

void put_balance(ContractStorage& storage, const std::string& address,
                 const biteledger::U128& amount) {
    contracts::TokenBalance balance;
    balance.set_address(address);
    *balance.mutable_amount() = amount;
    storage.put(helpers::address_key(keys::BALANCE, address), balance);
}

void put_supply(ContractStorage& storage, const biteledger::U128& total) {
    contracts::TokenSupply supply;
    *supply.mutable_total() = total;
    storage.put(keys::SUPPLY, supply);
}

} // anonymous namespace

TokenState TokenState::build(const ContractStorage& storage) {
    TokenState state;
    state.config = storage.get<contracts::TokenConfig>(keys::CONFIG);
    if (auto supply = storage.get<contracts::TokenSupply>(keys::SUPPLY)) {
        state.total_supply = Amount::from_proto(supply->total());
    }
    return state;
}

Amount TokenState::balance_of(const ContractStorage& storage, const std::string& address) {
    auto balance = storage.get<contracts::TokenBalance>(helpers::address_key(keys::BALANCE, address));
    return balance ? Amount::from_proto(balance->amount()) : Amount();
}

void TokenState::apply_event(ContractStorage& storage, const google::protobuf::Any& event_any) {
    if (helpers::is_a<contracts::TokenInitialized>(event_any)) {
        auto event = helpers::unpack<contracts::TokenInitialized>(event_any);
        contracts::TokenConfig config;
        config.set_admin(event.admin());
        config.set_minter(event.minter());
        *config.mutable_metadata() = event.metadata();
        storage.put(keys::CONFIG, config);
        put_supply(storage, Amount().to_proto());
    } else if (helpers::is_a<contracts::TokensMinted>(event_any)) {
        auto event = helpers::unpack<contracts::TokensMinted>(event_any);
        put_balance(storage, event.to(), event.new_balance());
        put_supply(storage, event.new_total_supply());
    } else if (helpers::is_a<contracts::TokensBurned>(event_any)) {
        auto event = helpers::unpack<contracts::TokensBurned>(event_any);
        put_balance(storage, event.from(), event.new_balance());
        put_supply(storage, event.new_total_supply());
    } else if (helpers::is_a<contracts::TokensTransferred>(event_any)) {
        auto event = helpers::unpack<contracts::TokensTransferred>(event_any);
        put_balance(storage, event.from(), event.from_balance());
        put_balance(storage, event.to(), event.to_balance());
    } else if (helpers::is_a<contracts::MinterChanged>(event_any)) {
        auto event = helpers::unpack<contracts::MinterChanged>(event_any);
        auto config = storage.get<contracts::TokenConfig>(keys::CONFIG).value();
        config.set_minter(event.minter());
        storage.put(keys::CONFIG, config);
    } else if (helpers::is_a<contracts::TokenAdminChanged>(event_any)) {
        auto event = helpers::unpack<contracts::TokenAdminChanged>(event_any);
        auto config = storage.get<contracts::TokenConfig>(keys::CONFIG).value();
        config.set_admin(event.admin());
        storage.put(keys::CONFIG, config);
    }
}

} // namespace token
