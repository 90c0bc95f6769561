#pragma once

#include <optional>
#include <string>
#include <google/protobuf/any.pb.h>
#include "biteledger/amount.hpp"
#include "biteledger/contract.hpp"
#include "contracts/token.pb.h"

namespace token {

namespace keys {
constexpr const char* CONFIG = "config";
constexpr const char* SUPPLY = "supply";
constexpr const char* BALANCE = "balance";
} // namespace keys

/// Token instance state: singleton config and supply. Balances are read
/// on demand with balance_of().
struct TokenState {
    std::optional<contracts::TokenConfig> config;
    biteledger::Amount total_supply;

    bool initialized() const { return config.has_value(); }
    const std::string& admin() const { return config->admin(); }
    const std::string& minter() const { return config->minter(); }

    /// Load singleton state from the instance's storage.
    static TokenState build(const biteledger::ContractStorage& storage);

    /// Balance of an address; zero when it never held tokens.
    static biteledger::Amount balance_of(const biteledger::ContractStorage& storage,
                                         const std::string& address);

    /// Apply a single event to storage.
    static void apply_event(biteledger::ContractStorage& storage,
                            const google::protobuf::Any& event_any);
};

} // namespace token
