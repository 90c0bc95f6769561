#pragma once

#include <functional>
#include <memory>
#include <string>
#include "biteledger/amount.hpp"
#include "biteledger/contract.hpp"

namespace token {

/**
 * A token the caller can mint on. The calling contract must be the
 * token's minter.
 */
class MintableToken {
public:
    virtual ~MintableToken() = default;

    /// Mint amount to an address and return its new balance.
    virtual biteledger::Amount mint(const std::string& to, const biteledger::Amount& amount) = 0;
};

/**
 * An asset the caller can move balances of.
 */
class TransferableAsset {
public:
    virtual ~TransferableAsset() = default;

    virtual void transfer(const std::string& from, const std::string& to,
                          const biteledger::Amount& amount) = 0;
    virtual biteledger::Amount balance_of(const std::string& address) = 0;
};

/**
 * Token contract reached through a nested ledger call.
 */
class LedgerToken : public MintableToken, public TransferableAsset {
public:
    LedgerToken(biteledger::Env& env, std::string address)
        : env_(env), address_(std::move(address)) {}

    biteledger::Amount mint(const std::string& to, const biteledger::Amount& amount) override;
    void transfer(const std::string& from, const std::string& to,
                  const biteledger::Amount& amount) override;
    biteledger::Amount balance_of(const std::string& address) override;

private:
    biteledger::Env& env_;
    std::string address_;
};

using MintableTokenResolver =
    std::function<std::unique_ptr<MintableToken>(biteledger::Env&, const std::string& address)>;
using AssetResolver =
    std::function<std::unique_ptr<TransferableAsset>(biteledger::Env&, const std::string& address)>;

/// Resolve token addresses to deployed ledger contracts.
MintableTokenResolver ledger_mintable_token();
AssetResolver ledger_asset();

} // namespace token
