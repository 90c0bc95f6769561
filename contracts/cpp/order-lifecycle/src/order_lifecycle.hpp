#pragma once

#include <string>
#include <vector>
#include "order_state.hpp"
#include "token_capabilities.hpp"
#include "biteledger/contract.hpp"
#include "biteledger/router.hpp"

namespace orders {

/// Order state machine that mints the BITE reward on delivery.
class OrderLifecycle : public biteledger::Contract {
public:
    static constexpr const char* KIND = "order_lifecycle";

    /// @param tokens Resolves the configured loyalty token to a mint capability
    explicit OrderLifecycle(token::MintableTokenResolver tokens = token::ledger_mintable_token());

    std::string kind() const override { return KIND; }
    std::vector<std::string> entry_points() const override { return router_.entry_points(); }
    google::protobuf::Any dispatch(const google::protobuf::Any& command, biteledger::Env& env) override;

private:
    biteledger::EntryPointRouter<OrderState> router_;
};

} // namespace orders
