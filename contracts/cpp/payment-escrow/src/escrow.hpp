#pragma once

#include <string>
#include <vector>
#include "escrow_state.hpp"
#include "token_capabilities.hpp"
#include "biteledger/contract.hpp"
#include "biteledger/router.hpp"

namespace escrow {

/// Per-order escrow of the settlement asset with fee-split release and
/// full refund.
class PaymentEscrow : public biteledger::Contract {
public:
    static constexpr const char* KIND = "payment_escrow";

    explicit PaymentEscrow(token::AssetResolver assets = token::ledger_asset());

    std::string kind() const override { return KIND; }
    std::vector<std::string> entry_points() const override { return router_.entry_points(); }
    google::protobuf::Any dispatch(const google::protobuf::Any& command, biteledger::Env& env) override;

private:
    biteledger::EntryPointRouter<EscrowState> router_;
};

} // namespace escrow
