#include "catalog.hpp"
#include <memory>
#include "escrow.hpp"
#include "order_lifecycle.hpp"
#include "registry.hpp"
#include "token.hpp"

namespace catalog {

void install_contracts(biteledger::Ledger& ledger) {
    ledger.register_kind(std::make_shared<token::LoyaltyToken>());
    ledger.register_kind(token::LoyaltyToken::settlement_asset());
    ledger.register_kind(std::make_shared<registry::RestaurantRegistry>());
    ledger.register_kind(std::make_shared<escrow::PaymentEscrow>());
    ledger.register_kind(std::make_shared<orders::OrderLifecycle>());
}

std::vector<std::string> contract_kinds() {
    return {
        token::LoyaltyToken::KIND,
        token::LoyaltyToken::SETTLEMENT_ASSET_KIND,
        registry::RestaurantRegistry::KIND,
        escrow::PaymentEscrow::KIND,
        orders::OrderLifecycle::KIND,
    };
}

} // namespace catalog
