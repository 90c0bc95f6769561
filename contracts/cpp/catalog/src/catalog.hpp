#pragma once

#include <string>
#include <vector>
#include "biteledger/ledger.hpp"

namespace catalog {

/**
 * Register every contract kind of the ordering protocol:
 * loyalty_token, settlement_asset, restaurant_registry, payment_escrow
 * and order_lifecycle.
 */
void install_contracts(biteledger::Ledger& ledger);

/// Kinds registered by install_contracts, in initialization order.
std::vector<std::string> contract_kinds();

} // namespace catalog
