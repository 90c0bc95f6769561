#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "biteledger/amount.hpp"
#include "biteledger/contract_client.hpp"
#include "contracts/payment_escrow.pb.h"

namespace escrow {

/// Typed in-process access to a payment escrow instance.
class PaymentEscrowClient : public biteledger::ContractClient {
public:
    using ContractClient::ContractClient;

    /// Omitting fee_bps selects the default of 250.
    contracts::PaymentConfig initialize(const std::string& caller, const std::string& admin,
                                        const std::string& treasury,
                                        std::optional<uint32_t> fee_bps, const std::string& asset);
    contracts::FundsEscrowed escrow(const std::string& caller, uint64_t order_id,
                                    const std::string& payer, const biteledger::Amount& amount,
                                    const std::string& restaurant = "");
    contracts::FundsReleased release(const std::string& caller, uint64_t order_id,
                                     const std::string& restaurant);
    contracts::FundsRefunded refund(const std::string& caller, uint64_t order_id);

    void set_fee_bps(const std::string& caller, uint32_t fee_bps);
    void set_admin(const std::string& caller, const std::string& new_admin);
    void set_treasury(const std::string& caller, const std::string& treasury);
    void set_trusted_caller(const std::string& caller, const std::string& trusted_caller);

    contracts::EscrowRecord get_escrow(uint64_t order_id) const;
    contracts::PaymentConfig config() const;
};

} // namespace escrow
