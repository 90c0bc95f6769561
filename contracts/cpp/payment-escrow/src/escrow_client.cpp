#include "escrow_client.hpp"

namespace escrow {

using biteledger::Amount;

contracts::PaymentConfig PaymentEscrowClient::initialize(const std::string& caller,
                                                         const std::string& admin,
                                                         const std::string& treasury,
                                                         std::optional<uint32_t> fee_bps,
                                                         const std::string& asset) {
    contracts::InitializePayment cmd;
    cmd.set_admin(admin);
    cmd.set_treasury(treasury);
    if (fee_bps) {
        cmd.set_fee_bps(*fee_bps);
    }
    cmd.set_asset(asset);
    return execute<contracts::PaymentInitialized>(caller, cmd).config();
}

contracts::FundsEscrowed PaymentEscrowClient::escrow(const std::string& caller, uint64_t order_id,
                                                     const std::string& payer, const Amount& amount,
                                                     const std::string& restaurant) {
    contracts::EscrowFunds cmd;
    cmd.set_order_id(order_id);
    cmd.set_payer(payer);
    *cmd.mutable_amount() = amount.to_proto();
    cmd.set_restaurant(restaurant);
    return execute<contracts::FundsEscrowed>(caller, cmd);
}

contracts::FundsReleased PaymentEscrowClient::release(const std::string& caller, uint64_t order_id,
                                                      const std::string& restaurant) {
    contracts::ReleaseFunds cmd;
    cmd.set_order_id(order_id);
    cmd.set_restaurant(restaurant);
    return execute<contracts::FundsReleased>(caller, cmd);
}

contracts::FundsRefunded PaymentEscrowClient::refund(const std::string& caller, uint64_t order_id) {
    contracts::RefundFunds cmd;
    cmd.set_order_id(order_id);
    return execute<contracts::FundsRefunded>(caller, cmd);
}

void PaymentEscrowClient::set_fee_bps(const std::string& caller, uint32_t fee_bps) {
    contracts::SetFeeBps cmd;
    cmd.set_fee_bps(fee_bps);
    execute<contracts::PaymentConfigChanged>(caller, cmd);
}

void PaymentEscrowClient::set_admin(const std::string& caller, const std::string& new_admin) {
    contracts::SetPaymentAdmin cmd;
    cmd.set_new_admin(new_admin);
    execute<contracts::PaymentConfigChanged>(caller, cmd);
}

void PaymentEscrowClient::set_treasury(const std::string& caller, const std::string& treasury) {
    contracts::SetTreasury cmd;
    cmd.set_treasury(treasury);
    execute<contracts::PaymentConfigChanged>(caller, cmd);
}

void PaymentEscrowClient::set_trusted_caller(const std::string& caller,
                                             const std::string& trusted_caller) {
    contracts::SetTrustedCaller cmd;
    cmd.set_trusted_caller(trusted_caller);
    execute<contracts::PaymentConfigChanged>(caller, cmd);
}

contracts::EscrowRecord PaymentEscrowClient::get_escrow(uint64_t order_id) const {
    contracts::GetEscrow query_message;
    query_message.set_order_id(order_id);
    return query<contracts::EscrowRecord>(query_message);
}

contracts::PaymentConfig PaymentEscrowClient::config() const {
    return query<contracts::PaymentConfig>(contracts::GetPaymentConfig());
}

} // namespace escrow
