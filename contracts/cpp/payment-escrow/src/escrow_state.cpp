#include "escrow_state.hpp"
#include "biteledger/helpers.hpp"

namespace escrow {

using biteledger::ContractStorage;
namespace helpers = biteledger::helpers;

bool EscrowState::may_release(const std::string& invoker) const {
    if (invoker == config->admin()) return true;
    return !config->trusted_caller().empty() && invoker == config->trusted_caller();
}

EscrowState EscrowState::build(const ContractStorage& storage) {
    EscrowState state;
    state.config = storage.get<contracts::PaymentConfig>(keys::CONFIG);
    return state;
}

std::optional<contracts::EscrowRecord> EscrowState::find(const ContractStorage& storage,
                                                         uint64_t order_id) {
    return storage.get<contracts::EscrowRecord>(helpers::record_key(keys::ESCROW, order_id));
}

void EscrowState::apply_event(ContractStorage& storage, const google::protobuf::Any& event_any) {
    if (helpers::is_a<contracts::PaymentInitialized>(event_any)) {
        auto event = helpers::unpack<contracts::PaymentInitialized>(event_any);
        storage.put(keys::CONFIG, event.config());
    } else if (helpers::is_a<contracts::PaymentConfigChanged>(event_any)) {
        auto event = helpers::unpack<contracts::PaymentConfigChanged>(event_any);
        storage.put(keys::CONFIG, event.config());
    } else if (helpers::is_a<contracts::FundsEscrowed>(event_any)) {
        auto event = helpers::unpack<contracts::FundsEscrowed>(event_any);
        contracts::EscrowRecord record;
        record.set_order_id(event.order_id());
        record.set_payer(event.payer());
        record.set_restaurant(event.restaurant());
        *record.mutable_amount() = event.amount();
        record.set_status(contracts::ESCROWED);
        record.set_created_at(event.created_at());
        storage.put(helpers::record_key(keys::ESCROW, event.order_id()), record);
    } else if (helpers::is_a<contracts::FundsReleased>(event_any)) {
        auto event = helpers::unpack<contracts::FundsReleased>(event_any);
        auto record = find(storage, event.order_id()).value();
        record.set_restaurant(event.restaurant());
        *record.mutable_fee_amount() = event.fee();
        record.set_status(contracts::RELEASED);
        record.set_settled_at(event.settled_at());
        storage.put(helpers::record_key(keys::ESCROW, event.order_id()), record);
    } else if (helpers::is_a<contracts::FundsRefunded>(event_any)) {
        auto event = helpers::unpack<contracts::FundsRefunded>(event_any);
        auto record = find(storage, event.order_id()).value();
        record.set_status(contracts::REFUNDED);
        record.set_settled_at(event.settled_at());
        storage.put(helpers::record_key(keys::ESCROW, event.order_id()), record);
    }
}

} // namespace escrow
