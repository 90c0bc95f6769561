#include "biteledger/contract.hpp"
#include "biteledger/ledger.hpp"

namespace biteledger {

Env::Env(Ledger& ledger, Transaction& txn, std::string contract, std::string invoker,
         std::set<std::string> signers, int64_t timestamp)
    : ledger_(ledger),
      txn_(txn),
      storage_(txn, std::move(contract)),
      invoker_(std::move(invoker)),
      signers_(std::move(signers)),
      timestamp_(timestamp) {}

bool Env::is_authorized(const std::string& address) const {
    return !address.empty() && (address == invoker_ || signers_.count(address) > 0);
}

void Env::require_auth(const std::string& address) const {
    if (!is_authorized(address)) {
        throw ContractError::unauthorized("missing authorization of " + address);
    }
}

void Env::require_invoker(const std::string& address, const std::string& role) const {
    if (address.empty() || invoker_ != address) {
        throw ContractError::unauthorized(invoker_ + " is not the " + role);
    }
}

void Env::emit(const google::protobuf::Any& event) {
    txn_.emit(contract_address(), event);
}

google::protobuf::Any Env::invoke(const std::string& contract,
                                  const google::protobuf::Any& command) {
    return ledger_.call(txn_, contract_address(), signers_, timestamp_, contract, command);
}

} // namespace biteledger
