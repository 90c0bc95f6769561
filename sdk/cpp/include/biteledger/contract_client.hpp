#pragma once

#include <string>
#include <vector>
#include "biteledger/types.pb.h"
#include "helpers.hpp"
#include "ledger.hpp"

namespace biteledger {

/**
 * In-process typed access to one deployed contract instance.
 *
 * Per-contract clients derive from this and expose one method per entry
 * point.
 */
class ContractClient {
public:
    ContractClient(Ledger& ledger, std::string address)
        : ledger_(ledger), address_(std::move(address)) {}

    const std::string& address() const { return address_; }

    /**
     * Invoke a command as caller and commit it.
     * @return The entry point's result unpacked as R
     */
    template<typename R, typename C>
    R execute(const std::string& caller, const C& command,
              const std::vector<std::string>& signers = {}) {
        auto result = ledger_.invoke(invocation(caller, command, signers));
        return helpers::unpack<R>(result.result());
    }

    /**
     * Run a read-only query without committing.
     */
    template<typename R, typename Q>
    R query(const Q& query_message, const std::string& caller = "query") const {
        auto result = ledger_.simulate(invocation(caller, query_message, {}));
        return helpers::unpack<R>(result.result());
    }

protected:
    template<typename C>
    Invocation invocation(const std::string& caller, const C& command,
                          const std::vector<std::string>& signers) const {
        Invocation inv;
        inv.set_caller(caller);
        inv.set_contract(address_);
        *inv.mutable_command() = helpers::pack_any(command);
        for (const auto& signer : signers) {
            inv.add_signers(signer);
        }
        return inv;
    }

    Ledger& ledger_;
    std::string address_;
};

} // namespace biteledger
