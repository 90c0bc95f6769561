#pragma once

#include <cstdint>
#include <optional>
#include <google/protobuf/any.pb.h>
#include "biteledger/contract.hpp"
#include "contracts/payment_escrow.pb.h"

namespace escrow {

namespace keys {
constexpr const char* CONFIG = "config";
constexpr const char* ESCROW = "escrow";
} // namespace keys

/// Payment escrow instance state.
struct EscrowState {
    std::optional<contracts::PaymentConfig> config;

    bool initialized() const { return config.has_value(); }
    const std::string& admin() const { return config->admin(); }

    /// Admin, or the trusted caller when one is configured.
    bool may_release(const std::string& invoker) const;

    static EscrowState build(const biteledger::ContractStorage& storage);

    static std::optional<contracts::EscrowRecord> find(const biteledger::ContractStorage& storage,
                                                       uint64_t order_id);

    static void apply_event(biteledger::ContractStorage& storage,
                            const google::protobuf::Any& event_any);
};

} // namespace escrow
