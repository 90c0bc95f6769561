#include "order_rules.hpp"

namespace orders {

using biteledger::Amount;

namespace {

struct Transition {
    contracts::OrderStatus from;
    contracts::OrderStatus to;
};

constexpr Transition TRANSITIONS[] = {
    {contracts::PLACED, contracts::CONFIRMED},
    {contracts::CONFIRMED, contracts::PREPARING},
    {contracts::PREPARING, contracts::OUT_FOR_DELIVERY},
    {contracts::OUT_FOR_DELIVERY, contracts::DELIVERED},
    {contracts::PLACED, contracts::CANCELLED},
    {contracts::CONFIRMED, contracts::CANCELLED},
};

} // anonymous namespace

bool transition_allowed(contracts::OrderStatus from, contracts::OrderStatus to) {
    for (const auto& transition : TRANSITIONS) {
        if (transition.from == from && transition.to == to) return true;
    }
    return false;
}

bool is_terminal(contracts::OrderStatus status) {
    return status == contracts::DELIVERED || status == contracts::CANCELLED;
}

Amount bite_reward(const Amount& total_amount) {
    Amount proportional = total_amount / Amount(REWARD_DIVISOR);
    Amount minimum(MIN_BITE_REWARD);
    return proportional > minimum ? proportional : minimum;
}

} // namespace orders
