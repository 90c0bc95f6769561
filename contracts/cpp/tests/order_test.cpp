#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "biteledger/errors.hpp"
#include "biteledger/ledger.hpp"
#include "order_client.hpp"
#include "order_lifecycle.hpp"
#include "protocol_fixture.hpp"
#include "registry.hpp"
#include "registry_client.hpp"
#include "token_capabilities.hpp"

using biteledger::Amount;
using biteledger::ContractError;
using biteledger::ErrorKind;

// =============================================================================
// Recording Token
// =============================================================================

struct MintLog {
    std::vector<std::pair<std::string, Amount>> mints;
    bool refuse = false;
};

class RecordingToken : public token::MintableToken {
public:
    explicit RecordingToken(std::shared_ptr<MintLog> log) : log_(std::move(log)) {}

    Amount mint(const std::string& to, const Amount& amount) override {
        if (log_->refuse) {
            throw ContractError::unauthorized("minting refused");
        }
        log_->mints.emplace_back(to, amount);
        return amount;
    }

private:
    std::shared_ptr<MintLog> log_;
};

class OrderTest : public ::testing::Test {
protected:
    static constexpr const char* ADMIN = "admin";
    static constexpr const char* CUSTOMER = "customer";
    static constexpr const char* COURIER = "courier";
    static constexpr const char* BITE = "bite-token";

    OrderTest()
        : log_(std::make_shared<MintLog>()),
          ledger_(std::make_unique<biteledger::MemoryKeyValueStore>(), [] { return LEDGER_TIME; }),
          orders_(ledger_, deploy_orders()),
          registry_(ledger_, ledger_.deploy(registry::RestaurantRegistry::KIND)) {}

    void SetUp() override {
        orders_.initialize(ADMIN, ADMIN, BITE, true);
        registry_.initialize(ADMIN, ADMIN);
    }

    std::string deploy_orders() {
        auto log = log_;
        ledger_.register_kind(std::make_shared<orders::OrderLifecycle>(
            [log](biteledger::Env&, const std::string&) -> std::unique_ptr<token::MintableToken> {
                return std::make_unique<RecordingToken>(log);
            }));
        ledger_.register_kind(std::make_shared<registry::RestaurantRegistry>());
        return ledger_.deploy(orders::OrderLifecycle::KIND);
    }

    uint64_t place(uint64_t total = 1'000'000, uint64_t restaurant_id = 1) {
        return orders_.place_order(CUSTOMER, CUSTOMER, restaurant_id, Amount(total));
    }

    void advance_to(uint64_t id, contracts::OrderStatus target) {
        for (auto status : {contracts::CONFIRMED, contracts::PREPARING,
                            contracts::OUT_FOR_DELIVERY, contracts::DELIVERED}) {
            orders_.advance_status(ADMIN, id, status);
            if (status == target) return;
        }
    }

    static contracts::OrderItem item(uint64_t menu_item_id, uint32_t quantity, uint64_t unit_price) {
        contracts::OrderItem result;
        result.set_menu_item_id(menu_item_id);
        result.set_name("item " + std::to_string(menu_item_id));
        result.set_quantity(quantity);
        *result.mutable_unit_price() = Amount(unit_price).to_proto();
        return result;
    }

    std::shared_ptr<MintLog> log_;
    biteledger::Ledger ledger_;
    orders::OrderLifecycleClient orders_;
    registry::RestaurantRegistryClient registry_;
};

// =============================================================================
// Placement Tests
// =============================================================================

TEST_F(OrderTest, PlaceOrder_ShouldRecordPlacedOrderAndIndexes) {
    // When the customer places two orders
    auto first = place(1'000'000, 3);
    auto second = place(2'000'000, 4);

    // Then ids count up from 1
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);

    // And the order starts placed without a reward
    auto order = orders_.get_order(first);
    EXPECT_EQ(order.status(), contracts::PLACED);
    EXPECT_EQ(order.customer(), CUSTOMER);
    EXPECT_EQ(order.restaurant_id(), 3u);
    EXPECT_FALSE(order.reward_minted());
    EXPECT_EQ(order.created_at(), LEDGER_TIME);

    // And both indexes list the orders
    EXPECT_EQ(orders_.orders_by_customer(CUSTOMER), (std::vector<uint64_t>{1, 2}));
    EXPECT_EQ(orders_.orders_by_restaurant(4), (std::vector<uint64_t>{2}));
    EXPECT_TRUE(orders_.orders_by_restaurant(99).empty());
}

TEST_F(OrderTest, PlaceOrder_ForAnotherCustomer_ShouldBeUnauthorized) {
    EXPECT_EQ(rejection_kind([&] { orders_.place_order(COURIER, CUSTOMER, 1, Amount(10)); }),
              ErrorKind::Unauthorized);
}

TEST_F(OrderTest, PlaceOrder_ZeroTotal_ShouldBeInvalidAmount) {
    EXPECT_EQ(rejection_kind([&] { place(0); }), ErrorKind::InvalidAmount);
}

TEST_F(OrderTest, PlaceOrder_RestaurantZero_ShouldBeNotFound) {
    EXPECT_EQ(rejection_kind([&] { place(100, 0); }), ErrorKind::NotFound);
}

TEST_F(OrderTest, PlaceOrder_ItemsMatchingTotal_ShouldBeStored) {
    auto id = orders_.place_order(CUSTOMER, CUSTOMER, 1, Amount(700),
                                  {item(1, 2, 200), item(2, 1, 300)}, "no onions");

    auto order = orders_.get_order(id);
    EXPECT_EQ(order.items_size(), 2);
    EXPECT_EQ(order.notes(), "no onions");
}

TEST_F(OrderTest, PlaceOrder_ItemsNotMatchingTotal_ShouldBeInvalidAmount) {
    EXPECT_EQ(rejection_kind([&] {
        orders_.place_order(CUSTOMER, CUSTOMER, 1, Amount(701), {item(1, 2, 200), item(2, 1, 300)});
    }), ErrorKind::InvalidAmount);
    EXPECT_EQ(rejection_kind([&] {
        orders_.place_order(CUSTOMER, CUSTOMER, 1, Amount(200), {item(1, 0, 200)});
    }), ErrorKind::InvalidAmount);
}

TEST_F(OrderTest, PlaceOrder_WithRegistry_ShouldRequireActiveRestaurant) {
    // Given a registry with one restaurant
    orders_.set_restaurant_registry(ADMIN, registry_.address());
    auto restaurant = registry_.register_restaurant(ADMIN, "owner", "");

    // Then unknown restaurants are not found
    EXPECT_EQ(rejection_kind([&] { place(100, restaurant + 1); }), ErrorKind::NotFound);

    // And active ones accept orders
    EXPECT_NO_THROW(place(100, restaurant));

    // And inactive ones reject them
    registry_.deactivate(ADMIN, restaurant);
    EXPECT_EQ(rejection_kind([&] { place(100, restaurant); }), ErrorKind::InvalidState);
}

// =============================================================================
// Status Tests
// =============================================================================

TEST_F(OrderTest, AdvanceStatus_FullPath_ShouldMintRewardOnceOnDelivery) {
    auto id = place(200'000'000'000);

    advance_to(id, contracts::OUT_FOR_DELIVERY);
    EXPECT_TRUE(log_->mints.empty());

    auto delivered = orders_.advance_status(ADMIN, id, contracts::DELIVERED);

    EXPECT_TRUE(delivered.reward_minted());
    EXPECT_EQ(Amount::from_proto(delivered.bite_reward()), Amount(20'000'000));
    ASSERT_EQ(log_->mints.size(), 1u);
    EXPECT_EQ(log_->mints[0].first, CUSTOMER);
    EXPECT_EQ(log_->mints[0].second, Amount(20'000'000));

    auto order = orders_.get_order(id);
    EXPECT_EQ(order.status(), contracts::DELIVERED);
    EXPECT_TRUE(order.reward_minted());

    // A delivered order is closed
    EXPECT_EQ(rejection_kind([&] { orders_.advance_status(ADMIN, id, contracts::DELIVERED); }),
              ErrorKind::OrderClosed);
    EXPECT_EQ(log_->mints.size(), 1u);
}

TEST_F(OrderTest, AdvanceStatus_SkippingAStep_ShouldBeInvalidTransition) {
    auto id = place();
    EXPECT_EQ(rejection_kind([&] { orders_.advance_status(ADMIN, id, contracts::PREPARING); }),
              ErrorKind::InvalidTransition);
    EXPECT_EQ(orders_.get_order(id).status(), contracts::PLACED);
}

TEST_F(OrderTest, AdvanceStatus_ToCancelled_ShouldBeInvalidTransition) {
    auto id = place();
    EXPECT_EQ(rejection_kind([&] { orders_.advance_status(ADMIN, id, contracts::CANCELLED); }),
              ErrorKind::InvalidTransition);
}

TEST_F(OrderTest, AdvanceStatus_ByCustomer_ShouldBeUnauthorized) {
    auto id = place();
    EXPECT_EQ(rejection_kind([&] { orders_.advance_status(CUSTOMER, id, contracts::CONFIRMED); }),
              ErrorKind::Unauthorized);
}

TEST_F(OrderTest, AdvanceStatus_ByOperator_ShouldFollowGrant) {
    auto id = place();

    orders_.set_operator(ADMIN, COURIER, true);
    orders_.advance_status(COURIER, id, contracts::CONFIRMED);
    EXPECT_EQ(orders_.get_order(id).status(), contracts::CONFIRMED);

    orders_.set_operator(ADMIN, COURIER, false);
    EXPECT_EQ(rejection_kind([&] { orders_.advance_status(COURIER, id, contracts::PREPARING); }),
              ErrorKind::Unauthorized);
}

TEST_F(OrderTest, AdvanceStatus_RewardsDisabled_ShouldNotMint) {
    orders_.set_rewards_enabled(ADMIN, false);
    auto id = place();

    advance_to(id, contracts::DELIVERED);

    EXPECT_TRUE(log_->mints.empty());
    EXPECT_FALSE(orders_.get_order(id).reward_minted());
}

TEST_F(OrderTest, AdvanceStatus_MintRefused_ShouldLeaveOrderOutForDelivery) {
    // Given an order waiting for delivery and a token that refuses to mint
    auto id = place();
    advance_to(id, contracts::OUT_FOR_DELIVERY);
    log_->refuse = true;

    // When delivery is recorded, the mint failure aborts it
    EXPECT_EQ(rejection_kind([&] { orders_.advance_status(ADMIN, id, contracts::DELIVERED); }),
              ErrorKind::Unauthorized);

    // Then the order is unchanged and delivery can be retried
    EXPECT_EQ(orders_.get_order(id).status(), contracts::OUT_FOR_DELIVERY);
    log_->refuse = false;
    EXPECT_TRUE(orders_.advance_status(ADMIN, id, contracts::DELIVERED).reward_minted());
}

TEST_F(OrderTest, AdvanceStatus_UnknownOrder_ShouldBeNotFound) {
    EXPECT_EQ(rejection_kind([&] { orders_.advance_status(ADMIN, 5, contracts::CONFIRMED); }),
              ErrorKind::NotFound);
}

// =============================================================================
// Cancellation Tests
// =============================================================================

TEST_F(OrderTest, Cancel_ByCustomerWhilePlaced_ShouldCancel) {
    auto id = place();

    auto cancelled = orders_.cancel(CUSTOMER, id);

    EXPECT_EQ(cancelled.from(), contracts::PLACED);
    EXPECT_EQ(cancelled.cancelled_by(), CUSTOMER);
    EXPECT_EQ(orders_.get_order(id).status(), contracts::CANCELLED);
}

TEST_F(OrderTest, Cancel_ByCustomerAfterConfirmation_ShouldBeUnauthorized) {
    auto id = place();
    orders_.advance_status(ADMIN, id, contracts::CONFIRMED);

    EXPECT_EQ(rejection_kind([&] { orders_.cancel(CUSTOMER, id); }), ErrorKind::Unauthorized);

    // The admin may still cancel a confirmed order
    orders_.cancel(ADMIN, id);
    EXPECT_EQ(orders_.get_order(id).status(), contracts::CANCELLED);
}

TEST_F(OrderTest, Cancel_WhilePreparing_ShouldBeInvalidTransition) {
    auto id = place();
    advance_to(id, contracts::PREPARING);

    EXPECT_EQ(rejection_kind([&] { orders_.cancel(ADMIN, id); }), ErrorKind::InvalidTransition);
}

TEST_F(OrderTest, Cancel_ByStranger_ShouldBeUnauthorized) {
    auto id = place();
    EXPECT_EQ(rejection_kind([&] { orders_.cancel(COURIER, id); }), ErrorKind::Unauthorized);
}

TEST_F(OrderTest, Cancel_Twice_ShouldBeInvalidTransition) {
    auto id = place();
    orders_.cancel(CUSTOMER, id);

    EXPECT_EQ(rejection_kind([&] { orders_.cancel(ADMIN, id); }), ErrorKind::InvalidTransition);
    EXPECT_EQ(rejection_kind([&] { orders_.advance_status(ADMIN, id, contracts::CONFIRMED); }),
              ErrorKind::OrderClosed);
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_F(OrderTest, SetAdmin_ShouldMoveAdministration) {
    orders_.set_admin(ADMIN, "new-admin");

    EXPECT_EQ(orders_.config().admin(), "new-admin");
    EXPECT_EQ(rejection_kind([&] { orders_.set_rewards_enabled(ADMIN, false); }), ErrorKind::Unauthorized);
}

TEST_F(OrderTest, Initialize_Twice_ShouldBeAlreadyInitialized) {
    EXPECT_EQ(rejection_kind([&] { orders_.initialize(ADMIN, ADMIN, BITE, true); }),
              ErrorKind::AlreadyInitialized);
}
