#include <gtest/gtest.h>
#include "protocol_fixture.hpp"

using biteledger::ErrorKind;

using RegistryTest = ProtocolFixture;

// =============================================================================
// Registration Tests
// =============================================================================

TEST_F(RegistryTest, Register_ShouldAssignMonotonicIdsFromOne) {
    // When the admin registers two restaurants
    auto first = registry_.register_restaurant(ADMIN, OWNER, "{\"name\":\"Tacos\"}");
    auto second = registry_.register_restaurant(ADMIN, "other-owner", "");

    // Then ids count up from 1
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    EXPECT_EQ(registry_.count(), 2u);

    // And the stored record is active with the ledger time
    auto restaurant = registry_.get(first);
    EXPECT_EQ(restaurant.owner(), OWNER);
    EXPECT_EQ(restaurant.metadata(), "{\"name\":\"Tacos\"}");
    EXPECT_TRUE(restaurant.active());
    EXPECT_EQ(restaurant.created_at(), LEDGER_TIME);
}

TEST_F(RegistryTest, Register_ByStranger_ShouldBeUnauthorized) {
    EXPECT_EQ(rejection_kind([&] { registry_.register_restaurant(OWNER, OWNER, ""); }),
              ErrorKind::Unauthorized);
    EXPECT_EQ(registry_.count(), 0u);
}

TEST_F(RegistryTest, Get_UnknownId_ShouldBeNotFound) {
    EXPECT_EQ(rejection_kind([&] { registry_.get(42); }), ErrorKind::NotFound);
}

TEST_F(RegistryTest, List_ShouldReturnRestaurantsInIdOrder) {
    for (int i = 0; i < 11; ++i) {
        registry_.register_restaurant(ADMIN, OWNER, std::to_string(i));
    }

    auto restaurants = registry_.list();

    ASSERT_EQ(restaurants.size(), 11u);
    for (size_t i = 0; i < restaurants.size(); ++i) {
        EXPECT_EQ(restaurants[i].id(), i + 1);
    }
}

// =============================================================================
// Owner Lookup Tests
// =============================================================================

TEST_F(RegistryTest, OwnerRestaurant_ShouldResolveFirstRegisteredId) {
    // Given two owners, one with two restaurants
    registry_.register_restaurant(ADMIN, "other-owner", "");
    auto first = registry_.register_restaurant(ADMIN, OWNER, "first");
    registry_.register_restaurant(ADMIN, OWNER, "second");

    // Then each owner resolves to their first restaurant
    EXPECT_EQ(registry_.owner_restaurant(OWNER), first);
    EXPECT_EQ(registry_.owner_restaurant("other-owner"), 1u);
}

TEST_F(RegistryTest, OwnerRestaurant_UnknownOwner_ShouldBeNotFound) {
    registry_.register_restaurant(ADMIN, OWNER, "");
    EXPECT_EQ(rejection_kind([&] { registry_.owner_restaurant(CUSTOMER); }), ErrorKind::NotFound);
}

TEST_F(RegistryTest, OwnerRestaurant_ShouldNotAppearInList) {
    registry_.register_restaurant(ADMIN, OWNER, "");
    EXPECT_EQ(registry_.list().size(), 1u);
}

// =============================================================================
// Activation Tests
// =============================================================================

TEST_F(RegistryTest, Deactivate_ShouldBeIdempotentAndReversible) {
    auto id = registry_.register_restaurant(ADMIN, OWNER, "");

    registry_.deactivate(ADMIN, id);
    registry_.deactivate(ADMIN, id);
    EXPECT_FALSE(registry_.get(id).active());

    registry_.activate(ADMIN, id);
    EXPECT_TRUE(registry_.get(id).active());
}

TEST_F(RegistryTest, Deactivate_ByOwner_ShouldBeUnauthorized) {
    auto id = registry_.register_restaurant(ADMIN, OWNER, "");
    EXPECT_EQ(rejection_kind([&] { registry_.deactivate(OWNER, id); }), ErrorKind::Unauthorized);
}

TEST_F(RegistryTest, Deactivate_UnknownId_ShouldBeNotFound) {
    EXPECT_EQ(rejection_kind([&] { registry_.deactivate(ADMIN, 9); }), ErrorKind::NotFound);
}

// =============================================================================
// Metadata Tests
// =============================================================================

TEST_F(RegistryTest, UpdateMetadata_ByOwnerOrAdmin_ShouldReplaceMetadata) {
    auto id = registry_.register_restaurant(ADMIN, OWNER, "v1");

    registry_.update_metadata(OWNER, id, "v2");
    EXPECT_EQ(registry_.get(id).metadata(), "v2");

    registry_.update_metadata(ADMIN, id, "v3");
    EXPECT_EQ(registry_.get(id).metadata(), "v3");
}

TEST_F(RegistryTest, UpdateMetadata_ByStranger_ShouldBeUnauthorized) {
    auto id = registry_.register_restaurant(ADMIN, OWNER, "v1");

    EXPECT_EQ(rejection_kind([&] { registry_.update_metadata(CUSTOMER, id, "evil"); }),
              ErrorKind::Unauthorized);
    EXPECT_EQ(registry_.get(id).metadata(), "v1");
}
