#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include "biteledger/ledger.hpp"
#include "biteledger/router.hpp"
#include "counter_contract.hpp"

using namespace biteledger;
using namespace counter;

// =============================================================================
// EntryPointRouter Tests
// =============================================================================

class EntryPointRouterTest : public ::testing::Test {
protected:
    EntryPointRouterTest()
        : txn_(store_), env_(ledger_, txn_, "C1", "alice", {"alice"}, 1700000000) {}

    UInt64Value delta(uint64_t value) {
        UInt64Value cmd;
        cmd.set_value(value);
        return cmd;
    }

    Ledger ledger_;
    MemoryKeyValueStore store_;
    Transaction txn_;
    Env env_;
    CounterContract contract_;
};

TEST_F(EntryPointRouterTest, Dispatch_Command_ShouldApplyAndEmitEvent) {
    // When I dispatch a registered command
    auto result = contract_.dispatch(helpers::pack_any(delta(5)), env_);

    // Then the handler's event is returned
    EXPECT_EQ(helpers::unpack<Int64Value>(result).value(), 5);
    // And applied to storage
    EXPECT_EQ(env_.storage().get<Int64Value>("value")->value(), 5);
    // And emitted under the contract's address
    ASSERT_EQ(txn_.events().size(), 1u);
    EXPECT_EQ(txn_.events()[0].contract, "C1");
}

TEST_F(EntryPointRouterTest, Dispatch_ShouldRebuildStateEachTime) {
    contract_.dispatch(helpers::pack_any(delta(2)), env_);
    auto result = contract_.dispatch(helpers::pack_any(delta(3)), env_);

    EXPECT_EQ(helpers::unpack<Int64Value>(result).value(), 5);
}

TEST_F(EntryPointRouterTest, Dispatch_View_ShouldNotEmit) {
    contract_.dispatch(helpers::pack_any(delta(4)), env_);

    auto result = contract_.dispatch(helpers::pack_any(Empty()), env_);

    EXPECT_EQ(helpers::unpack<Int64Value>(result).value(), 4);
    EXPECT_EQ(txn_.events().size(), 1u);
}

TEST_F(EntryPointRouterTest, Dispatch_UnregisteredType_ShouldThrowUnknownEntryPoint) {
    // Given a command type the contract does not handle
    google::protobuf::DoubleValue unknown;

    // Then dispatch is rejected
    try {
        contract_.dispatch(helpers::pack_any(unknown), env_);
        FAIL() << "expected ContractError";
    } catch (const ContractError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownEntryPoint);
    }
}

TEST_F(EntryPointRouterTest, Dispatch_Rejected_ShouldNotApplyOrEmit) {
    EXPECT_THROW(contract_.dispatch(helpers::pack_any(delta(0)), env_), ContractError);

    EXPECT_FALSE(env_.storage().has("value"));
    EXPECT_TRUE(txn_.events().empty());
}

TEST_F(EntryPointRouterTest, EntryPoints_ShouldListRegisteredTypes) {
    auto types = contract_.entry_points();

    EXPECT_EQ(types.size(), 5u);
    EXPECT_NE(std::find(types.begin(), types.end(), "google.protobuf.UInt64Value"), types.end());
    EXPECT_NE(std::find(types.begin(), types.end(), "google.protobuf.Empty"), types.end());
}

// =============================================================================
// Env Authorization Tests
// =============================================================================

TEST(EnvTest, RequireAuth_ShouldAcceptInvokerOrSigner) {
    Ledger ledger;
    MemoryKeyValueStore store;
    Transaction txn(store);
    Env env(ledger, txn, "C1", "C2", {"alice", "bob"}, 0);

    EXPECT_NO_THROW(env.require_auth("C2"));
    EXPECT_NO_THROW(env.require_auth("bob"));
    EXPECT_THROW(env.require_auth("mallory"), ContractError);
    EXPECT_THROW(env.require_auth(""), ContractError);
}

TEST(EnvTest, RequireInvoker_ShouldIgnoreSigners) {
    Ledger ledger;
    MemoryKeyValueStore store;
    Transaction txn(store);
    Env env(ledger, txn, "C1", "C2", {"alice"}, 0);

    EXPECT_NO_THROW(env.require_invoker("C2", "minter"));
    try {
        env.require_invoker("alice", "minter");
        FAIL() << "expected ContractError";
    } catch (const ContractError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Unauthorized);
    }
}
