#include <gtest/gtest.h>
#include <cstdio>
#include <memory>
#include <string>
#include "biteledger/errors.hpp"
#include "biteledger/ledger.hpp"
#include "counter_contract.hpp"

using namespace biteledger;
using namespace counter;

class LedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger_.set_clock([] { return int64_t{1700000000}; });
        ledger_.register_kind(std::make_shared<CounterContract>());
        first_ = ledger_.deploy(CounterContract::KIND);
        second_ = ledger_.deploy(CounterContract::KIND);
    }

    template<typename C>
    Invocation invocation(const std::string& contract, const C& command,
                          const std::string& caller = "alice") {
        Invocation inv;
        inv.set_caller(caller);
        inv.set_contract(contract);
        *inv.mutable_command() = helpers::pack_any(command);
        return inv;
    }

    UInt64Value delta(uint64_t value) {
        UInt64Value cmd;
        cmd.set_value(value);
        return cmd;
    }

    int64_t value_of(const std::string& contract) {
        auto result = ledger_.simulate(invocation(contract, Empty()));
        return helpers::unpack<Int64Value>(result.result()).value();
    }

    Ledger ledger_;
    std::string first_;
    std::string second_;
};

// =============================================================================
// Deployment Tests
// =============================================================================

TEST_F(LedgerTest, Deploy_ShouldAssignSequentialAddresses) {
    EXPECT_EQ(first_, "C0000000001");
    EXPECT_EQ(second_, "C0000000002");
    EXPECT_EQ(ledger_.instance(first_)->kind(), CounterContract::KIND);
}

TEST_F(LedgerTest, Deploy_UnknownKind_ShouldThrowInvalidArgument) {
    EXPECT_THROW(ledger_.deploy("no_such_kind"), InvalidArgumentError);
}

TEST_F(LedgerTest, RegisterKind_Twice_ShouldThrow) {
    EXPECT_THROW(ledger_.register_kind(std::make_shared<CounterContract>()), InvalidArgumentError);
}

// =============================================================================
// Commit Tests
// =============================================================================

TEST_F(LedgerTest, Invoke_ShouldCommitWritesAndRecordEventBook) {
    // Given the sequence after two deployments
    uint64_t before = ledger_.sequence();

    // When I invoke a state-changing entry point
    auto result = ledger_.invoke(invocation(first_, delta(3)));

    // Then the state change is committed
    EXPECT_EQ(value_of(first_), 3);
    // And the sequence advances by one
    EXPECT_EQ(ledger_.sequence(), before + 1);
    // And the event book is recorded
    ASSERT_EQ(result.events().pages_size(), 1);
    EXPECT_EQ(result.events().ledger_sequence(), before + 1);
    EXPECT_EQ(result.events().pages(0).contract(), first_);
    EXPECT_EQ(result.events().pages(0).created_at().seconds(), 1700000000);
    EXPECT_EQ(ledger_.events(0).size(), 1u);
}

TEST_F(LedgerTest, Invoke_Rejected_ShouldLeaveLedgerUnchanged) {
    uint64_t before = ledger_.sequence();

    EXPECT_THROW(ledger_.invoke(invocation(first_, delta(0))), ContractError);

    EXPECT_EQ(ledger_.sequence(), before);
    EXPECT_EQ(value_of(first_), 0);
    EXPECT_TRUE(ledger_.events(0).empty());
}

TEST_F(LedgerTest, Simulate_ShouldNotCommit) {
    auto result = ledger_.simulate(invocation(first_, delta(7)));

    EXPECT_EQ(helpers::unpack<Int64Value>(result.result()).value(), 7);
    EXPECT_EQ(result.events().pages_size(), 1);
    EXPECT_EQ(value_of(first_), 0);
    EXPECT_TRUE(ledger_.events(0).empty());
}

TEST_F(LedgerTest, View_ShouldNotAdvanceSequence) {
    uint64_t before = ledger_.sequence();

    ledger_.invoke(invocation(first_, Empty()));

    EXPECT_EQ(ledger_.sequence(), before);
}

TEST_F(LedgerTest, Events_ShouldFilterBySequenceAndLimit) {
    ledger_.invoke(invocation(first_, delta(1)));
    ledger_.invoke(invocation(first_, delta(1)));
    ledger_.invoke(invocation(first_, delta(1)));
    uint64_t last = ledger_.sequence();

    EXPECT_EQ(ledger_.events(last).size(), 1u);
    EXPECT_EQ(ledger_.events(0, 2).size(), 2u);
    EXPECT_EQ(ledger_.events(last + 1).size(), 0u);
}

// =============================================================================
// Nested Call Tests
// =============================================================================

TEST_F(LedgerTest, NestedCall_ShouldCommitBothContracts) {
    StringValue forward;
    forward.set_value(second_);

    auto result = ledger_.invoke(invocation(first_, forward));

    EXPECT_EQ(value_of(first_), 1);
    EXPECT_EQ(value_of(second_), 1);
    // Nested events come first, in execution order
    ASSERT_EQ(result.events().pages_size(), 2);
    EXPECT_EQ(result.events().pages(0).contract(), second_);
    EXPECT_EQ(result.events().pages(1).contract(), first_);
}

TEST_F(LedgerTest, FailureAfterNestedCall_ShouldDiscardNestedWrites) {
    // Given a call whose nested call succeeds before the caller rejects
    BytesValue forward_then_fail;
    forward_then_fail.set_value(second_);

    // When I invoke it
    EXPECT_THROW(ledger_.invoke(invocation(first_, forward_then_fail)), ContractError);

    // Then the nested contract's write is discarded too
    EXPECT_EQ(value_of(second_), 0);
    EXPECT_TRUE(ledger_.events(0).empty());
}

TEST_F(LedgerTest, NestedCall_UnknownContract_ShouldThrowInvalidArgument) {
    StringValue forward;
    forward.set_value("C9999999999");

    EXPECT_THROW(ledger_.invoke(invocation(first_, forward)), InvalidArgumentError);
    EXPECT_EQ(value_of(first_), 0);
}

// =============================================================================
// Invocation Validation Tests
// =============================================================================

TEST_F(LedgerTest, Invoke_WithoutCallerOrCommand_ShouldThrowInvalidArgument) {
    auto missing_caller = invocation(first_, delta(1), "");
    EXPECT_THROW(ledger_.invoke(missing_caller), InvalidArgumentError);

    Invocation missing_command;
    missing_command.set_caller("alice");
    missing_command.set_contract(first_);
    EXPECT_THROW(ledger_.invoke(missing_command), InvalidArgumentError);
}

TEST_F(LedgerTest, Signers_ShouldAuthorizeAlongsideCaller) {
    BoolValue needs_alice;

    // Caller other than alice without her signature is rejected
    EXPECT_THROW(ledger_.invoke(invocation(first_, needs_alice, "bob")), ContractError);

    // With alice as a signer the same call passes
    auto signed_call = invocation(first_, needs_alice, "bob");
    signed_call.add_signers("alice");
    EXPECT_NO_THROW(ledger_.invoke(signed_call));
    EXPECT_EQ(value_of(first_), 1);
}

// =============================================================================
// Snapshot Tests
// =============================================================================

TEST_F(LedgerTest, Snapshot_ShouldRestoreStoreAndHistory) {
    // Given committed state
    ledger_.invoke(invocation(first_, delta(4)));
    ledger_.invoke(invocation(second_, delta(9)));
    auto path = ::testing::TempDir() + "ledger_snapshot_test.bin";

    // When the snapshot is saved and loaded into a fresh ledger
    ledger_.save_snapshot(path);
    Ledger restored;
    restored.register_kind(std::make_shared<CounterContract>());
    restored.load_snapshot(path);
    std::remove(path.c_str());

    // Then state, sequence and history match
    EXPECT_EQ(restored.sequence(), ledger_.sequence());
    EXPECT_EQ(restored.events(0).size(), 2u);
    Invocation query;
    query.set_caller("alice");
    query.set_contract(second_);
    *query.mutable_command() = helpers::pack_any(Empty());
    EXPECT_EQ(helpers::unpack<Int64Value>(restored.simulate(query).result()).value(), 9);
    // And deployment continues from the restored counter
    EXPECT_EQ(restored.deploy(CounterContract::KIND), "C0000000003");
}

TEST_F(LedgerTest, LoadSnapshot_MissingFile_ShouldThrowStorageError) {
    EXPECT_THROW(ledger_.load_snapshot(::testing::TempDir() + "does_not_exist.bin"), StorageError);
}

TEST_F(LedgerTest, SnapshotPath_ShouldHoldEveryCommittedTransaction) {
    auto path = ::testing::TempDir() + "ledger_write_through_test.bin";
    ledger_.set_snapshot_path(path);

    ledger_.invoke(invocation(first_, delta(3)));
    ledger_.invoke(invocation(first_, delta(5)));

    Ledger restored;
    restored.register_kind(std::make_shared<CounterContract>());
    restored.load_snapshot(path);
    std::remove(path.c_str());
    EXPECT_EQ(restored.sequence(), ledger_.sequence());
    EXPECT_EQ(restored.events(0).size(), 2u);
}

TEST_F(LedgerTest, SnapshotPath_Unwritable_ShouldCommitNothing) {
    // Given a snapshot path in a directory that does not exist
    const auto sequence = ledger_.sequence();
    ledger_.set_snapshot_path(::testing::TempDir() + "missing-dir/ledger.bin");

    // When an invoke and a deploy run
    EXPECT_THROW(ledger_.invoke(invocation(first_, delta(7))), StorageError);
    EXPECT_THROW(ledger_.deploy(CounterContract::KIND), StorageError);

    // Then neither is committed
    EXPECT_EQ(ledger_.sequence(), sequence);
    EXPECT_TRUE(ledger_.events(0).empty());
    EXPECT_FALSE(ledger_.instance("C0000000003").has_value());

    // And the same invoke succeeds once persistence is disabled
    ledger_.set_snapshot_path("");
    ledger_.invoke(invocation(first_, delta(7)));
    EXPECT_EQ(value_of(first_), 7);
}
