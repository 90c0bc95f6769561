#include <gtest/gtest.h>
#include <google/protobuf/wrappers.pb.h>
#include "biteledger/helpers.hpp"
#include "biteledger/storage.hpp"
#include "biteledger/transaction.hpp"

using namespace biteledger;

class TransactionTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.put("C1", "a", "committed-a");
        store_.put("C1", "b", "committed-b");
        store_.put("C2", "a", "other-contract");
    }

    google::protobuf::Any event(const std::string& value) {
        google::protobuf::StringValue message;
        message.set_value(value);
        return helpers::pack_any(message);
    }

    MemoryKeyValueStore store_;
};

// =============================================================================
// Staging Tests
// =============================================================================

TEST_F(TransactionTest, Reads_ShouldSeeStagedWritesBeforeStore) {
    // Given a transaction over a populated store
    Transaction txn(store_);

    // When a key is overwritten and another erased
    txn.put("C1", "a", "staged-a");
    txn.erase("C1", "b");

    // Then reads reflect the staged state
    EXPECT_EQ(txn.get("C1", "a").value(), "staged-a");
    EXPECT_FALSE(txn.get("C1", "b").has_value());
    // And the store is untouched
    EXPECT_EQ(store_.get("C1", "a").value(), "committed-a");
    EXPECT_EQ(store_.get("C1", "b").value(), "committed-b");
}

TEST_F(TransactionTest, Scan_ShouldMergeStagedAndCommittedInKeyOrder) {
    Transaction txn(store_);
    txn.put("C1", "aa", "staged");
    txn.erase("C1", "b");

    auto entries = txn.scan("C1", "");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "a");
    EXPECT_EQ(entries[1].first, "aa");
}

TEST_F(TransactionTest, ApplyTo_ShouldWriteOnlyOnCommit) {
    Transaction txn(store_);
    txn.put("C1", "c", "new");
    txn.erase("C1", "a");

    txn.apply_to(store_);

    EXPECT_EQ(store_.get("C1", "c").value(), "new");
    EXPECT_FALSE(store_.get("C1", "a").has_value());
    EXPECT_EQ(store_.get("C2", "a").value(), "other-contract");
}

// =============================================================================
// Frame Tests
// =============================================================================

TEST_F(TransactionTest, RolledBackFrame_ShouldDiscardWritesAndEvents) {
    // Given a transaction with an outer write
    Transaction txn(store_);
    txn.put("C1", "outer", "kept");
    txn.emit("C1", event("outer"));

    // When a nested frame writes, emits and is rolled back
    {
        FrameScope frame(txn);
        txn.put("C1", "outer", "clobbered");
        txn.put("C2", "nested", "lost");
        txn.emit("C2", event("nested"));
    }

    // Then only the outer frame's effects remain
    EXPECT_EQ(txn.depth(), 1u);
    EXPECT_EQ(txn.get("C1", "outer").value(), "kept");
    EXPECT_FALSE(txn.get("C2", "nested").has_value());
    ASSERT_EQ(txn.events().size(), 1u);
    EXPECT_EQ(txn.events()[0].contract, "C1");
}

TEST_F(TransactionTest, CommittedFrame_ShouldMergeIntoParentInOrder) {
    Transaction txn(store_);
    txn.emit("C1", event("first"));
    {
        FrameScope frame(txn);
        txn.put("C2", "nested", "kept");
        txn.emit("C2", event("second"));
        frame.commit();
    }
    txn.emit("C1", event("third"));

    EXPECT_EQ(txn.get("C2", "nested").value(), "kept");
    ASSERT_EQ(txn.events().size(), 3u);
    EXPECT_EQ(txn.events()[1].contract, "C2");
    EXPECT_EQ(helpers::unpack<google::protobuf::StringValue>(txn.events()[2].event).value(), "third");
}

TEST_F(TransactionTest, Empty_ShouldTrackWritesAndEvents) {
    Transaction txn(store_);
    EXPECT_TRUE(txn.empty());

    txn.emit("C1", event("only-an-event"));
    EXPECT_FALSE(txn.empty());
}
