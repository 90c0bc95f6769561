#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "storage.hpp"

namespace biteledger {

/// An event emitted by a contract, not yet committed.
struct StagedEvent {
    std::string contract;
    google::protobuf::Any event;
};

/**
 * Staged writes and events of one top-level invocation.
 *
 * Writes go to the innermost frame. Reads see the innermost write for a
 * key, falling back to the committed store. A nested call pushes a frame
 * and either merges it into its parent or discards it; the transaction
 * touches the store only through apply_to().
 */
class Transaction {
public:
    explicit Transaction(const KeyValueStore& base);

    std::optional<std::string> get(const std::string& ns, const std::string& key) const;
    void put(const std::string& ns, const std::string& key, const std::string& value);
    void erase(const std::string& ns, const std::string& key);
    std::vector<KeyValueStore::Entry> scan(const std::string& ns, const std::string& prefix) const;

    void emit(const std::string& contract, const google::protobuf::Any& event);

    void push_frame();
    void commit_frame();
    void rollback_frame();
    size_t depth() const { return frames_.size(); }

    /// True when no frame holds a write or an event.
    bool empty() const;

    /// Events of the outermost frame in emission order.
    const std::vector<StagedEvent>& events() const;

    /// Write all staged changes to the store. Only valid with one frame.
    void apply_to(KeyValueStore& store) const;

private:
    using Location = std::pair<std::string, std::string>;

    struct Frame {
        // nullopt marks a deletion.
        std::map<Location, std::optional<std::string>> writes;
        std::vector<StagedEvent> events;
    };

    const KeyValueStore& base_;
    std::vector<Frame> frames_;
};

/**
 * RAII frame for a nested call: rolled back on scope exit unless
 * commit() was called.
 */
class FrameScope {
public:
    explicit FrameScope(Transaction& txn) : txn_(txn) { txn_.push_frame(); }

    ~FrameScope() {
        if (!committed_) {
            txn_.rollback_frame();
        }
    }

    FrameScope(const FrameScope&) = delete;
    FrameScope& operator=(const FrameScope&) = delete;

    void commit() {
        txn_.commit_frame();
        committed_ = true;
    }

private:
    Transaction& txn_;
    bool committed_ = false;
};

} // namespace biteledger
