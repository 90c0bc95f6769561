#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "biteledger/types.pb.h"
#include "contract.hpp"
#include "storage.hpp"
#include "transaction.hpp"

namespace biteledger {

/**
 * Deterministic ledger hosting contract instances.
 *
 * Each top-level invoke runs as one transaction: every write and event
 * of the call and its nested calls is committed together when it
 * returns normally, and nothing is committed when it throws. Invocations
 * are serialized, so history is strictly sequential.
 *
 * Example:
 *   Ledger ledger;
 *   ledger.register_kind(std::make_shared<MyContract>());
 *   auto address = ledger.deploy("my_contract");
 *   auto result = ledger.invoke(invocation);
 */
class Ledger {
public:
    /// Ledger time source, in seconds since the epoch.
    using Clock = std::function<int64_t()>;

    static constexpr const char* ADDRESS_PREFIX = "C";

    explicit Ledger(std::unique_ptr<KeyValueStore> store = std::make_unique<MemoryKeyValueStore>(),
                    Clock clock = system_clock());

    static Clock system_clock();

    /**
     * Make a contract kind deployable under contract->kind().
     * @throws InvalidArgumentError if the kind is already registered
     */
    void register_kind(std::shared_ptr<Contract> contract);

    bool has_kind(const std::string& kind) const;
    std::vector<std::string> kinds() const;

    /**
     * Create a new, uninitialized instance of a registered kind.
     * @return Deterministic address "C" + zero-padded deployment number
     * @throws InvalidArgumentError for an unknown kind
     */
    std::string deploy(const std::string& kind);

    /**
     * Run one entry point as a top-level transaction and commit it.
     * @throws ContractError when the contract rejects the call
     * @throws InvalidArgumentError for malformed invocations
     */
    InvocationResult invoke(const Invocation& invocation);

    /**
     * Run one entry point exactly like invoke without committing.
     */
    InvocationResult simulate(const Invocation& invocation);

    /**
     * Committed event books with ledger_sequence >= from_sequence.
     * @param limit Maximum number of books, zero for all
     */
    std::vector<EventBook> events(uint64_t from_sequence, size_t limit = 0) const;

    /// Sequence of the last committed transaction.
    uint64_t sequence() const;

    std::optional<ContractInstance> instance(const std::string& address) const;

    LedgerSnapshot snapshot() const;
    void restore(const LedgerSnapshot& snapshot);

    /**
     * Capture and write a snapshot as one step, serialized with commits.
     * @throws StorageError if the file cannot be written or read
     */
    void save_snapshot(const std::string& path) const;
    void load_snapshot(const std::string& path);

    /**
     * Write a snapshot of the post-commit state before every deploy or
     * invoke is committed. When the write fails the call throws
     * StorageError and nothing is committed. Empty disables it.
     */
    void set_snapshot_path(std::string path);

    void set_clock(Clock clock);

private:
    friend class Env;

    InvocationResult run(const Invocation& invocation, bool commit);

    /// Route a call to a deployed instance inside txn.
    google::protobuf::Any call(Transaction& txn, const std::string& invoker,
                               const std::set<std::string>& signers, int64_t timestamp,
                               const std::string& contract, const google::protobuf::Any& command);

    /// Write the staged changes through the snapshot file, then to the store.
    void commit(const Transaction& txn, const EventBook* book);
    LedgerSnapshot capture() const;

    LedgerMeta read_meta(const Transaction& txn) const;
    EventBook record(const Transaction& txn, uint64_t sequence, int64_t timestamp) const;

    mutable std::mutex mutex_;
    std::unique_ptr<KeyValueStore> store_;
    Clock clock_;
    std::map<std::string, std::shared_ptr<Contract>> kinds_;
    std::vector<EventBook> history_;
    std::string snapshot_path_;
};

} // namespace biteledger
