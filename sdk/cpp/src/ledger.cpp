#include "biteledger/ledger.hpp"
#include <atomic>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include "biteledger/errors.hpp"
#include "biteledger/helpers.hpp"
#include "biteledger/logging.hpp"

namespace biteledger {

namespace {

constexpr const char* LEDGER_DOMAIN = "ledger";
constexpr const char* META_KEY = "meta";
constexpr const char* INSTANCE_PREFIX = "instance/";

std::string padded(const char* prefix, uint64_t number) {
    std::ostringstream ss;
    ss << prefix << std::setw(10) << std::setfill('0') << number;
    return ss.str();
}

LedgerMeta parse_meta(const std::optional<std::string>& bytes) {
    LedgerMeta meta;
    if (bytes && !meta.ParseFromString(*bytes)) {
        throw StorageError("Corrupt ledger metadata");
    }
    return meta;
}

std::atomic<uint64_t> staging_counter{0};

// Write to a per-call staging file and rename it over path.
void write_snapshot(const LedgerSnapshot& snapshot, const std::string& path) {
    const std::string staging = path + ".tmp." + std::to_string(++staging_counter);
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out || !snapshot.SerializeToOstream(&out)) {
            out.close();
            std::remove(staging.c_str());
            throw StorageError("Cannot write snapshot to " + staging);
        }
    }
    if (std::rename(staging.c_str(), path.c_str()) != 0) {
        std::remove(staging.c_str());
        throw StorageError("Cannot move snapshot into place at " + path);
    }
}

} // anonymous namespace

Ledger::Ledger(std::unique_ptr<KeyValueStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
    if (!store_) {
        throw InvalidArgumentError("Ledger requires a key-value store");
    }
    if (!clock_) {
        clock_ = system_clock();
    }
}

Ledger::Clock Ledger::system_clock() {
    return [] { return helpers::now().seconds(); };
}

void Ledger::register_kind(std::shared_ptr<Contract> contract) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string kind = contract->kind();
    if (kinds_.count(kind) > 0) {
        throw InvalidArgumentError("Contract kind already registered: " + kind);
    }
    kinds_[kind] = std::move(contract);
}

bool Ledger::has_kind(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kinds_.count(kind) > 0;
}

std::vector<std::string> Ledger::kinds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [kind, _] : kinds_) {
        result.push_back(kind);
    }
    return result;
}

std::string Ledger::deploy(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (kinds_.count(kind) == 0) {
        throw InvalidArgumentError("Unknown contract kind: " + kind);
    }

    Transaction txn(*store_);
    LedgerMeta meta = read_meta(txn);
    meta.set_deployed(meta.deployed() + 1);
    meta.set_sequence(meta.sequence() + 1);

    ContractInstance instance;
    instance.set_address(padded(ADDRESS_PREFIX, meta.deployed()));
    instance.set_kind(kind);
    instance.set_deployed_at_sequence(meta.sequence());

    txn.put(KeyValueStore::RESERVED_NAMESPACE, INSTANCE_PREFIX + instance.address(),
            instance.SerializeAsString());
    txn.put(KeyValueStore::RESERVED_NAMESPACE, META_KEY, meta.SerializeAsString());
    commit(txn, nullptr);

    log_info(LEDGER_DOMAIN, "contract deployed", {
        {"address", instance.address()},
        {"kind", kind},
        {"sequence", meta.sequence()}
    });
    return instance.address();
}

InvocationResult Ledger::invoke(const Invocation& invocation) {
    return run(invocation, true);
}

InvocationResult Ledger::simulate(const Invocation& invocation) {
    return run(invocation, false);
}

InvocationResult Ledger::run(const Invocation& invocation, bool commit) {
    if (invocation.caller().empty()) {
        throw InvalidArgumentError("Invocation has no caller");
    }
    if (invocation.contract().empty()) {
        throw InvalidArgumentError("Invocation has no contract");
    }
    if (!invocation.has_command() || invocation.command().type_url().empty()) {
        throw InvalidArgumentError("Invocation has no command");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> signers(invocation.signers().begin(), invocation.signers().end());
    signers.insert(invocation.caller());

    Transaction txn(*store_);
    const int64_t timestamp = clock_();

    InvocationResult result;
    try {
        *result.mutable_result() = call(txn, invocation.caller(), signers, timestamp,
                                        invocation.contract(), invocation.command());
    } catch (const ContractError& e) {
        log_warn(LEDGER_DOMAIN, "invocation rejected", {
            {"contract", invocation.contract()},
            {"command", helpers::type_name_from_url(invocation.command().type_url())},
            {"error_kind", kind_name(e.kind())},
            {"error", e.what()}
        });
        throw;
    }

    if (txn.empty()) {
        return result;
    }

    LedgerMeta meta = read_meta(txn);
    const uint64_t sequence = meta.sequence() + 1;
    EventBook book = record(txn, sequence, timestamp);
    *result.mutable_events() = book;

    if (!commit) {
        return result;
    }

    meta.set_sequence(sequence);
    txn.put(KeyValueStore::RESERVED_NAMESPACE, META_KEY, meta.SerializeAsString());
    this->commit(txn, &book);

    log_info(LEDGER_DOMAIN, "transaction committed", {
        {"transaction_id", book.transaction_id()},
        {"sequence", sequence},
        {"contract", invocation.contract()},
        {"command", helpers::type_name_from_url(invocation.command().type_url())},
        {"events", book.pages_size()}
    });
    return result;
}

google::protobuf::Any Ledger::call(Transaction& txn, const std::string& invoker,
                                   const std::set<std::string>& signers, int64_t timestamp,
                                   const std::string& contract,
                                   const google::protobuf::Any& command) {
    auto bytes = txn.get(KeyValueStore::RESERVED_NAMESPACE, INSTANCE_PREFIX + contract);
    if (!bytes) {
        throw InvalidArgumentError("Unknown contract: " + contract);
    }
    ContractInstance instance;
    if (!instance.ParseFromString(*bytes)) {
        throw StorageError("Corrupt instance record for " + contract);
    }
    auto kind = kinds_.find(instance.kind());
    if (kind == kinds_.end()) {
        throw InvalidArgumentError("No contract registered for kind " + instance.kind());
    }

    FrameScope frame(txn);
    Env env(*this, txn, contract, invoker, signers, timestamp);
    auto result = kind->second->dispatch(command, env);
    frame.commit();

    log_debug(LEDGER_DOMAIN, "entry point returned", {
        {"contract", contract},
        {"invoker", invoker},
        {"command", helpers::type_name_from_url(command.type_url())},
        {"depth", txn.depth()}
    });
    return result;
}

std::vector<EventBook> Ledger::events(uint64_t from_sequence, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventBook> result;
    for (const auto& book : history_) {
        if (book.ledger_sequence() < from_sequence) continue;
        if (limit > 0 && result.size() >= limit) break;
        result.push_back(book);
    }
    return result;
}

uint64_t Ledger::sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parse_meta(store_->get(KeyValueStore::RESERVED_NAMESPACE, META_KEY)).sequence();
}

std::optional<ContractInstance> Ledger::instance(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bytes = store_->get(KeyValueStore::RESERVED_NAMESPACE, INSTANCE_PREFIX + address);
    if (!bytes) return std::nullopt;
    ContractInstance instance;
    if (!instance.ParseFromString(*bytes)) {
        throw StorageError("Corrupt instance record for " + address);
    }
    return instance;
}

LedgerSnapshot Ledger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capture();
}

LedgerSnapshot Ledger::capture() const {
    LedgerSnapshot snapshot;
    for (auto& entry : store_->entries()) {
        *snapshot.add_entries() = std::move(entry);
    }
    for (const auto& book : history_) {
        *snapshot.add_history() = book;
    }
    return snapshot;
}

void Ledger::restore(const LedgerSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_->clear();
    for (const auto& entry : snapshot.entries()) {
        store_->put(entry.contract(), entry.key(), entry.value());
    }
    history_.assign(snapshot.history().begin(), snapshot.history().end());
}

void Ledger::save_snapshot(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerSnapshot current = capture();
    write_snapshot(current, path);
    log_info(LEDGER_DOMAIN, "snapshot saved", {
        {"path", path},
        {"entries", current.entries_size()},
        {"books", current.history_size()}
    });
}

void Ledger::load_snapshot(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageError("Cannot open snapshot " + path);
    }
    LedgerSnapshot loaded;
    if (!loaded.ParseFromIstream(&in)) {
        throw StorageError("Corrupt snapshot " + path);
    }
    restore(loaded);
    log_info(LEDGER_DOMAIN, "snapshot loaded", {
        {"path", path},
        {"entries", loaded.entries_size()},
        {"sequence", sequence()}
    });
}

void Ledger::set_clock(Clock clock) {
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = std::move(clock);
}

void Ledger::set_snapshot_path(std::string path) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_path_ = std::move(path);
}

void Ledger::commit(const Transaction& txn, const EventBook* book) {
    const bool recorded = book != nullptr && book->pages_size() > 0;
    if (!snapshot_path_.empty()) {
        MemoryKeyValueStore staged;
        for (const auto& entry : store_->entries()) {
            staged.put(entry.contract(), entry.key(), entry.value());
        }
        txn.apply_to(staged);

        LedgerSnapshot next;
        for (auto& entry : staged.entries()) {
            *next.add_entries() = std::move(entry);
        }
        for (const auto& committed : history_) {
            *next.add_history() = committed;
        }
        if (recorded) {
            *next.add_history() = *book;
        }
        write_snapshot(next, snapshot_path_);
    }

    txn.apply_to(*store_);
    if (recorded) {
        history_.push_back(*book);
    }
}

LedgerMeta Ledger::read_meta(const Transaction& txn) const {
    return parse_meta(txn.get(KeyValueStore::RESERVED_NAMESPACE, META_KEY));
}

EventBook Ledger::record(const Transaction& txn, uint64_t sequence, int64_t timestamp) const {
    EventBook book;
    book.set_transaction_id(padded("T", sequence));
    book.set_ledger_sequence(sequence);
    uint64_t page_sequence = 0;
    for (const auto& staged : txn.events()) {
        auto* page = book.add_pages();
        page->set_sequence(page_sequence++);
        page->set_contract(staged.contract);
        *page->mutable_event() = staged.event;
        *page->mutable_created_at() = helpers::from_seconds(timestamp);
    }
    return book;
}

} // namespace biteledger
