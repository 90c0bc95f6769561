#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "biteledger/types.pb.h"

namespace biteledger {

/**
 * Committed key-value state of the ledger.
 *
 * Every contract instance owns the namespace named after its address;
 * the ledger keeps its own bookkeeping in RESERVED_NAMESPACE. Values are
 * serialized protobuf messages.
 */
class KeyValueStore {
public:
    using Entry = std::pair<std::string, std::string>;

    static constexpr const char* RESERVED_NAMESPACE = "$ledger";

    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& ns, const std::string& key) const = 0;
    virtual void put(const std::string& ns, const std::string& key, const std::string& value) = 0;
    virtual void erase(const std::string& ns, const std::string& key) = 0;

    /// Entries of one namespace whose key starts with prefix, in key order.
    virtual std::vector<Entry> scan(const std::string& ns, const std::string& prefix) const = 0;

    /// Every entry of every namespace, for snapshots.
    virtual std::vector<StoreEntry> entries() const = 0;

    virtual void clear() = 0;
};

/**
 * In-process store backed by an ordered map.
 */
class MemoryKeyValueStore : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& ns, const std::string& key) const override;
    void put(const std::string& ns, const std::string& key, const std::string& value) override;
    void erase(const std::string& ns, const std::string& key) override;
    std::vector<Entry> scan(const std::string& ns, const std::string& prefix) const override;
    std::vector<StoreEntry> entries() const override;
    void clear() override { data_.clear(); }

    size_t size() const { return data_.size(); }

private:
    std::map<std::pair<std::string, std::string>, std::string> data_;
};

} // namespace biteledger
