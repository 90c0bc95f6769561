#include "biteledger/storage.hpp"

namespace biteledger {

std::optional<std::string> MemoryKeyValueStore::get(const std::string& ns,
                                                    const std::string& key) const {
    auto it = data_.find({ns, key});
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

void MemoryKeyValueStore::put(const std::string& ns, const std::string& key,
                              const std::string& value) {
    data_[{ns, key}] = value;
}

void MemoryKeyValueStore::erase(const std::string& ns, const std::string& key) {
    data_.erase({ns, key});
}

std::vector<KeyValueStore::Entry> MemoryKeyValueStore::scan(const std::string& ns,
                                                            const std::string& prefix) const {
    std::vector<Entry> result;
    for (auto it = data_.lower_bound({ns, prefix}); it != data_.end(); ++it) {
        const auto& [entry_ns, key] = it->first;
        if (entry_ns != ns || key.compare(0, prefix.size(), prefix) != 0) break;
        result.emplace_back(key, it->second);
    }
    return result;
}

std::vector<StoreEntry> MemoryKeyValueStore::entries() const {
    std::vector<StoreEntry> result;
    result.reserve(data_.size());
    for (const auto& [location, value] : data_) {
        StoreEntry entry;
        entry.set_contract(location.first);
        entry.set_key(location.second);
        entry.set_value(value);
        result.push_back(std::move(entry));
    }
    return result;
}

} // namespace biteledger
