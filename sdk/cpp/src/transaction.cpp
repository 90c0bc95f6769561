#include "biteledger/transaction.hpp"
#include <stdexcept>

namespace biteledger {

Transaction::Transaction(const KeyValueStore& base) : base_(base) {
    frames_.emplace_back();
}

std::optional<std::string> Transaction::get(const std::string& ns,
                                            const std::string& key) const {
    const Location location{ns, key};
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
        auto it = frame->writes.find(location);
        if (it != frame->writes.end()) {
            return it->second;
        }
    }
    return base_.get(ns, key);
}

void Transaction::put(const std::string& ns, const std::string& key, const std::string& value) {
    frames_.back().writes[{ns, key}] = value;
}

void Transaction::erase(const std::string& ns, const std::string& key) {
    frames_.back().writes[{ns, key}] = std::nullopt;
}

std::vector<KeyValueStore::Entry> Transaction::scan(const std::string& ns,
                                                    const std::string& prefix) const {
    std::map<std::string, std::optional<std::string>> merged;
    for (auto& [key, value] : base_.scan(ns, prefix)) {
        merged[key] = std::move(value);
    }
    for (const auto& frame : frames_) {
        for (auto it = frame.writes.lower_bound({ns, prefix}); it != frame.writes.end(); ++it) {
            const auto& [entry_ns, key] = it->first;
            if (entry_ns != ns || key.compare(0, prefix.size(), prefix) != 0) break;
            merged[key] = it->second;
        }
    }

    std::vector<KeyValueStore::Entry> result;
    for (auto& [key, value] : merged) {
        if (value) {
            result.emplace_back(key, std::move(*value));
        }
    }
    return result;
}

void Transaction::emit(const std::string& contract, const google::protobuf::Any& event) {
    frames_.back().events.push_back({contract, event});
}

void Transaction::push_frame() {
    frames_.emplace_back();
}

void Transaction::commit_frame() {
    if (frames_.size() < 2) {
        throw std::logic_error("commit_frame without a nested frame");
    }
    Frame top = std::move(frames_.back());
    frames_.pop_back();

    Frame& parent = frames_.back();
    for (auto& [location, value] : top.writes) {
        parent.writes[location] = std::move(value);
    }
    for (auto& event : top.events) {
        parent.events.push_back(std::move(event));
    }
}

void Transaction::rollback_frame() {
    if (frames_.size() < 2) {
        throw std::logic_error("rollback_frame without a nested frame");
    }
    frames_.pop_back();
}

bool Transaction::empty() const {
    for (const auto& frame : frames_) {
        if (!frame.writes.empty() || !frame.events.empty()) return false;
    }
    return true;
}

const std::vector<StagedEvent>& Transaction::events() const {
    return frames_.front().events;
}

void Transaction::apply_to(KeyValueStore& store) const {
    if (frames_.size() != 1) {
        throw std::logic_error("apply_to with open nested frames");
    }
    for (const auto& [location, value] : frames_.front().writes) {
        if (value) {
            store.put(location.first, location.second, *value);
        } else {
            store.erase(location.first, location.second);
        }
    }
}

} // namespace biteledger
