#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "errors.hpp"
#include "helpers.hpp"
#include "transaction.hpp"

namespace biteledger {

class Ledger;

/**
 * A contract instance's view of the current transaction, restricted to
 * its own namespace.
 */
class ContractStorage {
public:
    ContractStorage(Transaction& txn, std::string contract)
        : txn_(txn), contract_(std::move(contract)) {}

    bool has(const std::string& key) const {
        return txn_.get(contract_, key).has_value();
    }

    /**
     * Decode the message stored under key.
     * @throws StorageError if the stored bytes do not parse as T
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        auto bytes = txn_.get(contract_, key);
        if (!bytes) return std::nullopt;
        return decode<T>(key, *bytes);
    }

    template<typename T>
    void put(const std::string& key, const T& message) {
        txn_.put(contract_, key, message.SerializeAsString());
    }

    void erase(const std::string& key) {
        txn_.erase(contract_, key);
    }

    /// All records under a key prefix, in key order.
    template<typename T>
    std::vector<T> scan(const std::string& prefix) const {
        std::vector<T> result;
        for (const auto& [key, bytes] : txn_.scan(contract_, prefix)) {
            result.push_back(decode<T>(key, bytes));
        }
        return result;
    }

    const std::string& contract() const { return contract_; }

private:
    template<typename T>
    T decode(const std::string& key, const std::string& bytes) const {
        T message;
        if (!message.ParseFromString(bytes)) {
            throw StorageError("Corrupt " + T::descriptor()->full_name() +
                               " at " + contract_ + "/" + key);
        }
        return message;
    }

    Transaction& txn_;
    std::string contract_;
};

/**
 * Execution environment handed to an entry point.
 *
 * The invoker is the address that directly called this entry point: an
 * account for top-level calls, the calling contract for nested ones.
 * Signers authorized the transaction as a whole.
 */
class Env {
public:
    Env(Ledger& ledger, Transaction& txn, std::string contract, std::string invoker,
        std::set<std::string> signers, int64_t timestamp);

    const std::string& contract_address() const { return storage_.contract(); }
    const std::string& invoker() const { return invoker_; }
    const std::set<std::string>& signers() const { return signers_; }

    /// Ledger time of the transaction, in seconds since the epoch.
    int64_t timestamp() const { return timestamp_; }

    ContractStorage& storage() { return storage_; }
    const ContractStorage& storage() const { return storage_; }

    /// True when address is the invoker or signed the transaction.
    bool is_authorized(const std::string& address) const;

    /**
     * @throws ContractError Unauthorized unless is_authorized(address)
     */
    void require_auth(const std::string& address) const;

    /**
     * Role check: the invoker itself must be address.
     * @throws ContractError Unauthorized naming the role otherwise
     */
    void require_invoker(const std::string& address, const std::string& role) const;

    void emit(const google::protobuf::Any& event);

    /**
     * Call another contract synchronously. The callee sees this contract
     * as its invoker. If the callee fails its writes and events are
     * discarded and the error propagates.
     */
    google::protobuf::Any invoke(const std::string& contract, const google::protobuf::Any& command);

    /// Typed invoke: pack the command and unpack the result as R.
    template<typename R, typename C>
    R call(const std::string& contract, const C& command) {
        return helpers::unpack<R>(invoke(contract, helpers::pack_any(command)));
    }

private:
    Ledger& ledger_;
    Transaction& txn_;
    ContractStorage storage_;
    std::string invoker_;
    std::set<std::string> signers_;
    int64_t timestamp_;
};

/**
 * A deployable contract kind. Instances share the object; all instance
 * state lives in the instance's storage namespace.
 */
class Contract {
public:
    virtual ~Contract() = default;

    virtual std::string kind() const = 0;

    /// Names of the command and query types this contract accepts.
    virtual std::vector<std::string> entry_points() const = 0;

    /**
     * Run the entry point selected by the command's type.
     * @throws ContractError on rejection
     */
    virtual google::protobuf::Any dispatch(const google::protobuf::Any& command, Env& env) = 0;
};

} // namespace biteledger
