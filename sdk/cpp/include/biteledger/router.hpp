#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "contract.hpp"
#include "errors.hpp"
#include "helpers.hpp"

namespace biteledger {

/**
 * Dispatcher for a contract's entry points (functional pattern).
 *
 * State is rebuilt from the instance's storage on every dispatch. A
 * command handler returns one event; the router applies it to storage,
 * emits it, and returns it as the entry point's result. A view handler
 * returns a result without touching storage.
 */
template<typename State>
class EntryPointRouter {
public:
    using StateBuilder = std::function<State(const ContractStorage&)>;
    using EventApplier = std::function<void(ContractStorage&, const google::protobuf::Any&)>;
    using Handler = std::function<google::protobuf::Any(const google::protobuf::Any&, Env&)>;

    EntryPointRouter(std::string name, StateBuilder build, EventApplier apply)
        : name_(std::move(name)), build_(std::move(build)), apply_(std::move(apply)) {}

    /**
     * Register a state-changing handler for CommandType.
     */
    template<typename CommandType, typename EventType>
    EntryPointRouter& on(std::function<EventType(const CommandType&, Env&, const State&)> handler) {
        auto build = build_;
        auto apply = apply_;
        handlers_[CommandType::descriptor()->full_name()] =
            [handler, build, apply](const google::protobuf::Any& any, Env& env) {
                auto cmd = helpers::unpack<CommandType>(any);
                State state = build(env.storage());
                EventType event = handler(cmd, env, state);
                auto packed = helpers::pack_any(event);
                apply(env.storage(), packed);
                env.emit(packed);
                return packed;
            };
        return *this;
    }

    /**
     * Register a read-only handler for QueryType.
     */
    template<typename QueryType, typename ResultType>
    EntryPointRouter& view(std::function<ResultType(const QueryType&, const Env&, const State&)> handler) {
        auto build = build_;
        handlers_[QueryType::descriptor()->full_name()] =
            [handler, build](const google::protobuf::Any& any, Env& env) {
                auto query = helpers::unpack<QueryType>(any);
                State state = build(env.storage());
                return helpers::pack_any(handler(query, env, state));
            };
        return *this;
    }

    /**
     * Dispatch a packed command or query to its handler.
     * @throws ContractError UnknownEntryPoint for unregistered types
     */
    google::protobuf::Any dispatch(const google::protobuf::Any& command, Env& env) const {
        auto it = handlers_.find(helpers::type_name_from_url(command.type_url()));
        if (it == handlers_.end()) {
            throw ContractError::unknown_entry_point(
                name_ + " has no entry point for " + command.type_url());
        }
        return it->second(command, env);
    }

    /**
     * Return registered command and query type names.
     */
    std::vector<std::string> entry_points() const {
        std::vector<std::string> result;
        for (const auto& [type_name, _] : handlers_) {
            result.push_back(type_name);
        }
        return result;
    }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    StateBuilder build_;
    EventApplier apply_;
    std::map<std::string, Handler> handlers_;
};

} // namespace biteledger
