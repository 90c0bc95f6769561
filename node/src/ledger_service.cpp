#include "ledger_service.hpp"
#include <exception>
#include "biteledger/errors.hpp"
#include "biteledger/logging.hpp"

namespace node {

namespace {

constexpr const char* NODE_DOMAIN = "node";

template<typename Body>
grpc::Status guarded(const char* rpc, Body&& body) {
    try {
        body();
        return grpc::Status::OK;
    } catch (const biteledger::ContractError& e) {
        return e.to_grpc_status();
    } catch (const biteledger::InvalidArgumentError& e) {
        return e.to_grpc_status();
    } catch (const std::exception& e) {
        biteledger::log_error(NODE_DOMAIN, "request failed", {{"rpc", rpc}, {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

} // anonymous namespace

grpc::Status LedgerServiceImpl::Deploy(grpc::ServerContext*,
                                       const biteledger::DeployRequest* request,
                                       biteledger::DeployResponse* response) {
    return guarded("Deploy", [&] {
        response->set_address(ledger_.deploy(request->kind()));
        response->set_kind(request->kind());
    });
}

grpc::Status LedgerServiceImpl::Invoke(grpc::ServerContext*,
                                       const biteledger::Invocation* request,
                                       biteledger::InvocationResult* response) {
    return guarded("Invoke", [&] {
        *response = ledger_.invoke(*request);
    });
}

grpc::Status LedgerServiceImpl::Simulate(grpc::ServerContext*,
                                         const biteledger::Invocation* request,
                                         biteledger::InvocationResult* response) {
    return guarded("Simulate", [&] {
        *response = ledger_.simulate(*request);
    });
}

grpc::Status LedgerServiceImpl::GetEvents(grpc::ServerContext*,
                                          const biteledger::GetEventsRequest* request,
                                          biteledger::GetEventsResponse* response) {
    return guarded("GetEvents", [&] {
        for (auto& book : ledger_.events(request->from_sequence(), request->limit())) {
            *response->add_books() = std::move(book);
        }
        response->set_ledger_sequence(ledger_.sequence());
    });
}

} // namespace node
