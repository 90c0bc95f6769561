#pragma once

#include <grpcpp/grpcpp.h>
#include "biteledger/ledger.grpc.pb.h"
#include "biteledger/ledger.hpp"

namespace node {

/// gRPC front of a ledger. Contract errors map to status codes by kind.
class LedgerServiceImpl final : public biteledger::LedgerService::Service {
public:
    explicit LedgerServiceImpl(biteledger::Ledger& ledger) : ledger_(ledger) {}

    grpc::Status Deploy(grpc::ServerContext* context,
                        const biteledger::DeployRequest* request,
                        biteledger::DeployResponse* response) override;

    grpc::Status Invoke(grpc::ServerContext* context,
                        const biteledger::Invocation* request,
                        biteledger::InvocationResult* response) override;

    grpc::Status Simulate(grpc::ServerContext* context,
                          const biteledger::Invocation* request,
                          biteledger::InvocationResult* response) override;

    grpc::Status GetEvents(grpc::ServerContext* context,
                           const biteledger::GetEventsRequest* request,
                           biteledger::GetEventsResponse* response) override;

private:
    biteledger::Ledger& ledger_;
};

} // namespace node
