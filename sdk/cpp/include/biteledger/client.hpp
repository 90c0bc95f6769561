#pragma once

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "biteledger/types.pb.h"
#include "biteledger/ledger.pb.h"
#include "biteledger/ledger.grpc.pb.h"
#include "errors.hpp"
#include "helpers.hpp"

namespace biteledger {

/**
 * Client for a remote ledger node.
 *
 * Example:
 *   auto client = LedgerClient::from_env("BITELEDGER_ENDPOINT", "localhost:50061");
 *   auto token = client->deploy("loyalty_token");
 *   auto result = client->invoke(invocation);
 */
class LedgerClient {
public:
    /**
     * Connect to a ledger node at the given endpoint.
     *
     * @param endpoint Server endpoint (e.g., "localhost:50061")
     * @return Unique pointer to LedgerClient
     * @throws ConnectionError if the channel cannot be created
     */
    static std::unique_ptr<LedgerClient> connect(const std::string& endpoint) {
        auto channel = grpc::CreateChannel(format_endpoint(endpoint),
                                           grpc::InsecureChannelCredentials());
        if (!channel) {
            throw ConnectionError("Cannot create channel to " + endpoint);
        }
        return std::make_unique<LedgerClient>(channel);
    }

    /**
     * Connect using an endpoint from environment variable with fallback.
     *
     * @param env_var Environment variable name
     * @param default_endpoint Fallback endpoint if env var is not set
     */
    static std::unique_ptr<LedgerClient> from_env(const std::string& env_var,
                                                  const std::string& default_endpoint) {
        const char* endpoint = std::getenv(env_var.c_str());
        return connect(endpoint ? endpoint : default_endpoint);
    }

    /**
     * Create a client from an existing channel.
     */
    explicit LedgerClient(std::shared_ptr<grpc::Channel> channel)
        : stub_(LedgerService::NewStub(channel)) {}

    /**
     * Deploy a new instance of a registered contract kind.
     * @return Address of the new instance
     * @throws GrpcError if the gRPC call fails
     */
    std::string deploy(const std::string& kind) {
        DeployRequest request;
        request.set_kind(kind);
        DeployResponse response;
        grpc::ClientContext context;
        check(stub_->Deploy(&context, request, &response));
        return response.address();
    }

    /**
     * Execute an invocation and commit it.
     * @throws GrpcError carrying the mapped status of a contract error
     */
    InvocationResult invoke(const Invocation& invocation) {
        InvocationResult response;
        grpc::ClientContext context;
        check(stub_->Invoke(&context, invocation, &response));
        return response;
    }

    /**
     * Execute an invocation without committing (what-if).
     */
    InvocationResult simulate(const Invocation& invocation) {
        InvocationResult response;
        grpc::ClientContext context;
        check(stub_->Simulate(&context, invocation, &response));
        return response;
    }

    /**
     * Committed event books from a ledger sequence onward.
     */
    std::vector<EventBook> events(uint64_t from_sequence, uint32_t limit = 0) {
        GetEventsRequest request;
        request.set_from_sequence(from_sequence);
        request.set_limit(limit);
        GetEventsResponse response;
        grpc::ClientContext context;
        check(stub_->GetEvents(&context, request, &response));
        return {response.books().begin(), response.books().end()};
    }

private:
    std::unique_ptr<LedgerService::Stub> stub_;

    static void check(const grpc::Status& status) {
        if (!status.ok()) {
            throw GrpcError(status.error_message(), status.error_code());
        }
    }

    static std::string format_endpoint(const std::string& endpoint) {
        auto pos = endpoint.find("://");
        if (pos == std::string::npos) {
            return endpoint;
        }
        // Strip http:// or https:// prefix for gRPC
        return endpoint.substr(pos + 3);
    }
};

} // namespace biteledger
