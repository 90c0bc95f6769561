#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "biteledger/biteledger.hpp"
#include "catalog.hpp"
#include "contracts/restaurant_registry.pb.h"
#include "ledger_service.hpp"
#include "registry.hpp"

using namespace biteledger;

// =============================================================================
// LedgerClient against an in-process node
// =============================================================================

class LedgerClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog::install_contracts(ledger_);
        service_ = std::make_unique<node::LedgerServiceImpl>(ledger_);

        grpc::ServerBuilder builder;
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);

        client_ = std::make_unique<LedgerClient>(server_->InProcessChannel(grpc::ChannelArguments()));
    }

    void TearDown() override {
        if (server_) {
            server_->Shutdown();
        }
    }

    template<typename C>
    Invocation invocation(const std::string& contract, const C& command, const std::string& caller) {
        Invocation inv;
        inv.set_caller(caller);
        inv.set_contract(contract);
        *inv.mutable_command() = helpers::pack_any(command);
        return inv;
    }

    Ledger ledger_;
    std::unique_ptr<node::LedgerServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<LedgerClient> client_;
};

TEST_F(LedgerClientTest, DeployAndInvoke_ShouldRoundTripThroughNode) {
    // Given a registry deployed over gRPC
    auto registry = client_->deploy(registry::RestaurantRegistry::KIND);
    contracts::InitializeRegistry init;
    init.set_admin("admin");
    client_->invoke(invocation(registry, init, "admin"));

    // When the admin registers a restaurant
    contracts::RegisterRestaurant cmd;
    cmd.set_owner("owner");
    auto result = client_->invoke(invocation(registry, cmd, "admin"));

    // Then the result and the history are visible to the client
    auto registered = helpers::unpack<contracts::RestaurantRegistered>(result.result());
    EXPECT_EQ(registered.restaurant().id(), 1u);
    EXPECT_EQ(client_->events(0).size(), 2u);

    contracts::CountRestaurants count;
    auto counted = client_->simulate(invocation(registry, count, "anyone"));
    EXPECT_EQ(helpers::unpack<contracts::RestaurantCount>(counted.result()).count(), 1u);
}

TEST_F(LedgerClientTest, ContractRejection_ShouldSurfaceAsGrpcError) {
    auto registry = client_->deploy(registry::RestaurantRegistry::KIND);
    contracts::InitializeRegistry init;
    init.set_admin("admin");
    client_->invoke(invocation(registry, init, "admin"));

    contracts::RegisterRestaurant cmd;
    cmd.set_owner("owner");
    try {
        client_->invoke(invocation(registry, cmd, "stranger"));
        FAIL() << "expected GrpcError";
    } catch (const GrpcError& e) {
        EXPECT_TRUE(e.is_permission_denied());
    }
}

TEST_F(LedgerClientTest, UnknownKind_ShouldSurfaceAsInvalidArgument) {
    try {
        client_->deploy("casino");
        FAIL() << "expected GrpcError";
    } catch (const GrpcError& e) {
        EXPECT_TRUE(e.is_invalid_argument());
    }
}
