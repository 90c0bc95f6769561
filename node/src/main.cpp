#include <filesystem>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/health_check_service_interface.h>

#include "catalog.hpp"
#include "ledger_service.hpp"
#include "node_config.hpp"
#include "biteledger/errors.hpp"
#include "biteledger/ledger.hpp"
#include "biteledger/logging.hpp"

namespace {

constexpr const char* NODE_DOMAIN = "node";

} // anonymous namespace

int main(int argc, char** argv) {
    node::NodeConfig config;
    try {
        config = node::NodeConfig::from_env(argc, argv);
    } catch (const biteledger::ClientError& e) {
        biteledger::log_error(NODE_DOMAIN, "invalid configuration", {{"error", e.what()}});
        return 1;
    }

    biteledger::Ledger ledger;
    catalog::install_contracts(ledger);

    if (!config.snapshot_path.empty() && std::filesystem::exists(config.snapshot_path)) {
        try {
            ledger.load_snapshot(config.snapshot_path);
        } catch (const biteledger::StorageError& e) {
            biteledger::log_error(NODE_DOMAIN, "cannot restore snapshot", {
                {"path", config.snapshot_path},
                {"error", e.what()}
            });
            return 1;
        }
    }
    ledger.set_snapshot_path(config.snapshot_path);

    // Enable health checks and reflection for debugging
    grpc::EnableDefaultHealthCheckService(true);
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    node::LedgerServiceImpl service(ledger);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.listen_address(), grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        biteledger::log_error(NODE_DOMAIN, "cannot listen", {{"address", config.listen_address()}});
        return 1;
    }

    biteledger::log_info(NODE_DOMAIN, "ledger node listening", {
        {"address", config.listen_address()},
        {"kinds", ledger.kinds()},
        {"sequence", ledger.sequence()},
        {"snapshot_path", config.snapshot_path},
        {"log_level", config.log_level}
    });

    server->Wait();
    return 0;
}
