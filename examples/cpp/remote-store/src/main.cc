#include "stockline/logging.hpp"
#include "stockline/remote_store.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace remote_store {
std::unique_ptr<stockline::RemoteStoreService::Service> create_store_service();
}

int main(int argc, char** argv) {
    const char* port_env = std::getenv("PORT");
    std::string port = port_env ? port_env : "50051";
    std::string server_address = "0.0.0.0:" + port;

    grpc::EnableDefaultHealthCheckService(true);

    auto service = remote_store::create_store_service();

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        stockline::log_error("remote_store", "server_start_failed", {{"port", port}});
        return 1;
    }

    stockline::log_info("remote_store", "remote_store_server_started", {{"port", port}});

    server->Wait();

    return 0;
}
