#pragma once

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "stockline/remote_store.pb.h"
#include "stockline/remote_store.grpc.pb.h"
#include "errors.hpp"
#include "remote_store.hpp"

namespace stockline {

/**
 * gRPC client for the remote store.
 *
 * Every call carries a deadline; a call that runs past it fails with
 * DEADLINE_EXCEEDED and is classified as transient.
 *
 * Example:
 *   auto client = RemoteStoreClient::connect("localhost:50051");
 *   auto stored = client->insert(Entity::Transactions, helpers::to_row(tx));
 */
class RemoteStoreClient : public RemoteStore {
public:
    /**
     * Connect to a remote store at the given endpoint.
     *
     * @param endpoint Server endpoint (e.g., "localhost:50051")
     * @param timeout Deadline applied to every call
     * @return Unique pointer to RemoteStoreClient
     */
    static std::unique_ptr<RemoteStoreClient> connect(
            const std::string& endpoint,
            std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        auto channel = grpc::CreateChannel(format_endpoint(endpoint),
                                           grpc::InsecureChannelCredentials());
        return std::make_unique<RemoteStoreClient>(channel, timeout);
    }

    /**
     * Connect using an endpoint from environment variable with fallback.
     *
     * @param env_var Environment variable name
     * @param default_endpoint Fallback endpoint if env var is not set
     * @return Unique pointer to RemoteStoreClient
     */
    static std::unique_ptr<RemoteStoreClient> from_env(const std::string& env_var,
                                                       const std::string& default_endpoint) {
        const char* endpoint = std::getenv(env_var.c_str());
        return connect(endpoint ? endpoint : default_endpoint);
    }

    RemoteStoreClient(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds timeout)
        : stub_(RemoteStoreService::NewStub(channel)), timeout_(timeout) {}

    google::protobuf::Struct insert(Entity entity, const google::protobuf::Struct& row) override {
        InsertRequest request;
        request.set_table(to_string(entity));
        *request.mutable_row() = row;
        RowResponse response;
        auto context = make_context();
        check(stub_->Insert(context.get(), request, &response));
        return response.row();
    }

    void update(Entity entity, const std::string& id,
                const google::protobuf::Struct& patch) override {
        UpdateRequest request;
        request.set_table(to_string(entity));
        request.set_id(id);
        *request.mutable_patch() = patch;
        google::protobuf::Empty response;
        auto context = make_context();
        check(stub_->Update(context.get(), request, &response));
    }

    void remove(Entity entity, const std::string& id) override {
        DeleteRequest request;
        request.set_table(to_string(entity));
        request.set_id(id);
        google::protobuf::Empty response;
        auto context = make_context();
        check(stub_->Delete(context.get(), request, &response));
    }

    std::optional<google::protobuf::Timestamp> fetch_updated_at(Entity entity,
                                                                const std::string& id) override {
        RecordRef request;
        request.set_table(to_string(entity));
        request.set_id(id);
        UpdatedAtResponse response;
        auto context = make_context();
        check(stub_->FetchUpdatedAt(context.get(), request, &response));
        if (!response.exists()) return std::nullopt;
        return response.updated_at();
    }

    int64_t count(Entity entity) override {
        TableRef request;
        request.set_table(to_string(entity));
        CountResponse response;
        auto context = make_context();
        check(stub_->Count(context.get(), request, &response));
        return response.count();
    }

    std::vector<google::protobuf::Struct> list(Entity entity) override {
        TableRef request;
        request.set_table(to_string(entity));
        ListResponse response;
        auto context = make_context();
        check(stub_->List(context.get(), request, &response));
        return {response.rows().begin(), response.rows().end()};
    }

private:
    std::unique_ptr<RemoteStoreService::Stub> stub_;
    std::chrono::milliseconds timeout_;

    std::unique_ptr<grpc::ClientContext> make_context() const {
        auto context = std::make_unique<grpc::ClientContext>();
        context->set_deadline(std::chrono::system_clock::now() + timeout_);
        return context;
    }

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
        return endpoint.substr(pos + 3);
    }
};

} // namespace stockline
