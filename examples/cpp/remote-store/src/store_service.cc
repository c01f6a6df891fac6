#include "store_logic.hpp"
#include "store_error.hpp"
#include "stockline/logging.hpp"
#include "stockline/remote_store.grpc.pb.h"
#include <grpcpp/grpcpp.h>

namespace remote_store {

class StoreService final : public stockline::RemoteStoreService::Service {
public:
    grpc::Status Insert(grpc::ServerContext* context, const stockline::InsertRequest* request,
                        stockline::RowResponse* response) override {
        try {
            *response->mutable_row() = logic_.insert(request->table(), request->row());
            stockline::log_info("remote_store", "row_inserted", {{"table", request->table()}});
            return grpc::Status::OK;
        } catch (const StoreError& e) {
            stockline::log_warn("remote_store", "insert_rejected",
                                {{"table", request->table()}, {"error", e.what()}});
            return e.to_grpc_status();
        }
    }

    grpc::Status Update(grpc::ServerContext* context, const stockline::UpdateRequest* request,
                        google::protobuf::Empty* response) override {
        try {
            logic_.update(request->table(), request->id(), request->patch());
            stockline::log_info("remote_store", "row_updated",
                                {{"table", request->table()}, {"id", request->id()}});
            return grpc::Status::OK;
        } catch (const StoreError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status Delete(grpc::ServerContext* context, const stockline::DeleteRequest* request,
                        google::protobuf::Empty* response) override {
        try {
            logic_.remove(request->table(), request->id());
            stockline::log_info("remote_store", "row_deleted",
                                {{"table", request->table()}, {"id", request->id()}});
            return grpc::Status::OK;
        } catch (const StoreError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status FetchUpdatedAt(grpc::ServerContext* context, const stockline::RecordRef* request,
                                stockline::UpdatedAtResponse* response) override {
        try {
            auto updated_at = logic_.updated_at(request->table(), request->id());
            response->set_exists(updated_at.has_value());
            if (updated_at) *response->mutable_updated_at() = *updated_at;
            return grpc::Status::OK;
        } catch (const StoreError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status Count(grpc::ServerContext* context, const stockline::TableRef* request,
                       stockline::CountResponse* response) override {
        try {
            response->set_count(logic_.count(request->table()));
            return grpc::Status::OK;
        } catch (const StoreError& e) {
            return e.to_grpc_status();
        }
    }

    grpc::Status List(grpc::ServerContext* context, const stockline::TableRef* request,
                      stockline::ListResponse* response) override {
        try {
            for (auto& row : logic_.list(request->table())) {
                *response->add_rows() = std::move(row);
            }
            return grpc::Status::OK;
        } catch (const StoreError& e) {
            return e.to_grpc_status();
        }
    }

private:
    StoreLogic logic_;
};

std::unique_ptr<stockline::RemoteStoreService::Service> create_store_service() {
    return std::make_unique<StoreService>();
}

}  // namespace remote_store
