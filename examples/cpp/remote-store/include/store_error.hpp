#pragma once

#include <grpcpp/grpcpp.h>
#include <stdexcept>
#include <string>

namespace remote_store {

class StoreError : public std::runtime_error {
public:
    enum class StatusCode {
        InvalidArgument,
        FailedPrecondition,
        AlreadyExists,
        NotFound
    };

    StoreError(const std::string& message, StatusCode code)
        : std::runtime_error(message), code_(code) {}

    static StoreError invalid_argument(const std::string& message) {
        return StoreError(message, StatusCode::InvalidArgument);
    }

    static StoreError failed_precondition(const std::string& message) {
        return StoreError(message, StatusCode::FailedPrecondition);
    }

    static StoreError already_exists(const std::string& message) {
        return StoreError(message, StatusCode::AlreadyExists);
    }

    static StoreError not_found(const std::string& message) {
        return StoreError(message, StatusCode::NotFound);
    }

    StatusCode code() const { return code_; }

    grpc::Status to_grpc_status() const {
        switch (code_) {
            case StatusCode::InvalidArgument:
                return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
            case StatusCode::FailedPrecondition:
                return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, what());
            case StatusCode::AlreadyExists:
                return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, what());
            case StatusCode::NotFound:
                return grpc::Status(grpc::StatusCode::NOT_FOUND, what());
            default:
                return grpc::Status(grpc::StatusCode::UNKNOWN, what());
        }
    }

private:
    StatusCode code_;
};

}  // namespace remote_store
