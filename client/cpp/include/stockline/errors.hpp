#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace stockline {

/**
 * Base exception for all stockline errors.
 */
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if this is a "not found" error.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if this is a "precondition failed" error.
     */
    virtual bool is_precondition_failed() const { return false; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if this is a connection or transport error.
     */
    virtual bool is_connection_error() const { return false; }
};

/**
 * Thrown when the remote store refuses a write.
 *
 * The record changed since the write was queued, a constraint failed, or the
 * remote business rules said no. Retrying the same write will not help; a
 * human has to decide.
 */
class RemoteRejectedError : public ClientError {
public:
    explicit RemoteRejectedError(const std::string& message)
        : ClientError(message) {}

    bool is_precondition_failed() const override { return true; }
};

/**
 * Thrown when a gRPC call fails.
 */
class GrpcError : public ClientError {
public:
    GrpcError(const std::string& message, grpc::StatusCode status_code)
        : ClientError(message), status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    bool is_not_found() const override {
        return status_code_ == grpc::StatusCode::NOT_FOUND;
    }

    bool is_precondition_failed() const override {
        return status_code_ == grpc::StatusCode::FAILED_PRECONDITION ||
               status_code_ == grpc::StatusCode::ABORTED ||
               status_code_ == grpc::StatusCode::ALREADY_EXISTS;
    }

    bool is_invalid_argument() const override {
        return status_code_ == grpc::StatusCode::INVALID_ARGUMENT;
    }

    bool is_connection_error() const override {
        switch (status_code_) {
            case grpc::StatusCode::UNAVAILABLE:
            case grpc::StatusCode::DEADLINE_EXCEEDED:
            case grpc::StatusCode::RESOURCE_EXHAUSTED:
            case grpc::StatusCode::CANCELLED:
            case grpc::StatusCode::INTERNAL:
            case grpc::StatusCode::UNKNOWN:
                return true;
            default:
                return false;
        }
    }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when connection to the server fails.
 */
class ConnectionError : public ClientError {
public:
    explicit ConnectionError(const std::string& message)
        : ClientError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Thrown when transport-level errors occur (timeouts, dropped links).
 */
class TransportError : public ClientError {
public:
    explicit TransportError(const std::string& message)
        : ClientError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public ClientError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : ClientError(message) {}

    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when an OUT movement would drive stock below zero.
 *
 * Carries the quantity that is actually available so the caller can offer a
 * corrected quantity.
 */
class InsufficientStockError : public ClientError {
public:
    InsufficientStockError(int64_t available, int64_t requested)
        : ClientError("Insufficient stock: " + std::to_string(available) +
                      " available, " + std::to_string(requested) + " requested"),
          available_(available), requested_(requested) {}

    int64_t available() const { return available_; }
    int64_t requested() const { return requested_; }

    bool is_precondition_failed() const override { return true; }

private:
    int64_t available_;
    int64_t requested_;
};

/**
 * Thrown when a write is attempted while sync conflicts await resolution.
 */
class ConflictsPendingError : public ClientError {
public:
    ConflictsPendingError()
        : ClientError("Sync conflicts detected. Resolve conflicts before making changes.") {}

    bool is_precondition_failed() const override { return true; }
};

/**
 * Thrown when a write or a sync is attempted while the data-loss guard is
 * waiting for the user to acknowledge an empty cloud.
 */
class GuardBlockedError : public ClientError {
public:
    explicit GuardBlockedError(const std::string& reason)
        : ClientError("Sync is paused: " + reason) {}

    bool is_precondition_failed() const override { return true; }
};

/**
 * Thrown when durable local storage cannot be written.
 */
class StorageError : public ClientError {
public:
    explicit StorageError(const std::string& message)
        : ClientError(message) {}
};

/**
 * Thrown when the pending operation log is at capacity.
 */
class QueueFullError : public ClientError {
public:
    explicit QueueFullError(size_t limit)
        : ClientError("Pending operations limit reached (" + std::to_string(limit) +
                      "). Please connect to the internet to sync your changes."),
          limit_(limit) {}

    size_t limit() const { return limit_; }

private:
    size_t limit_;
};

/**
 * Returns true when an error should leave an operation queued for a later
 * attempt rather than surface it as a conflict.
 */
inline bool is_transient(const ClientError& error) {
    return error.is_connection_error();
}

} // namespace stockline
