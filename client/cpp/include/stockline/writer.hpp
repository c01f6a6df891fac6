#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <google/protobuf/struct.pb.h>
#include "compensation.hpp"
#include "connectivity.hpp"
#include "entity_cache.hpp"
#include "errors.hpp"
#include "operation_log.hpp"
#include "remote_store.hpp"
#include "types.hpp"

namespace stockline {

/**
 * Carries every local mutation through the same steps.
 *
 * The cache is updated first so the UI sees the change at once. When online
 * the remote store is called directly; a transient failure (or being offline)
 * leaves the change in the pending operation log instead. A rejection or a
 * failure to enqueue undoes the cache change before the error reaches the
 * caller.
 *
 * Writes are refused while the log holds unresolved conflicts, and while a
 * hold is in place.
 */
class EntityWriter {
public:
    /// Remote message prefix for an OUT that would overdraw stock.
    static constexpr const char* kInsufficientStockPrefix = "insufficient_stock:";

    EntityWriter(EntityCache& cache, OperationLog& log, RemoteStore* remote,
                 Connectivity& connectivity);

    /**
     * @throws GuardBlockedError while a hold is in place
     * @throws ConflictsPendingError while conflicts await resolution
     * @throws InsufficientStockError when the remote reports too little stock
     * @throws ClientError when the remote rejects the row
     * @throws StorageError / QueueFullError when the write cannot be queued
     */
    LocalMutation create(Entity entity, const google::protobuf::Struct& row);

    /**
     * Overlay columns onto a cached row. The row's updated_at is recorded so
     * a replay can detect a concurrent remote edit.
     *
     * @throws InvalidArgumentError if the row is not cached
     */
    LocalMutation update(Entity entity, const std::string& id,
                         const google::protobuf::Struct& patch);

    LocalMutation remove(Entity entity, const std::string& id);

    /**
     * Undo a mutation made earlier: dismiss its queued operation, or undo the
     * remote write when it was already confirmed, then restore the cache.
     * Never throws; a remote undo that fails is queued and logged.
     */
    void revert(const LocalMutation& mutation) noexcept;

    /**
     * Copy the remote's current updated_at for a confirmed write into the
     * cached row, and move queued edits of the same row that captured the old
     * stamp onto the new one.
     */
    void adopt_remote_stamp(const PendingOperation& op);

    /// Refuse create, update and remove until release().
    void hold(const std::string& reason);
    void release();
    bool held() const;

private:
    void check_writable() const;
    LocalMutation execute(PendingOperation op, CompensatingPatch undo);
    void send(const PendingOperation& op, google::protobuf::Struct* stored);
    void compensate_remote(const LocalMutation& mutation);
    static PendingOperation inverse_of(const LocalMutation& mutation);

    [[noreturn]] static void rethrow_rejection(const ClientError& error,
                                               const PendingOperation& op);

    EntityCache& cache_;
    OperationLog& log_;
    RemoteStore* remote_;
    Connectivity& connectivity_;

    mutable std::mutex hold_mutex_;
    std::optional<std::string> hold_reason_;
};

} // namespace stockline
