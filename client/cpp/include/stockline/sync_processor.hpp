#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include "operation_log.hpp"
#include "remote_store.hpp"
#include "types.hpp"

namespace stockline {

struct SyncOptions {
    /// Transient failures tolerated per operation before it is marked failed.
    int retry_budget = 3;
    /// Called for every operation the remote store confirmed.
    std::function<void(const PendingOperation&)> on_synced;
};

struct SyncReport {
    size_t processed = 0;
    size_t conflicts = 0;
    size_t failed = 0;
    size_t deferred = 0;
    /// True when another pass was already running; it picks up this request.
    bool coalesced = false;
};

/**
 * Replays the pending operation log against the remote store.
 *
 * Only one pass runs at a time. A drain() that arrives while a pass is active
 * returns at once with coalesced set, and the active pass sweeps the log again
 * before it returns. The remote store is never called while a lock is held.
 *
 * Operations are replayed one at a time in created_at order across all
 * tables. A transient failure that leaves budget ends the sweep; conflicts and
 * exhausted operations are set aside and the sweep moves on.
 */
class SyncProcessor {
public:
    SyncProcessor(OperationLog& log, RemoteStore& remote, SyncOptions options = {});

    SyncReport drain();

    bool active() const;

private:
    enum class Outcome { Done, Conflict, Deferred, Failed };

    void sweep(SyncReport& report);
    Outcome process(const PendingOperation& op);

    /// Returns a conflict message, or nullopt once the remote accepted the op.
    std::optional<std::string> replay(const PendingOperation& op);

    OperationLog& log_;
    RemoteStore& remote_;
    SyncOptions options_;

    /// Guards active_ and follow_up_ together so a request is never lost
    /// between the last sweep and the end of the pass.
    mutable std::mutex flight_mutex_;
    bool active_ = false;
    bool follow_up_ = false;
};

} // namespace stockline
