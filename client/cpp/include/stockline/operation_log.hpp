#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "durable_store.hpp"
#include "helpers.hpp"
#include "types.hpp"

namespace stockline {

class StorageHealthMonitor;

/// Outcome of withdrawing a queued operation before it reaches the remote.
enum class WithdrawResult {
    Withdrawn,  ///< removed; the remote never saw it
    InFlight,   ///< a drain is sending it right now; it stays queued
    Absent      ///< not queued (already confirmed or never queued)
};

struct LogOptions {
    size_t max_pending_ops = 2000;
    std::string storage_key = "queue/pending_ops";
    std::function<int64_t()> clock = helpers::now_millis;
};

/**
 * Durable, ordered queue of mutations the remote store has not confirmed.
 *
 * Every state transition happens under one mutex and is flushed to the
 * durable store before the lock is released. A failed flush restores the
 * previous in-memory state, is reported to the storage monitor, and throws
 * StorageError to the caller; an operation is never dropped silently.
 *
 * The log never deduplicates: two equal operations stay two entries.
 *
 * Example:
 *   OperationLog log(store, {}, &monitor);
 *   log.load();
 *   PendingOperation op;
 *   op.entity = Entity::Transactions;
 *   op.action = Action::Create;
 *   op.payload = helpers::to_row(tx);
 *   auto queued = log.enqueue(op);
 */
class OperationLog {
public:
    explicit OperationLog(DurableStore& store, LogOptions options = {},
                          StorageHealthMonitor* monitor = nullptr);

    /**
     * Replace the in-memory queue with the persisted one. Entries persisted
     * as syncing were interrupted mid-call and come back as pending.
     *
     * @throws StorageError if the persisted queue cannot be read
     */
    void load();

    /**
     * Append an operation. Assigns id and created_at when empty and sets the
     * status to pending.
     *
     * @throws QueueFullError when the log is at capacity
     * @throws StorageError when the flush fails
     */
    PendingOperation enqueue(PendingOperation op);

    std::vector<PendingOperation> all() const;
    std::vector<PendingOperation> list_pending() const;
    std::vector<PendingOperation> list_conflicts() const;
    std::vector<PendingOperation> list_failed() const;
    std::optional<PendingOperation> find(const std::string& id) const;
    OpsSummary summary() const;
    bool has_conflicts() const;
    size_t size() const;

    /**
     * Put a conflicted or failed entry back in line. The human has decided,
     * so the stale expected_updated_at and the retry count are cleared.
     *
     * @param only_if when set, the entry must currently have this status
     * @return false if the id is unknown or the entry is not retryable
     */
    bool retry(const std::string& id, std::optional<OpStatus> only_if = std::nullopt);

    /**
     * Remove an entry for good. The optimistic local change is left alone.
     *
     * @param only_if when set, the entry must currently have this status
     * @return false if the id is unknown or has another status
     */
    bool dismiss(const std::string& id, std::optional<OpStatus> only_if = std::nullopt);

    /**
     * Remove an entry the remote has not been sent yet. An entry a drain is
     * currently sending is left in place and reported as InFlight.
     */
    WithdrawResult withdraw(const std::string& id);

    /**
     * Point pending entries for one record that still expect `from` at the
     * stamp the remote assigned since they were queued.
     *
     * @return number of entries rebased
     */
    size_t rebase_expected(Entity entity, const std::string& record_id, int64_t from, int64_t to);

    /// Oldest pending entry by created_at, queue order breaking ties.
    std::optional<PendingOperation> next_pending() const;

    /**
     * pending -> syncing. Returns false when the entry is gone or someone
     * else already picked it up.
     */
    bool begin_sync(const std::string& id);

    /// syncing -> done; the entry leaves the queue.
    void complete(const std::string& id);

    void mark_conflict(const std::string& id, const std::string& message);

    /**
     * Record a transient failure. Within the retry budget the entry goes back
     * to pending; past it the entry becomes failed.
     *
     * @return the resulting status
     */
    OpStatus mark_transient(const std::string& id, const std::string& message, int retry_budget);

    void mark_failed(const std::string& id, const std::string& message);

private:
    template<typename Mutation>
    auto transact(Mutation&& mutate);

    void persist_locked();
    std::vector<PendingOperation> with_status(OpStatus status) const;

    DurableStore& store_;
    LogOptions options_;
    StorageHealthMonitor* monitor_;

    mutable std::mutex mutex_;
    std::vector<PendingOperation> ops_;
};

} // namespace stockline
