#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "config.hpp"
#include "conflict_resolver.hpp"
#include "connectivity.hpp"
#include "data_guard.hpp"
#include "durable_store.hpp"
#include "entity_cache.hpp"
#include "notification_sink.hpp"
#include "operation_log.hpp"
#include "orchestrator.hpp"
#include "realtime.hpp"
#include "remote_store.hpp"
#include "scheduler.hpp"
#include "storage_health.hpp"
#include "sync_processor.hpp"
#include "writer.hpp"

namespace stockline {

/**
 * Wires the offline-first core together for a UI layer.
 *
 * Example:
 *   auto config = Config::from_env();
 *   InventoryClient client(config);
 *   auto guard = client.open();
 *   if (guard.blocked) ask_user(guard.reason);
 *   client.start();
 *   client.orchestrator().record(request);
 */
class InventoryClient {
public:
    /// File-backed storage under config.data_dir and a gRPC remote store.
    explicit InventoryClient(Config config, NotificationSink* sink = nullptr);

    InventoryClient(Config config, std::unique_ptr<DurableStore> store,
                    std::unique_ptr<RemoteStore> remote, NotificationSink* sink = nullptr);

    ~InventoryClient();

    InventoryClient(const InventoryClient&) = delete;
    InventoryClient& operator=(const InventoryClient&) = delete;

    /**
     * Load the pending log and the cache, check storage health and evaluate
     * the data guard. Unless the guard blocks, tables without pending
     * changes are refreshed from the remote store. While it blocks, writes
     * throw GuardBlockedError and start() refuses to sync.
     *
     * @throws StorageError if the pending log cannot be read
     */
    GuardDecision open();

    /// Continue after the user accepted a blocked guard.
    void acknowledge_guard();

    /**
     * Replace cached tables with remote listings. Tables with operations in
     * the pending log keep their optimistic state.
     */
    void refresh();

    /// @throws GuardBlockedError until a blocked guard is acknowledged
    void start();
    void stop();

    bool guard_blocked() const { return guard_blocked_.load(); }

    OpsSummary summary() const { return log_.summary(); }

    TransactionOrchestrator& orchestrator() { return orchestrator_; }
    ConflictResolver& conflicts() { return resolver_; }
    SyncProcessor& processor() { return processor_; }
    StorageHealthMonitor& monitor() { return monitor_; }
    Connectivity& connectivity() { return connectivity_; }
    RealtimeApplier& realtime() { return realtime_; }
    EntityCache& cache() { return cache_; }
    OperationLog& log() { return log_; }
    const Config& config() const { return config_; }

private:
    void prune_for(double percent_used);
    void on_synced(const PendingOperation& op);

    Config config_;
    std::unique_ptr<DurableStore> store_;
    std::unique_ptr<RemoteStore> remote_;
    StorageHealthMonitor monitor_;
    EntityCache cache_;
    OperationLog log_;
    Connectivity connectivity_;
    EntityWriter writer_;
    SyncProcessor processor_;
    ConflictResolver resolver_;
    TransactionOrchestrator orchestrator_;
    DataGuard guard_;
    RealtimeApplier realtime_;
    SyncScheduler scheduler_;

    std::atomic<bool> guard_blocked_{false};
    std::string guard_reason_;
};

} // namespace stockline
