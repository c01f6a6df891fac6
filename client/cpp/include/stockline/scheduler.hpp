#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include "connectivity.hpp"
#include "realtime.hpp"
#include "storage_health.hpp"
#include "sync_processor.hpp"

namespace stockline {

struct SchedulerOptions {
    std::chrono::milliseconds sync_interval{30000};
    std::chrono::milliseconds health_check_interval{60000};
};

/**
 * Background worker that keeps the pending log draining.
 *
 * Drains every sync_interval while online, immediately when connectivity
 * comes back, and whenever trigger() is called. Runs a storage health check
 * at start and every health_check_interval. All drains go through
 * SyncProcessor::drain(), so a trigger that lands during a pass is coalesced.
 *
 * With a RealtimeApplier attached, the worker also wakes when a buffered
 * batch of remote changes is due and applies it.
 */
class SyncScheduler {
public:
    SyncScheduler(SyncProcessor& processor, Connectivity& connectivity,
                  StorageHealthMonitor* monitor, SchedulerOptions options = {});
    ~SyncScheduler();

    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    /// Call before start(). The applier must outlive the scheduler.
    void attach_realtime(RealtimeApplier* realtime) { realtime_ = realtime; }

    void start();

    /// Wake the worker for a drain as soon as possible.
    void trigger();

    /// Stop the worker and wait for the current pass to finish.
    void stop();

    bool running() const { return running_.load(); }

private:
    void run();
    void drain_once();
    void apply_due_changes();
    void rearm();

    SyncProcessor& processor_;
    Connectivity& connectivity_;
    StorageHealthMonitor* monitor_;
    SchedulerOptions options_;
    RealtimeApplier* realtime_ = nullptr;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    bool triggered_ = false;
    bool rearmed_ = false;
    std::atomic<bool> running_{false};
    std::atomic<bool> was_online_{false};
    size_t listener_ = 0;
    std::thread worker_;
};

} // namespace stockline
