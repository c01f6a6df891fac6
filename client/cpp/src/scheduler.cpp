#include "stockline/scheduler.hpp"
#include "stockline/errors.hpp"
#include "stockline/logging.hpp"

#include <algorithm>

namespace stockline {

SyncScheduler::SyncScheduler(SyncProcessor& processor, Connectivity& connectivity,
                             StorageHealthMonitor* monitor, SchedulerOptions options)
    : processor_(processor), connectivity_(connectivity), monitor_(monitor),
      options_(options) {}

SyncScheduler::~SyncScheduler() {
    stop();
}

void SyncScheduler::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        triggered_ = false;
        rearmed_ = false;
    }
    if (realtime_) {
        realtime_->set_armed_callback([this] { rearm(); });
    }
    was_online_ = connectivity_.online();
    listener_ = connectivity_.add_listener([this](const ConnectionState& state) {
        bool was_online = was_online_.exchange(state.online);
        if (state.online && !was_online) {
            trigger();
        }
    });
    worker_ = std::thread([this] { run(); });
    log_info("scheduler", "scheduler_started", {
        {"sync_interval_ms", options_.sync_interval.count()},
        {"health_interval_ms", options_.health_check_interval.count()}
    });
}

void SyncScheduler::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    wake_.notify_one();
}

void SyncScheduler::rearm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rearmed_ = true;
    }
    wake_.notify_one();
}

void SyncScheduler::stop() {
    if (!running_.load()) return;
    connectivity_.remove_listener(listener_);
    if (realtime_) {
        realtime_->set_armed_callback(nullptr);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_one();
    if (worker_.joinable()) worker_.join();
    running_ = false;
    log_info("scheduler", "scheduler_stopped");
}

void SyncScheduler::run() {
    using clock = std::chrono::steady_clock;
    auto next_sync = clock::now();
    auto next_health = clock::now();

    while (true) {
        bool drain_now = false;
        bool health_now = false;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto until = monitor_ ? std::min(next_sync, next_health) : next_sync;
            if (realtime_) {
                if (auto left = realtime_->time_to_deadline()) {
                    until = std::min(until, clock::now() + *left);
                }
            }
            wake_.wait_until(lock, until,
                             [this] { return stopping_ || triggered_ || rearmed_; });
            if (stopping_) return;

            auto now = clock::now();
            drain_now = triggered_ || now >= next_sync;
            health_now = monitor_ && now >= next_health;
            triggered_ = false;
            rearmed_ = false;
        }

        apply_due_changes();

        if (health_now) {
            monitor_->check();
            next_health = clock::now() + options_.health_check_interval;
        }
        if (drain_now) {
            drain_once();
            next_sync = clock::now() + options_.sync_interval;
        }
    }
}

void SyncScheduler::apply_due_changes() {
    if (!realtime_) return;
    try {
        realtime_->poll();
    } catch (const ClientError& e) {
        log_error("scheduler", "realtime_apply_failed", {{"error", e.what()}});
    }
}

void SyncScheduler::drain_once() {
    if (!connectivity_.online()) return;
    try {
        processor_.drain();
    } catch (const ClientError& e) {
        log_error("scheduler", "drain_failed", {{"error", e.what()}});
    }
}

} // namespace stockline
