#include "stockline/storage_health.hpp"
#include "stockline/logging.hpp"

#include <cmath>

namespace stockline {

StorageHealthMonitor::StorageHealthMonitor(const DurableStore& store,
                                           std::chrono::milliseconds warning_ttl,
                                           Clock clock)
    : store_(store), warning_ttl_(warning_ttl), clock_(std::move(clock)) {}

StorageUsage StorageHealthMonitor::usage() const {
    StorageUsage usage;
    usage.used = store_.usage_bytes();
    usage.total = store_.capacity_bytes();
    double percent = usage.total == 0
        ? 100.0
        : static_cast<double>(usage.used) * 100.0 / static_cast<double>(usage.total);
    usage.percent_used = std::round(percent * 10.0) / 10.0;
    usage.near_limit = percent > kNearLimitPercent;
    return usage;
}

HealthStatus StorageHealthMonitor::check() {
    HealthStatus status;
    status.usage = usage();

    if (status.usage.percent_used > kCriticalPercent) {
        status.healthy = false;
        status.message = "Storage is critically full. Some data may not be saved.";
    } else if (status.usage.percent_used > kNearLimitPercent) {
        status.message = "Storage is getting full. Old data will be cleaned up automatically.";
    }

    if (status.usage.near_limit) {
        CleanupHook cleanup;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cleanup = cleanup_;
        }
        if (cleanup) {
            log_info("storage", "running_cache_cleanup",
                     {{"percent_used", status.usage.percent_used}});
            cleanup(status.usage.percent_used);
        }
    }

    if (status.message) {
        notify(*status.message);
    }
    return status;
}

void StorageHealthMonitor::set_warning_callback(WarningCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void StorageHealthMonitor::clear_warning_callback() {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = nullptr;
}

void StorageHealthMonitor::set_cleanup_hook(CleanupHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_ = std::move(hook);
}

void StorageHealthMonitor::notify(const std::string& message) {
    log_warn("storage", "storage_warning", {{"warning", message}});

    WarningCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_warning_ = message;
        last_warning_at_ = clock_();
        callback = callback_;
    }
    if (callback) {
        callback(message);
    }
}

std::optional<std::string> StorageHealthMonitor::active_warning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_warning_) return std::nullopt;
    if (clock_() - last_warning_at_ >= warning_ttl_.count()) return std::nullopt;
    return last_warning_;
}

} // namespace stockline
