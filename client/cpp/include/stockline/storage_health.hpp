#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include "durable_store.hpp"
#include "helpers.hpp"

namespace stockline {

struct StorageUsage {
    size_t used = 0;
    size_t total = 0;
    double percent_used = 0.0;
    bool near_limit = false;
};

struct HealthStatus {
    bool healthy = true;
    std::optional<std::string> message;
    StorageUsage usage;
};

/**
 * Watches durable storage utilization and tells the UI about it.
 *
 * The monitor only detects and notifies. Relief comes from the cleanup hook
 * the owner registers (pruning old cached transactions).
 *
 * Example:
 *   StorageHealthMonitor monitor(store);
 *   monitor.set_warning_callback([](const std::string& msg) { show_banner(msg); });
 *   auto status = monitor.check();
 */
class StorageHealthMonitor {
public:
    using WarningCallback = std::function<void(const std::string&)>;
    using CleanupHook = std::function<void(double percent_used)>;
    using Clock = std::function<int64_t()>;

    static constexpr double kNearLimitPercent = 80.0;
    static constexpr double kCriticalPercent = 95.0;

    explicit StorageHealthMonitor(const DurableStore& store,
                                  std::chrono::milliseconds warning_ttl = std::chrono::seconds(10),
                                  Clock clock = helpers::now_millis);

    StorageUsage usage() const;

    /**
     * Classify current usage, run the cleanup hook when near the limit and
     * forward any message to the warning callback.
     */
    HealthStatus check();

    void set_warning_callback(WarningCallback callback);
    void clear_warning_callback();

    void set_cleanup_hook(CleanupHook hook);

    /**
     * Report a storage problem found elsewhere (a failed flush).
     */
    void notify(const std::string& message);

    /**
     * The latest warning, until it has been visible for the warning TTL.
     */
    std::optional<std::string> active_warning() const;

private:
    const DurableStore& store_;
    std::chrono::milliseconds warning_ttl_;
    Clock clock_;

    mutable std::mutex mutex_;
    WarningCallback callback_;
    CleanupHook cleanup_;
    std::optional<std::string> last_warning_;
    int64_t last_warning_at_ = 0;
};

/**
 * How many days of cached transactions to keep at a given utilization.
 */
inline int retention_days_for(double percent_used) {
    if (percent_used > 90.0) return 7;
    if (percent_used > 70.0) return 14;
    return 30;
}

} // namespace stockline
