#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include "helpers.hpp"
#include "remote_store.hpp"

namespace stockline {

enum class ConnectionQuality {
    Excellent,
    Good,
    Slow,
    Poor,
    Offline
};

std::string to_string(ConnectionQuality quality);

struct ConnectionState {
    bool online = true;
    ConnectionQuality quality = ConnectionQuality::Good;
    int64_t latency_ms = 0;
    int64_t last_check = 0;
};

/**
 * Tracks whether the remote store is reachable and how well.
 *
 * Listeners are told about every state change; an offline to online
 * transition is what wakes the sync scheduler.
 */
class Connectivity {
public:
    using Listener = std::function<void(const ConnectionState&)>;
    using Clock = std::function<int64_t()>;

    /// Latency assumed when a probe fails outright.
    static constexpr int64_t kFailedProbeLatencyMs = 10000;

    explicit Connectivity(bool online = true, Clock clock = helpers::now_millis);

    bool online() const;
    ConnectionState state() const;
    ConnectionQuality quality() const;

    void set_online(bool online);

    /// Classify a measured round trip and publish the result.
    ConnectionQuality record_latency(std::chrono::milliseconds latency);

    /**
     * Time a lightweight count against the remote store. A failed probe
     * leaves the online flag alone and reports Poor quality.
     */
    ConnectionState probe(RemoteStore& remote);

    /// @return a handle for remove_listener()
    size_t add_listener(Listener listener);
    void remove_listener(size_t handle);

    static ConnectionQuality classify(std::chrono::milliseconds latency);

private:
    void publish(ConnectionState state);

    Clock clock_;
    mutable std::mutex mutex_;
    ConnectionState state_;
    std::map<size_t, Listener> listeners_;
    size_t next_handle_ = 1;
};

} // namespace stockline
