#include "stockline/connectivity.hpp"
#include "stockline/errors.hpp"
#include "stockline/logging.hpp"

#include <vector>

namespace stockline {

std::string to_string(ConnectionQuality quality) {
    switch (quality) {
        case ConnectionQuality::Excellent: return "excellent";
        case ConnectionQuality::Good: return "good";
        case ConnectionQuality::Slow: return "slow";
        case ConnectionQuality::Poor: return "poor";
        case ConnectionQuality::Offline: return "offline";
    }
    return "unknown";
}

Connectivity::Connectivity(bool online, Clock clock)
    : clock_(std::move(clock)) {
    state_.online = online;
    state_.quality = online ? ConnectionQuality::Good : ConnectionQuality::Offline;
}

bool Connectivity::online() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.online;
}

ConnectionState Connectivity::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ConnectionQuality Connectivity::quality() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.quality;
}

ConnectionQuality Connectivity::classify(std::chrono::milliseconds latency) {
    auto ms = latency.count();
    if (ms < 300) return ConnectionQuality::Excellent;
    if (ms < 800) return ConnectionQuality::Good;
    if (ms < 2000) return ConnectionQuality::Slow;
    return ConnectionQuality::Poor;
}

void Connectivity::set_online(bool online) {
    ConnectionState next = state();
    if (next.online == online) return;
    next.online = online;
    next.quality = online ? ConnectionQuality::Good : ConnectionQuality::Offline;
    next.latency_ms = 0;
    next.last_check = clock_();
    log_info("connectivity", online ? "went_online" : "went_offline");
    publish(next);
}

ConnectionQuality Connectivity::record_latency(std::chrono::milliseconds latency) {
    ConnectionState next = state();
    if (!next.online) return ConnectionQuality::Offline;
    next.quality = classify(latency);
    next.latency_ms = latency.count();
    next.last_check = clock_();
    publish(next);
    return next.quality;
}

ConnectionState Connectivity::probe(RemoteStore& remote) {
    if (!online()) return state();

    auto started = std::chrono::steady_clock::now();
    try {
        remote.count(Entity::Categories);
    } catch (const ClientError& e) {
        ConnectionState next = state();
        next.quality = ConnectionQuality::Poor;
        next.latency_ms = kFailedProbeLatencyMs;
        next.last_check = clock_();
        log_warn("connectivity", "probe_failed", {{"error", e.what()}});
        publish(next);
        return next;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    record_latency(elapsed);
    return state();
}

size_t Connectivity::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto handle = next_handle_++;
    listeners_[handle] = std::move(listener);
    return handle;
}

void Connectivity::remove_listener(size_t handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(handle);
}

void Connectivity::publish(ConnectionState next) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = next;
        for (const auto& [_, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        listener(next);
    }
}

} // namespace stockline
