#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>
#include "helpers.hpp"

namespace stockline {

/**
 * Collects bursts of events and hands them over at most once per window.
 *
 * The first event after a quiet window is delivered straight away. Events
 * arriving inside the window are buffered until its deadline, when poll()
 * returns them in arrival order.
 *
 * Example:
 *   Coalescer<RemoteChange> changes(std::chrono::seconds(2));
 *   if (auto batch = changes.push(change)) apply(*batch);
 *   ...
 *   if (auto batch = changes.poll()) apply(*batch);
 */
template<typename T>
class Coalescer {
public:
    using Batch = std::vector<T>;
    using Clock = std::function<int64_t()>;

    explicit Coalescer(std::chrono::milliseconds window, Clock clock = helpers::now_millis)
        : window_(window.count()), clock_(std::move(clock)) {}

    /// Returns a batch when the event may be delivered now.
    std::optional<Batch> push(T event) {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.push_back(std::move(event));
        auto now = clock_();
        if (!deadline_ && (!last_delivery_ || now - *last_delivery_ >= window_)) {
            return take_locked(now);
        }
        if (!deadline_) {
            deadline_ = *last_delivery_ + window_;
        }
        return std::nullopt;
    }

    /// Returns the buffered batch once its deadline has passed.
    std::optional<Batch> poll() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        if (!deadline_ || now < *deadline_) return std::nullopt;
        return take_locked(now);
    }

    /// Deliver whatever is buffered regardless of the window.
    std::optional<Batch> flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (buffer_.empty()) return std::nullopt;
        return take_locked(clock_());
    }

    /// Time of the pending delivery, if events are buffered.
    std::optional<int64_t> deadline() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deadline_;
    }

    /// Milliseconds until the pending delivery, zero once it is due.
    std::optional<int64_t> remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!deadline_) return std::nullopt;
        auto left = *deadline_ - clock_();
        return left > 0 ? left : 0;
    }

    size_t buffered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return buffer_.size();
    }

private:
    Batch take_locked(int64_t now) {
        Batch batch;
        batch.swap(buffer_);
        deadline_.reset();
        last_delivery_ = now;
        return batch;
    }

    int64_t window_;
    Clock clock_;
    mutable std::mutex mutex_;
    Batch buffer_;
    std::optional<int64_t> deadline_;
    std::optional<int64_t> last_delivery_;
};

} // namespace stockline
