#include "stockline/realtime.hpp"
#include "stockline/errors.hpp"
#include "stockline/helpers.hpp"
#include "stockline/logging.hpp"

namespace stockline {

RealtimeApplier::RealtimeApplier(EntityCache& cache, std::chrono::milliseconds window,
                                 Coalescer<RemoteChange>::Clock clock)
    : cache_(cache), coalescer_(window, std::move(clock)) {}

void RealtimeApplier::set_armed_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(armed_mutex_);
    armed_ = std::move(callback);
}

std::optional<std::chrono::milliseconds> RealtimeApplier::time_to_deadline() const {
    auto left = coalescer_.remaining();
    if (!left) return std::nullopt;
    return std::chrono::milliseconds(*left);
}

size_t RealtimeApplier::receive(RemoteChange change) {
    auto batch = coalescer_.push(std::move(change));
    if (batch) return apply(*batch);

    // Held while calling so the owner cannot go away mid-call.
    std::lock_guard<std::mutex> lock(armed_mutex_);
    if (armed_) armed_();
    return 0;
}

size_t RealtimeApplier::poll() {
    auto batch = coalescer_.poll();
    return batch ? apply(*batch) : 0;
}

size_t RealtimeApplier::flush() {
    auto batch = coalescer_.flush();
    return batch ? apply(*batch) : 0;
}

size_t RealtimeApplier::apply(const std::vector<RemoteChange>& batch) {
    std::set<Entity> touched;
    size_t applied = 0;
    for (const auto& change : batch) {
        try {
            if (change.kind == ChangeKind::Delete) {
                auto id = helpers::string_field(change.old_row ? *change.old_row : change.row, "id");
                cache_.remove(change.entity, id);
            } else {
                cache_.upsert(change.entity, change.row);
            }
            touched.insert(change.entity);
            ++applied;
        } catch (const InvalidArgumentError& e) {
            log_warn("realtime", "change_skipped",
                     {{"entity", to_string(change.entity)}, {"error", e.what()}});
        }
    }

    log_info("realtime", "batch_applied", {{"changes", applied}});
    if (listener_ && !touched.empty()) {
        listener_(touched);
    }
    return applied;
}

} // namespace stockline
