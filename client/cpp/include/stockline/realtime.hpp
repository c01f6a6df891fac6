#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <vector>
#include <google/protobuf/struct.pb.h>
#include "coalescer.hpp"
#include "entity_cache.hpp"
#include "types.hpp"

namespace stockline {

enum class ChangeKind {
    Insert,
    Update,
    Delete
};

/**
 * A change made on the remote store by someone else.
 */
struct RemoteChange {
    Entity entity = Entity::Transactions;
    ChangeKind kind = ChangeKind::Insert;
    google::protobuf::Struct row;
    /// Previous row for updates and deletes, when the feed provides it.
    std::optional<google::protobuf::Struct> old_row;
};

/**
 * Applies remote-origin changes to the cache in coalesced batches.
 *
 * Within a batch changes are applied in arrival order. The listener hears
 * once per batch which tables changed, so views recompute once per burst.
 *
 * A buffered batch is applied by poll() once its window closes. Whoever owns
 * the clock (normally SyncScheduler) registers an armed callback to learn
 * when a new deadline was set.
 */
class RealtimeApplier {
public:
    using Listener = std::function<void(const std::set<Entity>&)>;

    RealtimeApplier(EntityCache& cache, std::chrono::milliseconds window,
                    Coalescer<RemoteChange>::Clock clock = helpers::now_millis);

    void set_listener(Listener listener) { listener_ = std::move(listener); }

    /// Called after a change was buffered instead of applied.
    void set_armed_callback(std::function<void()> callback);

    /// @return number of changes applied now (0 when buffered)
    size_t receive(RemoteChange change);

    /// Apply a buffered batch whose window has closed.
    size_t poll();

    size_t flush();

    std::optional<int64_t> deadline() const { return coalescer_.deadline(); }

    /// Time left until poll() has a batch to apply.
    std::optional<std::chrono::milliseconds> time_to_deadline() const;

private:
    size_t apply(const std::vector<RemoteChange>& batch);

    EntityCache& cache_;
    Coalescer<RemoteChange> coalescer_;
    Listener listener_;

    std::mutex armed_mutex_;
    std::function<void()> armed_;
};

} // namespace stockline
