#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <google/protobuf/struct.pb.h>
#include "stockline/inventory.pb.h"
#include "compensation.hpp"
#include "durable_store.hpp"
#include "types.hpp"

namespace stockline {

class StorageHealthMonitor;

/**
 * Local copy of every table, used for rendering while offline.
 *
 * Each table is snapshotted to the durable store under "cache/<entity>" after
 * every change. The cache never looks inside the pending operation log; it
 * only holds the optimistic projection already applied to it.
 *
 * Every mutating call returns the CompensatingPatch that undoes it.
 */
class EntityCache {
public:
    /// Id prefix of the rows that stand in for pruned history.
    static constexpr const char* kCarryForwardPrefix = "carry-forward-";

    static bool is_carry_forward(const std::string& transaction_id);

    explicit EntityCache(DurableStore& store, StorageHealthMonitor* monitor = nullptr);

    /**
     * Read all snapshots. Unreadable snapshots are logged and start empty;
     * they only hold data the remote store can serve again.
     */
    void load();

    std::optional<google::protobuf::Struct> find(Entity entity, const std::string& id) const;
    std::vector<google::protobuf::Struct> rows(Entity entity) const;
    size_t count(Entity entity) const;

    /**
     * Insert or replace a whole row.
     *
     * @throws InvalidArgumentError if the row has no id or does not fit the table
     * @throws StorageError if the snapshot cannot be written
     */
    CompensatingPatch upsert(Entity entity, const google::protobuf::Struct& row);

    /**
     * Overlay columns onto an existing row.
     *
     * @throws InvalidArgumentError if the row is not cached
     */
    CompensatingPatch merge(Entity entity, const std::string& id,
                            const google::protobuf::Struct& patch);

    CompensatingPatch remove(Entity entity, const std::string& id);

    /// Undo an earlier change.
    void apply(const CompensatingPatch& patch);

    /// Swap a table for a fresh remote listing.
    void replace_all(Entity entity, const std::vector<google::protobuf::Struct>& rows);

    std::vector<Transaction> transactions() const;
    std::vector<Transaction> transactions_for(const std::string& item_id) const;
    std::vector<Item> items() const;
    std::optional<Item> item(const std::string& id) const;
    std::optional<Category> category(const std::string& id) const;
    std::optional<Category> category_by_name(const std::string& name) const;
    std::vector<Category> categories() const;

    /// True when anything previously synced from the cloud is cached.
    bool has_cloud_data() const;

    /**
     * Drop cached transactions older than the cutoff. The stock and WIP the
     * dropped rows contributed are kept as carry-forward rows per item, so
     * every level derived from the cache is the same before and after. The
     * carry-forward rows never leave the device and disappear with the next
     * full refresh.
     *
     * @return number of transactions removed
     */
    size_t prune_transactions(int64_t cutoff_millis);

    void mark_synced(int64_t millis);
    std::optional<int64_t> last_sync() const;

private:
    template<typename T>
    using Table = std::map<std::string, T>;

    template<typename Fn>
    decltype(auto) with_table(Entity entity, Fn&& fn);

    template<typename Fn>
    decltype(auto) with_table(Entity entity, Fn&& fn) const;

    void persist_locked(Entity entity);
    void escalate(const std::string& message);

    DurableStore& store_;
    StorageHealthMonitor* monitor_;

    mutable std::mutex mutex_;
    Table<Item> items_;
    Table<Transaction> transactions_;
    Table<Category> categories_;
    Table<Contractor> contractors_;
    Table<User> users_;
};

} // namespace stockline
