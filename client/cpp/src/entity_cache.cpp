#include "stockline/entity_cache.hpp"
#include "stockline/errors.hpp"
#include "stockline/helpers.hpp"
#include "stockline/logging.hpp"
#include "stockline/stock_ledger.hpp"
#include "stockline/storage_health.hpp"
#include "stockline/validation.hpp"

#include <algorithm>
#include <limits>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace stockline {

namespace {

const char* kLastSyncKey = "cache/last_sync";

const int64_t kMaxRowQuantity = std::numeric_limits<int32_t>::max();

// Rows moving `quantity` through `type`, split to fit the 32-bit column.
void carry_forward(std::map<std::string, Transaction>& table, const std::string& item_id,
                   TransactionType type, int64_t quantity, const std::string& tag,
                   int64_t stamp) {
    for (int index = 0; quantity != 0; ++index) {
        int64_t chunk = quantity > 0 ? std::min(quantity, kMaxRowQuantity)
                                     : std::max(quantity, -kMaxRowQuantity);
        Transaction tx;
        tx.set_id(EntityCache::kCarryForwardPrefix + item_id + "-" + tag + "-" +
                  std::to_string(index));
        tx.set_item_id(item_id);
        tx.set_type(type);
        tx.set_quantity(static_cast<int32_t>(chunk));
        tx.set_reason("Carried forward");
        *tx.mutable_timestamp() = helpers::from_millis(stamp);
        table[tx.id()] = tx;
        quantity -= chunk;
    }
}

std::string snapshot_key(Entity entity) {
    return "cache/" + to_string(entity);
}

template<typename T>
std::string encode_table(const std::map<std::string, T>& table) {
    std::string out = "[";
    bool first = true;
    for (const auto& [_, message] : table) {
        if (!first) out += ",";
        out += helpers::to_json(message);
        first = false;
    }
    out += "]";
    return out;
}

template<typename T>
std::map<std::string, T> decode_table(const std::string& text) {
    auto records = nlohmann::json::parse(text);
    if (!records.is_array()) {
        throw InvalidArgumentError("Snapshot is not a list");
    }
    std::map<std::string, T> table;
    for (const auto& record : records) {
        T message;
        helpers::parse_json(record.dump(), &message);
        if (!message.id().empty()) {
            table[message.id()] = std::move(message);
        }
    }
    return table;
}

template<typename Table>
using RowType = typename std::decay_t<Table>::mapped_type;

} // anonymous namespace

EntityCache::EntityCache(DurableStore& store, StorageHealthMonitor* monitor)
    : store_(store), monitor_(monitor) {}

template<typename Fn>
decltype(auto) EntityCache::with_table(Entity entity, Fn&& fn) {
    switch (entity) {
        case Entity::Items: return fn(items_);
        case Entity::Transactions: return fn(transactions_);
        case Entity::Categories: return fn(categories_);
        case Entity::Contractors: return fn(contractors_);
        case Entity::Users: return fn(users_);
    }
    throw InvalidArgumentError("Unknown entity");
}

template<typename Fn>
decltype(auto) EntityCache::with_table(Entity entity, Fn&& fn) const {
    switch (entity) {
        case Entity::Items: return fn(items_);
        case Entity::Transactions: return fn(transactions_);
        case Entity::Categories: return fn(categories_);
        case Entity::Contractors: return fn(contractors_);
        case Entity::Users: return fn(users_);
    }
    throw InvalidArgumentError("Unknown entity");
}

void EntityCache::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto entity : {Entity::Items, Entity::Transactions, Entity::Categories,
                        Entity::Contractors, Entity::Users}) {
        auto text = store_.get(snapshot_key(entity));
        with_table(entity, [&](auto& table) {
            using T = RowType<decltype(table)>;
            table.clear();
            if (!text) return;
            try {
                table = decode_table<T>(*text);
            } catch (const nlohmann::json::exception& e) {
                log_warn("cache", "snapshot_unreadable",
                         {{"entity", to_string(entity)}, {"error", e.what()}});
            } catch (const InvalidArgumentError& e) {
                log_warn("cache", "snapshot_unreadable",
                         {{"entity", to_string(entity)}, {"error", e.what()}});
            }
        });
    }
}

void EntityCache::persist_locked(Entity entity) {
    auto encoded = with_table(entity, [](const auto& table) { return encode_table(table); });
    store_.put(snapshot_key(entity), encoded);
}

void EntityCache::escalate(const std::string& message) {
    log_error("cache", "snapshot_write_failed", {{"error", message}});
    if (monitor_) {
        monitor_->notify("Warning: Could not save local data. Storage may be full.");
    }
}

std::optional<google::protobuf::Struct> EntityCache::find(Entity entity,
                                                          const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return with_table(entity, [&](const auto& table) -> std::optional<google::protobuf::Struct> {
        auto it = table.find(id);
        if (it == table.end()) return std::nullopt;
        return helpers::to_row(it->second);
    });
}

std::vector<google::protobuf::Struct> EntityCache::rows(Entity entity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return with_table(entity, [](const auto& table) {
        std::vector<google::protobuf::Struct> result;
        result.reserve(table.size());
        for (const auto& [_, message] : table) {
            result.push_back(helpers::to_row(message));
        }
        return result;
    });
}

size_t EntityCache::count(Entity entity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return with_table(entity, [](const auto& table) { return table.size(); });
}

CompensatingPatch EntityCache::upsert(Entity entity, const google::protobuf::Struct& row) {
    auto id = helpers::string_field(row, "id");
    validation::require_not_empty(id, "id");

    CompensatingPatch undo{entity, id, std::nullopt};
    std::unique_lock<std::mutex> lock(mutex_);
    with_table(entity, [&](auto& table) {
        using T = RowType<decltype(table)>;
        auto message = helpers::from_row<T>(row);
        auto it = table.find(id);
        if (it != table.end()) {
            undo.prior_row = helpers::to_row(it->second);
        }
        table[id] = std::move(message);
    });

    try {
        persist_locked(entity);
    } catch (const StorageError& e) {
        lock.unlock();
        apply(undo);
        escalate(e.what());
        throw;
    }
    return undo;
}

CompensatingPatch EntityCache::merge(Entity entity, const std::string& id,
                                     const google::protobuf::Struct& patch) {
    auto current = find(entity, id);
    validation::require_exists(current.has_value(),
                               to_string(entity) + " record " + id + " is not cached");
    helpers::merge_row(&*current, patch);
    helpers::set_string(&*current, "id", id);
    return upsert(entity, *current);
}

CompensatingPatch EntityCache::remove(Entity entity, const std::string& id) {
    CompensatingPatch undo{entity, id, std::nullopt};
    std::unique_lock<std::mutex> lock(mutex_);
    bool removed = with_table(entity, [&](auto& table) {
        auto it = table.find(id);
        if (it == table.end()) return false;
        undo.prior_row = helpers::to_row(it->second);
        table.erase(it);
        return true;
    });
    if (!removed) return undo;

    try {
        persist_locked(entity);
    } catch (const StorageError& e) {
        lock.unlock();
        apply(undo);
        escalate(e.what());
        throw;
    }
    return undo;
}

void EntityCache::apply(const CompensatingPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    with_table(patch.entity, [&](auto& table) {
        using T = RowType<decltype(table)>;
        if (patch.prior_row) {
            table[patch.record_id] = helpers::from_row<T>(*patch.prior_row);
        } else {
            table.erase(patch.record_id);
        }
    });

    try {
        persist_locked(patch.entity);
    } catch (const StorageError& e) {
        // The in-memory state is already correct; the snapshot catches up on
        // the next successful write.
        log_error("cache", "snapshot_write_failed",
                  {{"entity", to_string(patch.entity)}, {"error", e.what()}});
    }
}

void EntityCache::replace_all(Entity entity, const std::vector<google::protobuf::Struct>& rows) {
    std::unique_lock<std::mutex> lock(mutex_);
    with_table(entity, [&](auto& table) {
        using T = RowType<decltype(table)>;
        std::map<std::string, T> fresh;
        for (const auto& row : rows) {
            auto message = helpers::from_row<T>(row);
            if (!message.id().empty()) {
                fresh[message.id()] = std::move(message);
            }
        }
        table.swap(fresh);
    });

    try {
        persist_locked(entity);
    } catch (const StorageError& e) {
        lock.unlock();
        escalate(e.what());
        throw;
    }
}

std::vector<Transaction> EntityCache::transactions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transaction> result;
    result.reserve(transactions_.size());
    for (const auto& [_, tx] : transactions_) {
        result.push_back(tx);
    }
    return result;
}

std::vector<Transaction> EntityCache::transactions_for(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transaction> result;
    for (const auto& [_, tx] : transactions_) {
        if (tx.item_id() == item_id) result.push_back(tx);
    }
    return result;
}

std::vector<Item> EntityCache::items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Item> result;
    result.reserve(items_.size());
    for (const auto& [_, item] : items_) {
        result.push_back(item);
    }
    return result;
}

std::optional<Item> EntityCache::item(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(id);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

std::optional<Category> EntityCache::category(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = categories_.find(id);
    if (it == categories_.end()) return std::nullopt;
    return it->second;
}

std::optional<Category> EntityCache::category_by_name(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [_, category] : categories_) {
        if (category.name() == name) return category;
    }
    return std::nullopt;
}

std::vector<Category> EntityCache::categories() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Category> result;
    for (const auto& [_, category] : categories_) {
        result.push_back(category);
    }
    return result;
}

bool EntityCache::has_cloud_data() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !users_.empty() || !items_.empty() || !transactions_.empty() || !categories_.empty();
}

bool EntityCache::is_carry_forward(const std::string& transaction_id) {
    static const std::string prefix = kCarryForwardPrefix;
    return transaction_id.compare(0, prefix.size(), prefix) == 0;
}

size_t EntityCache::prune_transactions(int64_t cutoff_millis) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto before = transactions_;
    std::map<std::string, StockLevel> carried;
    size_t removed = 0;
    for (auto it = transactions_.begin(); it != transactions_.end();) {
        const auto& tx = it->second;
        if (!is_carry_forward(tx.id()) && tx.has_timestamp() &&
            helpers::to_millis(tx.timestamp()) < cutoff_millis) {
            carried[tx.item_id()] = StockLedger::apply(carried[tx.item_id()], tx);
            it = transactions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed == 0) return 0;

    // Earlier carry-forward rows of the same items fold into the new ones.
    for (auto it = transactions_.begin(); it != transactions_.end();) {
        auto level = carried.find(it->second.item_id());
        if (level != carried.end() && is_carry_forward(it->first)) {
            level->second = StockLedger::apply(level->second, it->second);
            it = transactions_.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto& [item_id, level] : carried) {
        if (level.stock >= 0) {
            carry_forward(transactions_, item_id, IN, level.stock, "stock", cutoff_millis - 1);
        } else {
            carry_forward(transactions_, item_id, OUT, -level.stock, "stock", cutoff_millis - 1);
        }
        carry_forward(transactions_, item_id, WIP, level.wip, "wip", cutoff_millis - 1);
    }

    try {
        persist_locked(Entity::Transactions);
    } catch (const StorageError& e) {
        transactions_.swap(before);
        lock.unlock();
        escalate(e.what());
        throw;
    }
    log_info("cache", "transactions_pruned",
             {{"removed", removed}, {"items_carried", carried.size()}, {"cutoff", cutoff_millis}});
    return removed;
}

void EntityCache::mark_synced(int64_t millis) {
    store_.put(kLastSyncKey, std::to_string(millis));
}

std::optional<int64_t> EntityCache::last_sync() const {
    auto text = store_.get(kLastSyncKey);
    if (!text) return std::nullopt;
    try {
        return std::stoll(*text);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

} // namespace stockline
