#include "store_logic.hpp"
#include "store_error.hpp"
#include "stockline/helpers.hpp"
#include "stockline/inventory.pb.h"
#include "stockline/stock_ledger.hpp"

namespace remote_store {

using stockline::helpers::string_field;

namespace {

const char* kTables[] = {"items", "transactions", "categories", "contractors", "users"};

}  // namespace

StoreLogic::StoreLogic(Clock clock) : clock_(std::move(clock)) {
    for (const char* name : kTables) {
        tables_[name];
    }
}

StoreLogic::StoreLogic() : StoreLogic(stockline::helpers::now_millis) {}

StoreLogic::Table& StoreLogic::table_for(const std::string& table) {
    auto it = tables_.find(table);
    if (it == tables_.end()) throw StoreError::invalid_argument("Unknown table: " + table);
    return it->second;
}

const StoreLogic::Table& StoreLogic::table_for(const std::string& table) const {
    auto it = tables_.find(table);
    if (it == tables_.end()) throw StoreError::invalid_argument("Unknown table: " + table);
    return it->second;
}

google::protobuf::Struct StoreLogic::insert(const std::string& table,
                                            google::protobuf::Struct row) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& rows = table_for(table);

    auto id = string_field(row, "id");
    if (id.empty()) {
        id = stockline::helpers::generate_id();
        stockline::helpers::set_string(&row, "id", id);
    }

    auto key = table == "transactions" ? string_field(row, "idempotency_key") : "";
    if (!key.empty()) {
        auto seen = idempotency_keys_.find(key);
        if (seen != idempotency_keys_.end()) {
            auto first = rows.find(seen->second);
            if (first != rows.end()) return first->second;
            idempotency_keys_.erase(seen);
        }
    }
    if (rows.count(id)) throw StoreError::already_exists("Record " + id + " already exists");

    if (table == "transactions") check_stock_locked(row);

    stockline::helpers::set_timestamp(&row, "updated_at",
                                      stockline::helpers::from_millis(clock_()));
    rows[id] = row;
    if (!key.empty()) idempotency_keys_[key] = id;
    return row;
}

void StoreLogic::check_stock_locked(const google::protobuf::Struct& row) const {
    auto tx = stockline::helpers::from_row<stockline::Transaction>(row);
    if (tx.type() != stockline::OUT) return;

    std::vector<stockline::Transaction> history;
    for (const auto& [_, stored] : tables_.at("transactions")) {
        history.push_back(stockline::helpers::from_row<stockline::Transaction>(stored));
    }
    auto stock = stockline::StockLedger::stock(history, tx.item_id());
    if (tx.quantity() > stock) {
        throw StoreError::failed_precondition("insufficient_stock:" + std::to_string(stock));
    }
}

void StoreLogic::update(const std::string& table, const std::string& id,
                        const google::protobuf::Struct& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& rows = table_for(table);
    auto it = rows.find(id);
    if (it == rows.end()) throw StoreError::not_found("Record " + id + " not found");

    stockline::helpers::merge_row(&it->second, patch);
    stockline::helpers::set_string(&it->second, "id", id);
    stockline::helpers::set_timestamp(&it->second, "updated_at",
                                      stockline::helpers::from_millis(clock_()));
}

void StoreLogic::remove(const std::string& table, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& rows = table_for(table);
    if (rows.erase(id) == 0) throw StoreError::not_found("Record " + id + " not found");
    if (table != "transactions") return;
    for (auto it = idempotency_keys_.begin(); it != idempotency_keys_.end();) {
        if (it->second == id) {
            it = idempotency_keys_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<google::protobuf::Timestamp> StoreLogic::updated_at(const std::string& table,
                                                                  const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& rows = table_for(table);
    auto it = rows.find(id);
    if (it == rows.end()) return std::nullopt;
    return stockline::helpers::timestamp_field(it->second, "updated_at");
}

int64_t StoreLogic::count(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int64_t>(table_for(table).size());
}

std::vector<google::protobuf::Struct> StoreLogic::list(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<google::protobuf::Struct> result;
    for (const auto& [_, row] : table_for(table)) {
        result.push_back(row);
    }
    return result;
}

}  // namespace remote_store
