#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/timestamp.pb.h>

namespace remote_store {

/**
 * In-memory tables behind the reference RemoteStoreService.
 *
 * The store owns updated_at: every insert and update stamps it from the
 * clock, so clients can detect concurrent edits.
 */
class StoreLogic {
public:
    using Clock = std::function<int64_t()>;

    explicit StoreLogic(Clock clock);
    StoreLogic();

    /// Returns the stored row. A repeated transaction idempotency_key returns
    /// the row stored the first time.
    google::protobuf::Struct insert(const std::string& table, google::protobuf::Struct row);

    void update(const std::string& table, const std::string& id,
                const google::protobuf::Struct& patch);

    void remove(const std::string& table, const std::string& id);

    std::optional<google::protobuf::Timestamp> updated_at(const std::string& table,
                                                          const std::string& id) const;

    int64_t count(const std::string& table) const;

    std::vector<google::protobuf::Struct> list(const std::string& table) const;

private:
    using Table = std::map<std::string, google::protobuf::Struct>;

    Table& table_for(const std::string& table);
    const Table& table_for(const std::string& table) const;
    void check_stock_locked(const google::protobuf::Struct& row) const;

    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, Table> tables_;
    std::map<std::string, std::string> idempotency_keys_;
};

}  // namespace remote_store
