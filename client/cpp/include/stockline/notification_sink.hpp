#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "stockline/inventory.pb.h"

namespace stockline {

/**
 * One recorded movement flattened for a spreadsheet export.
 */
struct SheetRow {
    std::string date;
    std::string item;
    std::string category;
    std::string type;
    int64_t quantity = 0;
    std::string unit;
    std::string user;
    std::string reason;
    std::string location;
    std::optional<double> amount;
    std::string bill_number;

    nlohmann::json to_json() const;
};

/**
 * Flatten a transaction. Item and category may be null when they are not
 * cached; their columns are left empty.
 */
SheetRow make_sheet_row(const Transaction& tx, const Item* item, const Category* category);

/**
 * Receives every movement once it has been recorded.
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void publish(const SheetRow& row) = 0;
};

/**
 * Writes each row as one JSON line.
 */
class StreamNotificationSink : public NotificationSink {
public:
    explicit StreamNotificationSink(std::ostream& out) : out_(out) {}

    void publish(const SheetRow& row) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace stockline
