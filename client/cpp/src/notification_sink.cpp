#include "stockline/notification_sink.hpp"

#include <google/protobuf/util/time_util.h>

namespace stockline {

nlohmann::json SheetRow::to_json() const {
    nlohmann::json json = {
        {"date", date},
        {"item", item},
        {"category", category},
        {"type", type},
        {"quantity", quantity},
        {"unit", unit},
        {"user", user},
        {"reason", reason},
        {"location", location},
        {"billNumber", bill_number}
    };
    json["amount"] = amount ? nlohmann::json(*amount) : nlohmann::json(nullptr);
    return json;
}

SheetRow make_sheet_row(const Transaction& tx, const Item* item, const Category* category) {
    SheetRow row;
    if (tx.has_timestamp()) {
        row.date = google::protobuf::util::TimeUtil::ToString(tx.timestamp());
    }
    row.item = item ? item->name() : "";
    row.category = category ? category->name() : "";
    row.type = TransactionType_Name(tx.type());
    row.quantity = tx.quantity();
    row.unit = item ? item->unit() : "";
    row.user = tx.user_name();
    row.reason = tx.reason();
    row.location = tx.location();
    if (tx.has_amount()) row.amount = tx.amount();
    row.bill_number = tx.bill_number();
    return row;
}

void StreamNotificationSink::publish(const SheetRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << row.to_json().dump() << std::endl;
}

} // namespace stockline
