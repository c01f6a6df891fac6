#include "stockline/stock_ledger.hpp"
#include "stockline/errors.hpp"

namespace stockline {

StockLevel StockLedger::apply(StockLevel level, const Transaction& tx) {
    switch (tx.type()) {
        case IN:
            level.stock += tx.quantity();
            break;
        case OUT:
            level.stock -= tx.quantity();
            break;
        case WIP:
            // WIP never touches stock: the material is still on the shelf
            level.wip += tx.quantity();
            break;
        default:
            break;
    }
    return level;
}

StockLevel StockLedger::level(const std::vector<Transaction>& transactions,
                              const std::string& item_id) {
    StockLevel level;
    for (const auto& tx : transactions) {
        if (tx.item_id() == item_id) {
            level = apply(level, tx);
        }
    }
    return level;
}

int64_t StockLedger::stock(const std::vector<Transaction>& transactions,
                           const std::string& item_id) {
    return level(transactions, item_id).stock;
}

int64_t StockLedger::wip(const std::vector<Transaction>& transactions,
                         const std::string& item_id) {
    return level(transactions, item_id).wip;
}

int64_t StockLedger::available(const std::vector<Transaction>& transactions,
                               const std::string& item_id) {
    return level(transactions, item_id).available();
}

std::map<std::string, StockLevel> StockLedger::levels(const std::vector<Transaction>& transactions) {
    std::map<std::string, StockLevel> result;
    for (const auto& tx : transactions) {
        result[tx.item_id()] = apply(result[tx.item_id()], tx);
    }
    return result;
}

void StockLedger::require_sufficient_stock(const std::vector<Transaction>& transactions,
                                           const std::string& item_id, int64_t requested) {
    auto on_hand = stock(transactions, item_id);
    if (on_hand < requested) {
        throw InsufficientStockError(on_hand, requested);
    }
}

} // namespace stockline
