#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "stockline/inventory.pb.h"

namespace stockline {

struct StockLevel {
    int64_t stock = 0;
    int64_t wip = 0;

    /// Stock not tied up in work in progress.
    int64_t available() const { return stock - wip; }

    bool operator==(const StockLevel& other) const {
        return stock == other.stock && wip == other.wip;
    }
};

/**
 * Derives stock and work-in-progress from the transaction history.
 *
 *   stock(i) = sum(IN.quantity) - sum(OUT.quantity)
 *   wip(i)   = sum(WIP.quantity)   (signed; reductions are negative rows)
 *
 * Nothing is cached: every call folds the given transactions, so inserts,
 * metadata edits and deletions are reflected by construction. Rows for items
 * that no longer exist are folded like any other; callers joining against
 * items simply never ask for them.
 */
class StockLedger {
public:
    static int64_t stock(const std::vector<Transaction>& transactions, const std::string& item_id);

    static int64_t wip(const std::vector<Transaction>& transactions, const std::string& item_id);

    static int64_t available(const std::vector<Transaction>& transactions,
                             const std::string& item_id);

    static StockLevel level(const std::vector<Transaction>& transactions,
                            const std::string& item_id);

    /// Levels for every item that appears in the history.
    static std::map<std::string, StockLevel> levels(const std::vector<Transaction>& transactions);

    /**
     * @throws InsufficientStockError if taking `requested` would drive
     *         stock(i) below zero
     */
    static void require_sufficient_stock(const std::vector<Transaction>& transactions,
                                         const std::string& item_id, int64_t requested);

    /// Fold one more movement into a level.
    static StockLevel apply(StockLevel level, const Transaction& tx);
};

} // namespace stockline
