#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <google/protobuf/struct.pb.h>
#include "stockline/inventory.pb.h"
#include "compensation.hpp"
#include "entity_cache.hpp"
#include "notification_sink.hpp"
#include "stock_ledger.hpp"
#include "writer.hpp"

namespace stockline {

struct TransactionRequest {
    std::string item_id;
    TransactionType type = TRANSACTION_TYPE_UNSPECIFIED;
    int64_t quantity = 0;
    std::string user_name;
    std::string reason;
    std::string location;
    std::optional<double> amount;
    std::string bill_number;
    std::string contractor_id;
    std::string created_by;
};

struct TransactionResult {
    /// The OUT (or IN/WIP) row, or the WIP reduction when short-circuited.
    Transaction created;
    /// Set when an OUT first consumed work in progress.
    std::optional<Transaction> wip_reduced;
    /// True when the WIP reduction covered the whole OUT.
    bool short_circuited = false;
};

/// Columns of a recorded transaction that may still change.
struct TransactionPatch {
    std::optional<std::string> reason;
    std::optional<std::string> location;
    std::optional<double> amount;
    std::optional<std::string> bill_number;
    std::optional<std::string> contractor_id;
};

/**
 * Records stock movements and catalog changes through the entity writer.
 *
 * An OUT on an item that has work in progress runs as a two-step saga:
 *
 *   1. WIP(-min(wip, qty)) with reason "Auto-reduced WIP: <reason>"
 *   2. OUT(qty - reduced), skipped when the reduction covered everything
 *
 * If step 2 fails (stock check, rejection, storage) step 1 is reverted and
 * the original error is rethrown, so the ledger reads as if nothing happened.
 *
 * An amount on the request goes to the OUT row in full; the WIP row carries
 * its proportional share as well, so summing amounts across both rows counts
 * the reduced part twice.
 *
 * Example:
 *   TransactionRequest request;
 *   request.item_id = item.id();
 *   request.type = OUT;
 *   request.quantity = 8;
 *   auto result = orchestrator.record(request);
 */
class TransactionOrchestrator {
public:
    static constexpr const char* kAutoReducedPrefix = "Auto-reduced WIP: ";

    TransactionOrchestrator(EntityCache& cache, EntityWriter& writer,
                            NotificationSink* sink = nullptr);

    /**
     * @throws InvalidArgumentError for an unknown item, a quantity the row
     *         cannot hold, or a WIP reduction larger than the WIP on record
     * @throws InsufficientStockError when the OUT remainder exceeds stock
     * @throws ConflictsPendingError while conflicts await resolution
     */
    TransactionResult record(const TransactionRequest& request);

    Transaction update_metadata(const std::string& id, const TransactionPatch& patch);

    /// Delete a recorded movement; the ledger reflects it on the next read.
    void reverse(const std::string& id);

    std::map<std::string, StockLevel> levels() const;
    StockLevel level(const std::string& item_id) const;

    /**
     * Create an item, creating its category first when no category with
     * that name is cached. An empty name leaves the item uncategorized.
     */
    Item create_item(Item item, const std::string& category_name = "");
    Category create_category(const std::string& name);
    Contractor create_contractor(const std::string& name);
    User create_user(User user);

    LocalMutation update_row(Entity entity, const std::string& id,
                             const google::protobuf::Struct& patch);
    LocalMutation remove_row(Entity entity, const std::string& id);

private:
    LocalMutation write(const TransactionRequest& request);
    TransactionResult record_out(const TransactionRequest& request);
    void notify(const Transaction& tx);

    EntityCache& cache_;
    EntityWriter& writer_;
    NotificationSink* sink_;
};

} // namespace stockline
