#include "stockline/orchestrator.hpp"
#include "stockline/errors.hpp"
#include "stockline/helpers.hpp"
#include "stockline/logging.hpp"
#include "stockline/validation.hpp"

#include <algorithm>
#include <limits>

namespace stockline {

namespace {

Transaction to_transaction(const TransactionRequest& request) {
    Transaction tx;
    tx.set_id(helpers::generate_id());
    tx.set_item_id(request.item_id);
    tx.set_type(request.type);
    tx.set_quantity(static_cast<int32_t>(request.quantity));
    tx.set_user_name(request.user_name);
    tx.set_reason(request.reason);
    tx.set_location(request.location);
    if (request.amount) tx.set_amount(*request.amount);
    tx.set_bill_number(request.bill_number);
    tx.set_contractor_id(request.contractor_id);
    tx.set_created_by(request.created_by);
    tx.set_idempotency_key(helpers::generate_idempotency_key());
    *tx.mutable_timestamp() = helpers::now();
    return tx;
}

// Largest quantity the transaction row can carry.
const int64_t kMaxQuantity = std::numeric_limits<int32_t>::max();

void require_real_transaction(const std::string& id) {
    if (EntityCache::is_carry_forward(id)) {
        throw InvalidArgumentError("Transaction " + id + " summarises pruned history and cannot be changed");
    }
}

nlohmann::json describe(const TransactionRequest& request) {
    return {
        {"item_id", request.item_id},
        {"type", TransactionType_Name(request.type)},
        {"quantity", request.quantity}
    };
}

} // anonymous namespace

TransactionOrchestrator::TransactionOrchestrator(EntityCache& cache, EntityWriter& writer,
                                                 NotificationSink* sink)
    : cache_(cache), writer_(writer), sink_(sink) {}

TransactionResult TransactionOrchestrator::record(const TransactionRequest& request) {
    validation::require_exists(cache_.item(request.item_id).has_value(),
                               "Item " + request.item_id + " does not exist");
    switch (request.type) {
        case IN:
        case OUT:
            validation::require_positive(request.quantity, "quantity");
            validation::require_at_most(request.quantity, kMaxQuantity, "quantity");
            break;
        case WIP:
            validation::require_non_zero(request.quantity, "quantity");
            validation::require_at_most(request.quantity, kMaxQuantity, "quantity");
            validation::require_at_least(request.quantity, -kMaxQuantity, "quantity");
            if (request.quantity < 0) {
                auto wip = StockLedger::wip(cache_.transactions(), request.item_id);
                validation::require_at_most(-request.quantity, wip, "WIP reduction");
            }
            break;
        default:
            throw InvalidArgumentError("Unknown transaction type");
    }

    if (request.type == OUT) {
        return record_out(request);
    }

    TransactionResult result;
    result.created = helpers::from_row<Transaction>(write(request).row);
    notify(result.created);
    return result;
}

TransactionResult TransactionOrchestrator::record_out(const TransactionRequest& request) {
    TransactionResult result;
    auto current = StockLedger::level(cache_.transactions(), request.item_id);

    std::optional<LocalMutation> reduction;
    int64_t remaining = request.quantity;

    if (current.wip > 0) {
        int64_t wip_to_reduce = std::min(current.wip, request.quantity);

        TransactionRequest wip = request;
        wip.type = WIP;
        wip.quantity = -wip_to_reduce;
        wip.reason = kAutoReducedPrefix + request.reason;
        if (request.amount) {
            wip.amount = *request.amount * static_cast<double>(wip_to_reduce) /
                         static_cast<double>(request.quantity);
        }

        reduction = write(wip);
        result.wip_reduced = helpers::from_row<Transaction>(reduction->row);
        remaining -= wip_to_reduce;

        auto fields = describe(request);
        fields["wip_reduced"] = wip_to_reduce;
        log_info("saga", "wip_auto_reduced", fields);

        if (remaining == 0) {
            result.created = *result.wip_reduced;
            result.short_circuited = true;
            notify(result.created);
            return result;
        }
    }

    TransactionRequest out = request;
    out.quantity = remaining;

    try {
        StockLedger::require_sufficient_stock(cache_.transactions(), request.item_id, remaining);
        result.created = helpers::from_row<Transaction>(write(out).row);
    } catch (const ClientError& e) {
        if (reduction) {
            writer_.revert(*reduction);
            auto fields = describe(request);
            fields["error"] = e.what();
            log_warn("saga", "wip_reduction_rolled_back", fields);
        }
        throw;
    }

    notify(result.created);
    return result;
}

LocalMutation TransactionOrchestrator::write(const TransactionRequest& request) {
    return writer_.create(Entity::Transactions, helpers::to_row(to_transaction(request)));
}

void TransactionOrchestrator::notify(const Transaction& tx) {
    if (!sink_) return;
    auto item = cache_.item(tx.item_id());
    std::optional<Category> category;
    if (item) category = cache_.category(item->category_id());
    try {
        sink_->publish(make_sheet_row(tx, item ? &*item : nullptr,
                                      category ? &*category : nullptr));
    } catch (const std::exception& e) {
        log_warn("saga", "notification_failed", {{"transaction_id", tx.id()}, {"error", e.what()}});
    }
}

Transaction TransactionOrchestrator::update_metadata(const std::string& id,
                                                     const TransactionPatch& patch) {
    google::protobuf::Struct columns;
    if (patch.reason) helpers::set_string(&columns, "reason", *patch.reason);
    if (patch.location) helpers::set_string(&columns, "location", *patch.location);
    if (patch.bill_number) helpers::set_string(&columns, "bill_number", *patch.bill_number);
    if (patch.contractor_id) helpers::set_string(&columns, "contractor_id", *patch.contractor_id);
    if (patch.amount) (*columns.mutable_fields())["amount"].set_number_value(*patch.amount);

    require_real_transaction(id);
    auto mutation = writer_.update(Entity::Transactions, id, columns);
    return helpers::from_row<Transaction>(mutation.row);
}

void TransactionOrchestrator::reverse(const std::string& id) {
    require_real_transaction(id);
    writer_.remove(Entity::Transactions, id);
    log_info("saga", "transaction_reversed", {{"transaction_id", id}});
}

std::map<std::string, StockLevel> TransactionOrchestrator::levels() const {
    return StockLedger::levels(cache_.transactions());
}

StockLevel TransactionOrchestrator::level(const std::string& item_id) const {
    return StockLedger::level(cache_.transactions(), item_id);
}

Item TransactionOrchestrator::create_item(Item item, const std::string& category_name) {
    validation::require_not_empty(item.name(), "name");
    if (!category_name.empty()) {
        auto existing = cache_.category_by_name(category_name);
        item.set_category_id(existing ? existing->id() : create_category(category_name).id());
    }
    if (item.id().empty()) item.set_id(helpers::generate_id());
    if (!item.has_created_at()) *item.mutable_created_at() = helpers::now();

    auto mutation = writer_.create(Entity::Items, helpers::to_row(item));
    return helpers::from_row<Item>(mutation.row);
}

Category TransactionOrchestrator::create_category(const std::string& name) {
    validation::require_not_empty(name, "name");
    Category category;
    category.set_id(helpers::generate_id());
    category.set_name(name);
    category.set_sort_order(static_cast<int32_t>(cache_.count(Entity::Categories)));

    auto mutation = writer_.create(Entity::Categories, helpers::to_row(category));
    log_info("catalog", "category_created", {{"name", name}});
    return helpers::from_row<Category>(mutation.row);
}

Contractor TransactionOrchestrator::create_contractor(const std::string& name) {
    validation::require_not_empty(name, "name");
    Contractor contractor;
    contractor.set_id(helpers::generate_id());
    contractor.set_name(name);

    auto mutation = writer_.create(Entity::Contractors, helpers::to_row(contractor));
    return helpers::from_row<Contractor>(mutation.row);
}

User TransactionOrchestrator::create_user(User user) {
    validation::require_not_empty(user.username(), "username");
    if (user.id().empty()) user.set_id(helpers::generate_id());
    if (!user.has_created_at()) *user.mutable_created_at() = helpers::now();

    auto mutation = writer_.create(Entity::Users, helpers::to_row(user));
    return helpers::from_row<User>(mutation.row);
}

LocalMutation TransactionOrchestrator::update_row(Entity entity, const std::string& id,
                                                  const google::protobuf::Struct& patch) {
    return writer_.update(entity, id, patch);
}

LocalMutation TransactionOrchestrator::remove_row(Entity entity, const std::string& id) {
    return writer_.remove(entity, id);
}

} // namespace stockline
