#include "stockline/data_guard.hpp"
#include "stockline/errors.hpp"
#include "stockline/logging.hpp"

namespace stockline {

DataGuard::DataGuard(DurableStore& store, EntityCache& cache)
    : store_(store), cache_(cache) {}

GuardDecision DataGuard::evaluate(RemoteStore& remote) {
    GuardDecision decision;
    if (overridden()) {
        log_info("guard", "guard_overridden");
        return decision;
    }
    if (!cache_.has_cloud_data()) {
        return decision;
    }

    int64_t total = 0;
    try {
        for (auto entity : {Entity::Items, Entity::Transactions, Entity::Users}) {
            total += remote.count(entity);
            if (total > 0) break;
        }
    } catch (const ClientError& e) {
        if (!is_transient(e)) throw;
        log_warn("guard", "guard_skipped_remote_unreachable", {{"error", e.what()}});
        return decision;
    }

    if (total == 0) {
        decision.blocked = true;
        decision.reason = "The cloud database returned no items, transactions or users, "
                          "but this device holds previously synced data. The database may "
                          "have been reset or the endpoint may be wrong.";
        log_warn("guard", "guard_blocked");
    }
    return decision;
}

void DataGuard::acknowledge() {
    store_.put(kOverrideKey, "true");
    log_info("guard", "guard_acknowledged");
}

bool DataGuard::overridden() const {
    auto value = store_.get(kOverrideKey);
    return value && *value == "true";
}

void DataGuard::reset() {
    store_.erase(kOverrideKey);
}

} // namespace stockline
