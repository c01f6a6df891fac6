#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "logging.hpp"
#include "operation_log.hpp"

namespace stockline {

/**
 * What the UI needs to let a human settle sync conflicts.
 *
 * Retrying puts an operation back in line for the next drain; dismissing
 * drops it and keeps whatever the cache currently shows. Both act on
 * conflicted entries only; pending and failed entries are left alone.
 */
class ConflictResolver {
public:
    explicit ConflictResolver(OperationLog& log) : log_(log) {}

    std::vector<PendingOperation> list() const {
        return log_.list_conflicts();
    }

    size_t count() const {
        return log_.summary().conflicts;
    }

    bool retry(const std::string& id) {
        bool retried = log_.retry(id, OpStatus::Conflict);
        if (retried) {
            log_info("conflicts", "conflict_retried", {{"op_id", id}});
        }
        return retried;
    }

    bool dismiss(const std::string& id) {
        bool dismissed = log_.dismiss(id, OpStatus::Conflict);
        if (dismissed) {
            log_info("conflicts", "conflict_dismissed", {{"op_id", id}});
        }
        return dismissed;
    }

    /// @return number of conflicts put back in line
    size_t retry_all() {
        size_t count = 0;
        for (const auto& op : log_.list_conflicts()) {
            if (retry(op.id)) ++count;
        }
        return count;
    }

    /// @return number of conflicts dropped
    size_t dismiss_all() {
        size_t count = 0;
        for (const auto& op : log_.list_conflicts()) {
            if (dismiss(op.id)) ++count;
        }
        return count;
    }

private:
    OperationLog& log_;
};

} // namespace stockline
