#include "stockline/operation_log.hpp"
#include "stockline/errors.hpp"
#include "stockline/logging.hpp"
#include "stockline/queue_codec.hpp"
#include "stockline/storage_health.hpp"

#include <algorithm>
#include <iterator>

namespace stockline {

namespace {

std::vector<PendingOperation>::iterator find_op(std::vector<PendingOperation>& ops,
                                                const std::string& id) {
    return std::find_if(ops.begin(), ops.end(),
                        [&id](const PendingOperation& op) { return op.id == id; });
}

} // anonymous namespace

OperationLog::OperationLog(DurableStore& store, LogOptions options, StorageHealthMonitor* monitor)
    : store_(store), options_(std::move(options)), monitor_(monitor) {}

template<typename Mutation>
auto OperationLog::transact(Mutation&& mutate) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto before = ops_;
    auto result = mutate(ops_);
    try {
        persist_locked();
    } catch (const StorageError& e) {
        ops_ = std::move(before);
        lock.unlock();
        log_error("queue", "queue_flush_failed", {{"error", e.what()}});
        if (monitor_) {
            monitor_->notify("Warning: Could not save pending operations. Storage may be full.");
        }
        throw;
    }
    return result;
}

void OperationLog::persist_locked() {
    store_.put(options_.storage_key, queue_codec::encode_queue(ops_));
}

void OperationLog::load() {
    auto text = store_.get(options_.storage_key);

    std::vector<PendingOperation> loaded;
    if (text) {
        try {
            loaded = queue_codec::decode_queue(*text);
        } catch (const InvalidArgumentError& e) {
            throw StorageError(std::string("Pending queue is unreadable: ") + e.what());
        }
    }

    size_t interrupted = 0;
    for (auto& op : loaded) {
        if (op.status == OpStatus::Syncing) {
            op.status = OpStatus::Pending;
            ++interrupted;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ops_ = std::move(loaded);
    }
    log_info("queue", "queue_loaded", {{"entries", size()}, {"interrupted", interrupted}});
}

PendingOperation OperationLog::enqueue(PendingOperation op) {
    if (op.id.empty()) op.id = helpers::generate_id();
    if (op.created_at == 0) op.created_at = options_.clock();
    op.status = OpStatus::Pending;
    op.error.reset();

    transact([&](std::vector<PendingOperation>& ops) {
        if (ops.size() >= options_.max_pending_ops) {
            throw QueueFullError(options_.max_pending_ops);
        }
        ops.push_back(op);
        return true;
    });

    log_info("queue", "operation_queued",
             {{"op_id", op.id}, {"entity", to_string(op.entity)},
              {"action", to_string(op.action)}, {"record_id", op.record_id()}});
    return op;
}

std::vector<PendingOperation> OperationLog::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ops_;
}

std::vector<PendingOperation> OperationLog::with_status(OpStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingOperation> result;
    std::copy_if(ops_.begin(), ops_.end(), std::back_inserter(result),
                 [status](const PendingOperation& op) { return op.status == status; });
    return result;
}

std::vector<PendingOperation> OperationLog::list_pending() const {
    return with_status(OpStatus::Pending);
}

std::vector<PendingOperation> OperationLog::list_conflicts() const {
    return with_status(OpStatus::Conflict);
}

std::vector<PendingOperation> OperationLog::list_failed() const {
    return with_status(OpStatus::Failed);
}

std::optional<PendingOperation> OperationLog::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& op : ops_) {
        if (op.id == id) return op;
    }
    return std::nullopt;
}

OpsSummary OperationLog::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    OpsSummary summary;
    for (const auto& op : ops_) {
        if (op.status == OpStatus::Pending) ++summary.pending;
        if (op.status == OpStatus::Conflict) ++summary.conflicts;
    }
    return summary;
}

bool OperationLog::has_conflicts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(ops_.begin(), ops_.end(),
                       [](const PendingOperation& op) { return op.status == OpStatus::Conflict; });
}

size_t OperationLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ops_.size();
}

bool OperationLog::retry(const std::string& id, std::optional<OpStatus> only_if) {
    bool retried = transact([&](std::vector<PendingOperation>& ops) {
        auto it = find_op(ops, id);
        if (it == ops.end()) return false;
        if (it->status != OpStatus::Conflict && it->status != OpStatus::Failed) return false;
        if (only_if && it->status != *only_if) return false;
        it->status = OpStatus::Pending;
        it->error.reset();
        it->expected_updated_at.reset();
        it->retry_count = 0;
        return true;
    });
    if (retried) {
        log_info("queue", "operation_retried", {{"op_id", id}});
    }
    return retried;
}

bool OperationLog::dismiss(const std::string& id, std::optional<OpStatus> only_if) {
    bool dismissed = transact([&](std::vector<PendingOperation>& ops) {
        auto it = find_op(ops, id);
        if (it == ops.end()) return false;
        if (only_if && it->status != *only_if) return false;
        ops.erase(it);
        return true;
    });
    if (dismissed) {
        log_info("queue", "operation_dismissed", {{"op_id", id}});
    }
    return dismissed;
}

WithdrawResult OperationLog::withdraw(const std::string& id) {
    auto result = transact([&](std::vector<PendingOperation>& ops) {
        auto it = find_op(ops, id);
        if (it == ops.end()) return WithdrawResult::Absent;
        if (it->status == OpStatus::Syncing) return WithdrawResult::InFlight;
        ops.erase(it);
        return WithdrawResult::Withdrawn;
    });
    if (result == WithdrawResult::Withdrawn) {
        log_info("queue", "operation_withdrawn", {{"op_id", id}});
    }
    return result;
}

size_t OperationLog::rebase_expected(Entity entity, const std::string& record_id, int64_t from,
                                     int64_t to) {
    if (from == to) return 0;
    size_t rebased = transact([&](std::vector<PendingOperation>& ops) {
        size_t count = 0;
        for (auto& op : ops) {
            if (op.status != OpStatus::Pending || op.entity != entity) continue;
            if (op.expected_updated_at != from || op.record_id() != record_id) continue;
            op.expected_updated_at = to;
            ++count;
        }
        return count;
    });
    if (rebased > 0) {
        log_info("queue", "expectations_rebased",
                 {{"entity", to_string(entity)}, {"record_id", record_id}, {"entries", rebased}});
    }
    return rebased;
}

std::optional<PendingOperation> OperationLog::next_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const PendingOperation* oldest = nullptr;
    for (const auto& op : ops_) {
        if (op.status != OpStatus::Pending) continue;
        if (!oldest || op.created_at < oldest->created_at) {
            oldest = &op;
        }
    }
    if (!oldest) return std::nullopt;
    return *oldest;
}

bool OperationLog::begin_sync(const std::string& id) {
    return transact([&](std::vector<PendingOperation>& ops) {
        auto it = find_op(ops, id);
        if (it == ops.end() || it->status != OpStatus::Pending) return false;
        it->status = OpStatus::Syncing;
        return true;
    });
}

void OperationLog::complete(const std::string& id) {
    transact([&](std::vector<PendingOperation>& ops) {
        auto it = find_op(ops, id);
        if (it != ops.end()) {
            it->status = OpStatus::Done;
            ops.erase(it);
        }
        return true;
    });
}

void OperationLog::mark_conflict(const std::string& id, const std::string& message) {
    transact([&](std::vector<PendingOperation>& ops) {
        auto it = find_op(ops, id);
        if (it != ops.end()) {
            it->status = OpStatus::Conflict;
            it->error = message;
        }
        return true;
    });
    log_warn("queue", "operation_conflict", {{"op_id", id}, {"error", message}});
}

OpStatus OperationLog::mark_transient(const std::string& id, const std::string& message,
                                      int retry_budget) {
    auto status = transact([&](std::vector<PendingOperation>& ops) {
        auto it = find_op(ops, id);
        if (it == ops.end()) return OpStatus::Done;
        it->retry_count += 1;
        if (it->retry_count > retry_budget) {
            it->status = OpStatus::Failed;
            it->error = message;
        } else {
            it->status = OpStatus::Pending;
            it->error = "Retry " + std::to_string(it->retry_count) + "/" +
                        std::to_string(retry_budget) + ": " + message;
        }
        return it->status;
    });
    if (status == OpStatus::Failed) {
        log_error("queue", "operation_failed", {{"op_id", id}, {"error", message}});
    }
    return status;
}

void OperationLog::mark_failed(const std::string& id, const std::string& message) {
    transact([&](std::vector<PendingOperation>& ops) {
        auto it = find_op(ops, id);
        if (it != ops.end()) {
            it->status = OpStatus::Failed;
            it->error = message;
        }
        return true;
    });
    log_error("queue", "operation_failed", {{"op_id", id}, {"error", message}});
}

} // namespace stockline
