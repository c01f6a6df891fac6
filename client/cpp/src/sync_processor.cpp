#include "stockline/sync_processor.hpp"
#include "stockline/errors.hpp"
#include "stockline/helpers.hpp"
#include "stockline/logging.hpp"

namespace stockline {

namespace {

const char* kRecordMissing = "Record no longer exists.";
const char* kRecordModified = "Record has been modified by another user.";

/// Ends the single-flight pass. finish() closes it normally; the destructor
/// only has work to do when a sweep threw.
class ActivePass {
public:
    ActivePass(std::mutex& mutex, bool& active) : mutex_(mutex), active_(active) {}

    ~ActivePass() {
        if (finished_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
    }

    ActivePass(const ActivePass&) = delete;
    ActivePass& operator=(const ActivePass&) = delete;

    /// @return false when another drain asked for one more sweep
    bool finish(bool& follow_up) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (follow_up) {
            follow_up = false;
            return false;
        }
        active_ = false;
        finished_ = true;
        return true;
    }

private:
    std::mutex& mutex_;
    bool& active_;
    bool finished_ = false;
};

nlohmann::json describe(const PendingOperation& op) {
    return {
        {"op_id", op.id},
        {"entity", to_string(op.entity)},
        {"action", to_string(op.action)},
        {"record_id", op.record_id()}
    };
}

} // anonymous namespace

SyncProcessor::SyncProcessor(OperationLog& log, RemoteStore& remote, SyncOptions options)
    : log_(log), remote_(remote), options_(std::move(options)) {}

bool SyncProcessor::active() const {
    std::lock_guard<std::mutex> lock(flight_mutex_);
    return active_;
}

SyncReport SyncProcessor::drain() {
    SyncReport report;
    {
        std::lock_guard<std::mutex> lock(flight_mutex_);
        if (active_) {
            follow_up_ = true;
            report.coalesced = true;
        } else {
            active_ = true;
            follow_up_ = false;
        }
    }
    if (report.coalesced) {
        log_info("sync", "drain_coalesced");
        return report;
    }

    ActivePass pass(flight_mutex_, active_);
    do {
        sweep(report);
    } while (!pass.finish(follow_up_));

    log_info("sync", "drain_finished", {
        {"processed", report.processed},
        {"conflicts", report.conflicts},
        {"failed", report.failed},
        {"deferred", report.deferred}
    });
    return report;
}

void SyncProcessor::sweep(SyncReport& report) {
    while (auto next = log_.next_pending()) {
        if (!log_.begin_sync(next->id)) {
            continue;
        }

        switch (process(*next)) {
            case Outcome::Done:
                ++report.processed;
                break;
            case Outcome::Conflict:
                ++report.conflicts;
                break;
            case Outcome::Failed:
                ++report.failed;
                break;
            case Outcome::Deferred:
                ++report.deferred;
                return;
        }
    }
}

SyncProcessor::Outcome SyncProcessor::process(const PendingOperation& op) {
    std::optional<std::string> conflict;
    try {
        conflict = replay(op);
    } catch (const StorageError&) {
        throw;
    } catch (const ClientError& e) {
        if (is_transient(e)) {
            auto status = log_.mark_transient(op.id, e.what(), options_.retry_budget);
            auto fields = describe(op);
            fields["error"] = e.what();
            fields["retry_count"] = op.retry_count + 1;
            if (status == OpStatus::Failed) {
                log_error("sync", "sync_failed", fields);
                return Outcome::Failed;
            }
            log_warn("sync", "sync_deferred", fields);
            return Outcome::Deferred;
        }
        conflict = e.what();
    }

    if (conflict) {
        log_.mark_conflict(op.id, *conflict);
        auto fields = describe(op);
        fields["error"] = *conflict;
        log_warn("sync", "sync_conflict", fields);
        return Outcome::Conflict;
    }

    log_.complete(op.id);
    log_info("sync", "operation_synced", describe(op));
    if (options_.on_synced) {
        options_.on_synced(op);
    }
    return Outcome::Done;
}

std::optional<std::string> SyncProcessor::replay(const PendingOperation& op) {
    auto id = op.record_id();

    if ((op.action == Action::Update || op.action == Action::Delete) && op.expected_updated_at) {
        auto current = remote_.fetch_updated_at(op.entity, id);
        if (!current) {
            if (op.action == Action::Delete) {
                return std::nullopt;
            }
            return std::string(kRecordMissing);
        }
        if (helpers::to_millis(*current) != *op.expected_updated_at) {
            return std::string(kRecordModified);
        }
    }

    switch (op.action) {
        case Action::Create:
            remote_.insert(op.entity, op.payload);
            break;
        case Action::Update:
            remote_.update(op.entity, id, op.payload);
            break;
        case Action::Delete:
            try {
                remote_.remove(op.entity, id);
            } catch (const ClientError& e) {
                if (!e.is_not_found()) throw;
            }
            break;
        case Action::Upsert:
            try {
                remote_.insert(op.entity, op.payload);
            } catch (const ClientError& e) {
                if (is_transient(e) || !e.is_precondition_failed()) throw;
                remote_.update(op.entity, id, op.payload);
            }
            break;
    }
    return std::nullopt;
}

} // namespace stockline
