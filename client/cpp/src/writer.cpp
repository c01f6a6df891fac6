#include "stockline/writer.hpp"
#include "stockline/errors.hpp"
#include "stockline/helpers.hpp"
#include "stockline/logging.hpp"
#include "stockline/validation.hpp"

namespace stockline {

namespace {

nlohmann::json describe(const PendingOperation& op) {
    return {
        {"entity", to_string(op.entity)},
        {"action", to_string(op.action)},
        {"record_id", op.record_id()}
    };
}

std::optional<int64_t> updated_at_of(const std::optional<google::protobuf::Struct>& row) {
    if (!row) return std::nullopt;
    auto ts = helpers::timestamp_field(*row, "updated_at");
    if (!ts) return std::nullopt;
    return helpers::to_millis(*ts);
}

} // anonymous namespace

EntityWriter::EntityWriter(EntityCache& cache, OperationLog& log, RemoteStore* remote,
                           Connectivity& connectivity)
    : cache_(cache), log_(log), remote_(remote), connectivity_(connectivity) {}

void EntityWriter::hold(const std::string& reason) {
    std::lock_guard<std::mutex> lock(hold_mutex_);
    hold_reason_ = reason;
    log_warn("writer", "writes_held", {{"reason", reason}});
}

void EntityWriter::release() {
    std::lock_guard<std::mutex> lock(hold_mutex_);
    if (!hold_reason_) return;
    hold_reason_.reset();
    log_info("writer", "writes_released");
}

bool EntityWriter::held() const {
    std::lock_guard<std::mutex> lock(hold_mutex_);
    return hold_reason_.has_value();
}

void EntityWriter::check_writable() const {
    {
        std::lock_guard<std::mutex> lock(hold_mutex_);
        if (hold_reason_) throw GuardBlockedError(*hold_reason_);
    }
    if (log_.has_conflicts()) throw ConflictsPendingError();
}

LocalMutation EntityWriter::create(Entity entity, const google::protobuf::Struct& row) {
    check_writable();

    PendingOperation op;
    op.entity = entity;
    op.action = Action::Create;
    op.payload = row;
    if (op.record_id().empty()) {
        helpers::set_string(&op.payload, "id", helpers::generate_id());
    }

    auto undo = cache_.upsert(entity, op.payload);
    return execute(std::move(op), std::move(undo));
}

LocalMutation EntityWriter::update(Entity entity, const std::string& id,
                                   const google::protobuf::Struct& patch) {
    check_writable();
    validation::require_not_empty(id, "id");

    PendingOperation op;
    op.entity = entity;
    op.action = Action::Update;
    op.payload = patch;
    helpers::set_string(&op.payload, "id", id);

    auto undo = cache_.merge(entity, id, patch);
    op.expected_updated_at = updated_at_of(undo.prior_row);
    return execute(std::move(op), std::move(undo));
}

LocalMutation EntityWriter::remove(Entity entity, const std::string& id) {
    check_writable();
    validation::require_not_empty(id, "id");

    PendingOperation op;
    op.entity = entity;
    op.action = Action::Delete;
    helpers::set_string(&op.payload, "id", id);

    auto undo = cache_.remove(entity, id);
    op.expected_updated_at = updated_at_of(undo.prior_row);
    return execute(std::move(op), std::move(undo));
}

LocalMutation EntityWriter::execute(PendingOperation op, CompensatingPatch undo) {
    LocalMutation mutation;
    mutation.undo = undo;

    if (remote_ && connectivity_.online()) {
        google::protobuf::Struct stored;
        bool confirmed = false;
        try {
            send(op, &stored);
            confirmed = true;
        } catch (const ClientError& e) {
            if (!is_transient(e)) {
                cache_.apply(undo);
                auto fields = describe(op);
                fields["error"] = e.what();
                log_warn("writer", "write_rejected", fields);
                rethrow_rejection(e, op);
            }
            auto fields = describe(op);
            fields["error"] = e.what();
            log_warn("writer", "remote_unreachable", fields);
        }

        if (confirmed) {
            if (stored.fields_size() > 0) {
                cache_.upsert(op.entity, stored);
            } else if (op.action == Action::Update || op.action == Action::Upsert) {
                try {
                    adopt_remote_stamp(op);
                } catch (const ClientError& e) {
                    auto fields = describe(op);
                    fields["error"] = e.what();
                    log_warn("writer", "stamp_refresh_failed", fields);
                }
            }
            op.status = OpStatus::Done;
            op.created_at = helpers::now_millis();
            mutation.op = op;
            mutation.outcome = WriteOutcome::Confirmed;
            if (auto row = cache_.find(op.entity, op.record_id())) mutation.row = *row;
            log_info("writer", "write_confirmed", describe(op));
            return mutation;
        }
    }

    try {
        mutation.op = log_.enqueue(op);
    } catch (const ClientError& e) {
        cache_.apply(undo);
        auto fields = describe(op);
        fields["error"] = e.what();
        log_error("writer", "enqueue_failed", fields);
        throw;
    }
    mutation.outcome = WriteOutcome::Queued;
    if (auto row = cache_.find(op.entity, op.record_id())) mutation.row = *row;

    auto fields = describe(mutation.op);
    fields["op_id"] = mutation.op.id;
    log_info("writer", "operation_queued", fields);
    return mutation;
}

void EntityWriter::send(const PendingOperation& op, google::protobuf::Struct* stored) {
    auto id = op.record_id();
    switch (op.action) {
        case Action::Create:
            *stored = remote_->insert(op.entity, op.payload);
            break;
        case Action::Update:
            remote_->update(op.entity, id, op.payload);
            break;
        case Action::Delete:
            try {
                remote_->remove(op.entity, id);
            } catch (const ClientError& e) {
                if (!e.is_not_found()) throw;
            }
            break;
        case Action::Upsert:
            try {
                *stored = remote_->insert(op.entity, op.payload);
            } catch (const ClientError& e) {
                if (is_transient(e) || !e.is_precondition_failed()) throw;
                remote_->update(op.entity, id, op.payload);
            }
            break;
    }
}

void EntityWriter::rethrow_rejection(const ClientError& error, const PendingOperation& op) {
    std::string message = error.what();
    std::string prefix = kInsufficientStockPrefix;
    if (message.compare(0, prefix.size(), prefix) == 0) {
        int64_t available = 0;
        try {
            available = std::stoll(message.substr(prefix.size()));
        } catch (const std::logic_error&) {
            available = 0;
        }
        int64_t requested = 0;
        auto it = op.payload.fields().find("quantity");
        if (it != op.payload.fields().end() &&
            it->second.kind_case() == google::protobuf::Value::kNumberValue) {
            requested = static_cast<int64_t>(it->second.number_value());
        }
        throw InsufficientStockError(available, requested);
    }
    throw;
}

void EntityWriter::adopt_remote_stamp(const PendingOperation& op) {
    if (!remote_ || op.action == Action::Delete) return;
    auto id = op.record_id();
    auto cached = cache_.find(op.entity, id);
    if (!cached) return;

    auto stamp = remote_->fetch_updated_at(op.entity, id);
    if (!stamp) return;
    auto adopted = helpers::to_millis(*stamp);
    auto previous = updated_at_of(cached);
    if (previous == adopted) return;

    google::protobuf::Struct patch;
    helpers::set_timestamp(&patch, "updated_at", *stamp);
    cache_.merge(op.entity, id, patch);
    if (previous) {
        log_.rebase_expected(op.entity, id, *previous, adopted);
    }
}

void EntityWriter::revert(const LocalMutation& mutation) noexcept {
    const auto& op = mutation.op;
    try {
        auto queued = mutation.outcome == WriteOutcome::Confirmed ? WithdrawResult::Absent
                                                                  : log_.withdraw(op.id);
        switch (queued) {
            case WithdrawResult::Withdrawn:
                break;
            case WithdrawResult::InFlight: {
                // A drain is sending it now; the undo has to follow it out.
                auto inverse = log_.enqueue(inverse_of(mutation));
                auto fields = describe(inverse);
                fields["op_id"] = inverse.id;
                fields["after_op_id"] = op.id;
                log_warn("writer", "revert_queued_behind_sync", fields);
                break;
            }
            case WithdrawResult::Absent:
                // Confirmed, directly or by a drain since the write.
                compensate_remote(mutation);
                break;
        }
    } catch (const ClientError& e) {
        auto fields = describe(op);
        fields["error"] = e.what();
        log_error("writer", "revert_dequeue_failed", fields);
    }

    try {
        cache_.apply(mutation.undo);
        log_info("writer", "mutation_reverted", describe(op));
    } catch (const ClientError& e) {
        auto fields = describe(op);
        fields["error"] = e.what();
        log_error("writer", "revert_cache_failed", fields);
    }
}

PendingOperation EntityWriter::inverse_of(const LocalMutation& mutation) {
    const auto& op = mutation.op;
    const auto& undo = mutation.undo;

    PendingOperation inverse;
    inverse.entity = op.entity;
    if (undo.prior_row) {
        inverse.action = op.action == Action::Delete ? Action::Upsert : Action::Update;
        inverse.payload = *undo.prior_row;
    } else {
        inverse.action = Action::Delete;
        helpers::set_string(&inverse.payload, "id", undo.record_id);
    }
    return inverse;
}

void EntityWriter::compensate_remote(const LocalMutation& mutation) {
    auto inverse = inverse_of(mutation);

    try {
        if (!remote_) throw ConnectionError("No remote store configured");
        google::protobuf::Struct ignored;
        send(inverse, &ignored);
        log_info("writer", "remote_write_undone", describe(inverse));
        return;
    } catch (const ClientError& e) {
        auto fields = describe(inverse);
        fields["error"] = e.what();
        log_error("writer", "remote_rollback_failed", fields);
    }

    auto queued = log_.enqueue(inverse);
    auto fields = describe(queued);
    fields["op_id"] = queued.id;
    log_warn("writer", "remote_rollback_queued", fields);
}

} // namespace stockline
