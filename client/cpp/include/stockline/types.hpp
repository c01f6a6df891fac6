#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <google/protobuf/struct.pb.h>
#include "helpers.hpp"

namespace stockline {

/**
 * Remote tables a pending operation can target.
 */
enum class Entity {
    Items,
    Transactions,
    Categories,
    Contractors,
    Users
};

enum class Action {
    Create,
    Update,
    Delete,
    Upsert
};

/**
 * Lifecycle of a pending operation.
 *
 *   pending -> syncing -> done (removed)
 *                      -> conflict | failed  (kept until retry or dismiss)
 *                      -> pending            (transient failure, budget left)
 */
enum class OpStatus {
    Pending,
    Syncing,
    Done,
    Conflict,
    Failed
};

/// Table name as used on the wire and in the persisted queue.
std::string to_string(Entity entity);
std::string to_string(Action action);
std::string to_string(OpStatus status);

/// @throws InvalidArgumentError for unknown names
Entity parse_entity(const std::string& name);
Action parse_action(const std::string& name);
OpStatus parse_status(const std::string& name);

/**
 * A mutation recorded locally and not yet confirmed by the remote store.
 */
struct PendingOperation {
    std::string id;
    Entity entity = Entity::Transactions;
    Action action = Action::Create;
    google::protobuf::Struct payload;
    OpStatus status = OpStatus::Pending;
    int64_t created_at = 0;
    std::optional<std::string> error;
    /// updated_at of the cached record when an update/delete was queued
    std::optional<int64_t> expected_updated_at;
    int retry_count = 0;

    /// Id of the record the payload targets.
    std::string record_id() const { return helpers::string_field(payload, "id"); }
};

struct OpsSummary {
    size_t pending = 0;
    size_t conflicts = 0;
};

} // namespace stockline
