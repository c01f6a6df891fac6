#pragma once

#include <optional>
#include <string>
#include <google/protobuf/struct.pb.h>
#include "types.hpp"

namespace stockline {

/**
 * What it takes to undo one optimistic change to the local cache.
 *
 * prior_row holds the row as it was before the change; when it is empty the
 * record did not exist and undoing means removing it.
 */
struct CompensatingPatch {
    Entity entity = Entity::Transactions;
    std::string record_id;
    std::optional<google::protobuf::Struct> prior_row;
};

enum class WriteOutcome {
    /// The remote store accepted the write synchronously.
    Confirmed,
    /// The write sits in the pending operation log.
    Queued
};

/**
 * A local mutation paired with its compensation. Applying undo restores the
 * cache to the state before op was written.
 */
struct LocalMutation {
    PendingOperation op;
    CompensatingPatch undo;
    WriteOutcome outcome = WriteOutcome::Queued;
    /// The row as it now stands in the cache.
    google::protobuf::Struct row;
};

} // namespace stockline
