#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "types.hpp"

namespace stockline {

/**
 * On-disk form of the pending operation queue.
 *
 * Each record is
 *   {"id", "entity", "action", "payload", "status", "createdAt",
 *    "error"?, "expectedUpdatedAt"?, "retryCount"}
 * Entries may sit in the queue across an upgrade, so keys are only ever
 * added. Readers ignore keys they do not know.
 */
namespace queue_codec {

nlohmann::json encode(const PendingOperation& op);

/// @throws InvalidArgumentError for a record missing required keys
PendingOperation decode(const nlohmann::json& record);

std::string encode_queue(const std::vector<PendingOperation>& ops);

/// @throws InvalidArgumentError for malformed JSON or records
std::vector<PendingOperation> decode_queue(const std::string& text);

} // namespace queue_codec
} // namespace stockline
