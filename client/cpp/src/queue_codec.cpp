#include "stockline/queue_codec.hpp"
#include "stockline/errors.hpp"
#include "stockline/helpers.hpp"

namespace stockline {
namespace queue_codec {

nlohmann::json encode(const PendingOperation& op) {
    nlohmann::json record = {
        {"id", op.id},
        {"entity", to_string(op.entity)},
        {"action", to_string(op.action)},
        {"payload", nlohmann::json::parse(helpers::to_json(op.payload))},
        {"status", to_string(op.status)},
        {"createdAt", op.created_at},
        {"retryCount", op.retry_count}
    };
    if (op.error) {
        record["error"] = *op.error;
    }
    if (op.expected_updated_at) {
        record["expectedUpdatedAt"] = *op.expected_updated_at;
    }
    return record;
}

PendingOperation decode(const nlohmann::json& record) {
    if (!record.is_object()) {
        throw InvalidArgumentError("Queue record is not an object");
    }
    for (const char* key : {"id", "entity", "action", "payload", "createdAt"}) {
        if (!record.contains(key)) {
            throw InvalidArgumentError(std::string("Queue record is missing ") + key);
        }
    }

    PendingOperation op;
    try {
        op.id = record.at("id").get<std::string>();
        op.entity = parse_entity(record.at("entity").get<std::string>());
        op.action = parse_action(record.at("action").get<std::string>());
        helpers::parse_json(record.at("payload").dump(), &op.payload);
        op.status = parse_status(record.value("status", std::string("pending")));
        op.created_at = record.at("createdAt").get<int64_t>();
        op.retry_count = record.value("retryCount", 0);

        if (record.contains("error") && record.at("error").is_string()) {
            op.error = record.at("error").get<std::string>();
        }
        if (record.contains("expectedUpdatedAt") && record.at("expectedUpdatedAt").is_number()) {
            op.expected_updated_at = record.at("expectedUpdatedAt").get<int64_t>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidArgumentError(std::string("Malformed queue record: ") + e.what());
    }
    return op;
}

std::string encode_queue(const std::vector<PendingOperation>& ops) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& op : ops) {
        records.push_back(encode(op));
    }
    return records.dump();
}

std::vector<PendingOperation> decode_queue(const std::string& text) {
    nlohmann::json records;
    try {
        records = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgumentError(std::string("Pending queue is not valid JSON: ") + e.what());
    }
    if (!records.is_array()) {
        throw InvalidArgumentError("Pending queue is not a list");
    }

    std::vector<PendingOperation> ops;
    ops.reserve(records.size());
    for (const auto& record : records) {
        ops.push_back(decode(record));
    }
    return ops;
}

} // namespace queue_codec
} // namespace stockline
