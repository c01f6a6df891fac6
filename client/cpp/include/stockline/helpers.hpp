#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/timestamp.pb.h>

namespace stockline {

/**
 * Helper functions for working with rows, timestamps and identifiers.
 */
namespace helpers {

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Milliseconds since the Unix epoch.
 */
int64_t now_millis();

inline int64_t to_millis(const google::protobuf::Timestamp& ts) {
    return ts.seconds() * 1000 + ts.nanos() / 1000000;
}

google::protobuf::Timestamp from_millis(int64_t millis);

/**
 * Random RFC 4122 version 4 UUID in canonical text form.
 */
std::string generate_id();

/**
 * Key sent with transaction creates so a replayed insert is recognised.
 * Format: "<millis>-<13 base36 chars>".
 */
std::string generate_idempotency_key();

/**
 * Convert a typed message to a row with snake_case column names.
 *
 * @throws InvalidArgumentError if the message cannot be printed as JSON
 */
google::protobuf::Struct to_row(const google::protobuf::Message& message);

/**
 * Fill a typed message from a row. Unknown columns are ignored.
 *
 * @throws InvalidArgumentError if a column has the wrong shape
 */
void from_row(const google::protobuf::Struct& row, google::protobuf::Message* message);

template<typename T>
T from_row(const google::protobuf::Struct& row) {
    T message;
    from_row(row, &message);
    return message;
}

/**
 * Print any message (rows included) as compact JSON.
 */
std::string to_json(const google::protobuf::Message& message);

/**
 * Parse JSON into a message.
 *
 * @throws InvalidArgumentError on malformed input
 */
void parse_json(const std::string& json, google::protobuf::Message* message);

/**
 * Read a string column; empty when absent or not a string.
 */
inline std::string string_field(const google::protobuf::Struct& row, const std::string& key) {
    auto it = row.fields().find(key);
    if (it == row.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return "";
    return it->second.string_value();
}

inline void set_string(google::protobuf::Struct* row, const std::string& key,
                       const std::string& value) {
    (*row->mutable_fields())[key].set_string_value(value);
}

/**
 * Read an RFC 3339 timestamp column.
 */
std::optional<google::protobuf::Timestamp> timestamp_field(const google::protobuf::Struct& row,
                                                           const std::string& key);

void set_timestamp(google::protobuf::Struct* row, const std::string& key,
                   const google::protobuf::Timestamp& value);

/**
 * Overlay the columns of a patch onto a row.
 */
inline void merge_row(google::protobuf::Struct* row, const google::protobuf::Struct& patch) {
    for (const auto& [key, value] : patch.fields()) {
        (*row->mutable_fields())[key] = value;
    }
}

} // namespace helpers
} // namespace stockline
