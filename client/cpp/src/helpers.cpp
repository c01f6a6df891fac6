#include "stockline/helpers.hpp"
#include "stockline/errors.hpp"

#include <chrono>
#include <random>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

namespace stockline {
namespace helpers {

namespace {

std::mt19937_64& rng() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

} // anonymous namespace

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

google::protobuf::Timestamp from_millis(int64_t millis) {
    return google::protobuf::util::TimeUtil::MillisecondsToTimestamp(millis);
}

std::string generate_id() {
    std::uniform_int_distribution<int> nibble(0, 15);
    static const char hex_chars[] = "0123456789abcdef";

    std::string id;
    id.reserve(36);
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            id.push_back('-');
        } else if (i == 14) {
            id.push_back('4');
        } else if (i == 19) {
            id.push_back(hex_chars[(nibble(rng()) & 0x3) | 0x8]);
        } else {
            id.push_back(hex_chars[nibble(rng())]);
        }
    }
    return id;
}

std::string generate_idempotency_key() {
    std::uniform_int_distribution<int> digit(0, 35);
    static const char base36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::string suffix;
    for (int i = 0; i < 13; ++i) {
        suffix.push_back(base36[digit(rng())]);
    }
    return std::to_string(now_millis()) + "-" + suffix;
}

std::string to_json(const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string out;
    auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
    if (!status.ok()) {
        throw InvalidArgumentError("Cannot encode " + message.GetTypeName() + ": " +
                                   status.ToString());
    }
    return out;
}

void parse_json(const std::string& json, google::protobuf::Message* message) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
    if (!status.ok()) {
        throw InvalidArgumentError("Cannot decode " + message->GetTypeName() + ": " +
                                   status.ToString());
    }
}

google::protobuf::Struct to_row(const google::protobuf::Message& message) {
    google::protobuf::Struct row;
    parse_json(to_json(message), &row);
    return row;
}

void from_row(const google::protobuf::Struct& row, google::protobuf::Message* message) {
    parse_json(to_json(row), message);
}

std::optional<google::protobuf::Timestamp> timestamp_field(const google::protobuf::Struct& row,
                                                           const std::string& key) {
    auto text = string_field(row, key);
    if (text.empty()) return std::nullopt;

    google::protobuf::Timestamp ts;
    if (!google::protobuf::util::TimeUtil::FromString(text, &ts)) {
        return std::nullopt;
    }
    return ts;
}

void set_timestamp(google::protobuf::Struct* row, const std::string& key,
                   const google::protobuf::Timestamp& value) {
    set_string(row, key, google::protobuf::util::TimeUtil::ToString(value));
}

} // namespace helpers
} // namespace stockline
