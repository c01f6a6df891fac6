#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "stockline/errors.hpp"
#include "stockline/queue_codec.hpp"

using namespace stockline;
using nlohmann::json;

namespace {

PendingOperation sample_op() {
    PendingOperation op;
    op.id = "op-1";
    op.entity = Entity::Items;
    op.action = Action::Update;
    helpers::set_string(&op.payload, "id", "bolt");
    helpers::set_string(&op.payload, "name", "M8 bolt");
    op.created_at = 1700000000000;
    op.expected_updated_at = 1699999990000;
    op.retry_count = 2;
    return op;
}

} // anonymous namespace

// =============================================================================
// Encoding
// =============================================================================

TEST(QueueCodecTest, Encode_ShouldUseStoredKeyNames) {
    auto record = queue_codec::encode(sample_op());

    EXPECT_EQ(record["entity"], "items");
    EXPECT_EQ(record["action"], "update");
    EXPECT_EQ(record["status"], "pending");
    EXPECT_EQ(record["createdAt"], 1700000000000);
    EXPECT_EQ(record["retryCount"], 2);
    EXPECT_EQ(record["expectedUpdatedAt"], 1699999990000);
    EXPECT_EQ(record["payload"]["name"], "M8 bolt");
    EXPECT_FALSE(record.contains("error"));
}

TEST(QueueCodecTest, EncodeQueue_ThenDecode_ShouldKeepOptionalFields) {
    auto op = sample_op();
    op.status = OpStatus::Conflict;
    op.error = "Record has been modified by another user.";

    auto decoded = queue_codec::decode_queue(queue_codec::encode_queue({op}));

    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(decoded[0].status, OpStatus::Conflict);
    EXPECT_EQ(decoded[0].error, op.error);
    EXPECT_EQ(decoded[0].expected_updated_at, op.expected_updated_at);
    EXPECT_EQ(decoded[0].record_id(), "bolt");
}

// =============================================================================
// Decoding older or damaged records
// =============================================================================

TEST(QueueCodecTest, Decode_WithoutStatusOrRetryCount_ShouldDefault) {
    json record = {
        {"id", "op-2"}, {"entity", "transactions"}, {"action", "create"},
        {"payload", {{"id", "tx-1"}}}, {"createdAt", 5}
    };

    auto op = queue_codec::decode(record);

    EXPECT_EQ(op.status, OpStatus::Pending);
    EXPECT_EQ(op.retry_count, 0);
    EXPECT_FALSE(op.expected_updated_at.has_value());
}

TEST(QueueCodecTest, Decode_LegacyErrorStatus_ShouldBeFailed) {
    json record = {
        {"id", "op-3"}, {"entity", "users"}, {"action", "delete"},
        {"payload", {{"id", "u-1"}}}, {"createdAt", 5}, {"status", "error"}
    };

    EXPECT_EQ(queue_codec::decode(record).status, OpStatus::Failed);
}

TEST(QueueCodecTest, Decode_UnknownKeys_ShouldBeIgnored) {
    json record = {
        {"id", "op-4"}, {"entity", "categories"}, {"action", "upsert"},
        {"payload", {{"id", "c-1"}}}, {"createdAt", 5}, {"deviceId", "tablet"}
    };

    EXPECT_EQ(queue_codec::decode(record).action, Action::Upsert);
}

TEST(QueueCodecTest, Decode_MissingRequiredKey_ShouldThrow) {
    json record = {{"id", "op-5"}, {"entity", "items"}, {"action", "create"}, {"createdAt", 5}};

    EXPECT_THROW(queue_codec::decode(record), InvalidArgumentError);
}

TEST(QueueCodecTest, Decode_UnknownEntity_ShouldThrow) {
    json record = {
        {"id", "op-6"}, {"entity", "invoices"}, {"action", "create"},
        {"payload", json::object()}, {"createdAt", 5}
    };

    EXPECT_THROW(queue_codec::decode(record), InvalidArgumentError);
}

TEST(QueueCodecTest, DecodeQueue_NotAList_ShouldThrow) {
    EXPECT_THROW(queue_codec::decode_queue("{\"id\":1}"), InvalidArgumentError);
    EXPECT_THROW(queue_codec::decode_queue("[{"), InvalidArgumentError);
}
