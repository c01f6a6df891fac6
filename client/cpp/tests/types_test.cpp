#include <gtest/gtest.h>
#include <regex>
#include <set>
#include "stockline/errors.hpp"
#include "stockline/helpers.hpp"
#include "stockline/inventory.pb.h"
#include "stockline/types.hpp"

using namespace stockline;

// =============================================================================
// Identifiers
// =============================================================================

TEST(HelpersTest, GenerateId_ShouldBeVersion4Uuid) {
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;

    for (int i = 0; i < 100; ++i) {
        auto id = helpers::generate_id();
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(HelpersTest, IdempotencyKey_ShouldBeMillisAndSuffix) {
    std::regex key("^[0-9]+-[0-9a-z]{13}$");

    EXPECT_TRUE(std::regex_match(helpers::generate_idempotency_key(), key));
}

// =============================================================================
// Rows
// =============================================================================

TEST(HelpersTest, ToRow_ShouldUseSnakeCaseKeys) {
    Item item;
    item.set_id("bolt");
    item.set_category_id("fasteners");
    item.set_min_stock(5);

    auto row = helpers::to_row(item);

    EXPECT_EQ(helpers::string_field(row, "category_id"), "fasteners");
    EXPECT_EQ(helpers::from_row<Item>(row).min_stock(), 5);
}

TEST(HelpersTest, MergeRow_ShouldOverwriteOnlyPatchedKeys) {
    google::protobuf::Struct row;
    helpers::set_string(&row, "id", "bolt");
    helpers::set_string(&row, "name", "M8 bolt");
    google::protobuf::Struct patch;
    helpers::set_string(&patch, "name", "M10 bolt");

    helpers::merge_row(&row, patch);

    EXPECT_EQ(helpers::string_field(row, "id"), "bolt");
    EXPECT_EQ(helpers::string_field(row, "name"), "M10 bolt");
}

TEST(HelpersTest, Timestamps_ShouldRoundTripMillis) {
    google::protobuf::Struct row;
    helpers::set_timestamp(&row, "updated_at", helpers::from_millis(1700000000123));

    auto ts = helpers::timestamp_field(row, "updated_at");

    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(helpers::to_millis(*ts), 1700000000123);
    EXPECT_FALSE(helpers::timestamp_field(row, "created_at").has_value());
}

// =============================================================================
// Names
// =============================================================================

TEST(TypesTest, ParseEntity_ShouldAcceptTableNames) {
    for (auto entity : {Entity::Items, Entity::Transactions, Entity::Categories,
                        Entity::Contractors, Entity::Users}) {
        EXPECT_EQ(parse_entity(to_string(entity)), entity);
    }
}

TEST(TypesTest, ParseUnknownNames_ShouldThrow) {
    EXPECT_THROW(parse_entity("invoices"), InvalidArgumentError);
    EXPECT_THROW(parse_action("merge"), InvalidArgumentError);
    EXPECT_THROW(parse_status("lost"), InvalidArgumentError);
}
