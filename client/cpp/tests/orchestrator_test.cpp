#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "fake_remote_store.hpp"
#include "stockline/connectivity.hpp"
#include "stockline/durable_store.hpp"
#include "stockline/entity_cache.hpp"
#include "stockline/errors.hpp"
#include "stockline/helpers.hpp"
#include "stockline/notification_sink.hpp"
#include "stockline/operation_log.hpp"
#include "stockline/orchestrator.hpp"
#include "stockline/writer.hpp"

using namespace stockline;
using stockline::testing_support::FakeRemoteStore;

namespace {

class RecordingSink : public NotificationSink {
public:
    std::vector<SheetRow> rows;
    bool fail = false;

    void publish(const SheetRow& row) override {
        if (fail) throw std::runtime_error("spreadsheet unreachable");
        rows.push_back(row);
    }
};

} // anonymous namespace

class OrchestratorTest : public ::testing::Test {
protected:
    MemoryStore store;
    FakeRemoteStore remote;
    EntityCache cache{store};
    OperationLog log{store};
    Connectivity connectivity{false};
    EntityWriter writer{cache, log, &remote, connectivity};
    RecordingSink sink;
    TransactionOrchestrator orchestrator{cache, writer, &sink};

    void SetUp() override {
        Category category;
        category.set_id("cat-1");
        category.set_name("Fasteners");
        cache.upsert(Entity::Categories, helpers::to_row(category));

        Item item;
        item.set_id("bolt");
        item.set_name("M8 bolt");
        item.set_unit("pcs");
        item.set_category_id("cat-1");
        cache.upsert(Entity::Items, helpers::to_row(item));
    }

    void seed(TransactionType type, int32_t quantity) {
        Transaction tx;
        tx.set_id(helpers::generate_id());
        tx.set_item_id("bolt");
        tx.set_type(type);
        tx.set_quantity(quantity);
        cache.upsert(Entity::Transactions, helpers::to_row(tx));
    }

    TransactionRequest request(TransactionType type, int64_t quantity) {
        TransactionRequest r;
        r.item_id = "bolt";
        r.type = type;
        r.quantity = quantity;
        r.user_name = "sam";
        r.reason = "site A";
        return r;
    }

    size_t transactions_of(TransactionType type) {
        size_t n = 0;
        for (const auto& tx : cache.transactions()) {
            if (tx.type() == type) ++n;
        }
        return n;
    }
};

// =============================================================================
// Validation
// =============================================================================

TEST_F(OrchestratorTest, UnknownItem_ShouldBeInvalid) {
    auto r = request(IN, 5);
    r.item_id = "missing";

    EXPECT_THROW(orchestrator.record(r), InvalidArgumentError);
}

TEST_F(OrchestratorTest, NonPositiveInOrOut_ShouldBeInvalid) {
    EXPECT_THROW(orchestrator.record(request(IN, 0)), InvalidArgumentError);
    EXPECT_THROW(orchestrator.record(request(OUT, -1)), InvalidArgumentError);
}

TEST_F(OrchestratorTest, ZeroWip_ShouldBeInvalidButNegativeAllowed) {
    seed(WIP, 4);

    EXPECT_THROW(orchestrator.record(request(WIP, 0)), InvalidArgumentError);
    EXPECT_NO_THROW(orchestrator.record(request(WIP, -2)));
    EXPECT_EQ(orchestrator.level("bolt").wip, 2);
}

TEST_F(OrchestratorTest, QuantityBeyondRowRange_ShouldBeInvalidAndLeaveLedgerAlone) {
    EXPECT_THROW(orchestrator.record(request(IN, 3000000000LL)), InvalidArgumentError);
    EXPECT_THROW(orchestrator.record(request(WIP, -3000000000LL)), InvalidArgumentError);

    EXPECT_EQ(orchestrator.level("bolt"), (StockLevel{0, 0}));
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(OrchestratorTest, WipReduction_BeyondRecordedWip_ShouldBeInvalid) {
    EXPECT_THROW(orchestrator.record(request(WIP, -5)), InvalidArgumentError);

    seed(WIP, 4);
    EXPECT_THROW(orchestrator.record(request(WIP, -5)), InvalidArgumentError);
    EXPECT_NO_THROW(orchestrator.record(request(WIP, -4)));
    EXPECT_EQ(orchestrator.level("bolt").wip, 0);
}

// =============================================================================
// Simple movements
// =============================================================================

TEST_F(OrchestratorTest, In_ShouldRaiseStockAndNotify) {
    auto result = orchestrator.record(request(IN, 10));

    EXPECT_EQ(orchestrator.level("bolt").stock, 10);
    EXPECT_FALSE(result.wip_reduced.has_value());
    EXPECT_FALSE(result.created.idempotency_key().empty());
    ASSERT_EQ(sink.rows.size(), 1u);
    EXPECT_EQ(sink.rows[0].item, "M8 bolt");
    EXPECT_EQ(sink.rows[0].category, "Fasteners");
    EXPECT_EQ(sink.rows[0].type, "IN");
}

TEST_F(OrchestratorTest, Out_WithoutWip_BeyondStock_ShouldThrowBeforeQueueing) {
    seed(IN, 2);

    EXPECT_THROW(orchestrator.record(request(OUT, 5)), InsufficientStockError);
    EXPECT_EQ(log.size(), 0u);
    EXPECT_EQ(transactions_of(OUT), 0u);
}

TEST_F(OrchestratorTest, FailingSink_ShouldNotAffectRecording) {
    sink.fail = true;

    EXPECT_NO_THROW(orchestrator.record(request(IN, 3)));
    EXPECT_EQ(orchestrator.level("bolt").stock, 3);
}

// =============================================================================
// WIP auto-reduction saga
// =============================================================================

TEST_F(OrchestratorTest, Out_WithPartialWip_ShouldReduceWipThenTakeRemainder) {
    // Given stock 10 and WIP 5
    seed(IN, 10);
    seed(WIP, 5);
    auto r = request(OUT, 8);
    r.amount = 80.0;

    // When OUT(8) is recorded
    auto result = orchestrator.record(r);

    // Then WIP(-5) and OUT(3) exist and the OUT keeps the full amount
    ASSERT_TRUE(result.wip_reduced.has_value());
    EXPECT_EQ(result.wip_reduced->quantity(), -5);
    EXPECT_EQ(result.wip_reduced->reason(), "Auto-reduced WIP: site A");
    EXPECT_DOUBLE_EQ(result.wip_reduced->amount(), 50.0);
    EXPECT_EQ(result.created.type(), OUT);
    EXPECT_EQ(result.created.quantity(), 3);
    EXPECT_DOUBLE_EQ(result.created.amount(), 80.0);
    EXPECT_FALSE(result.short_circuited);

    auto level = orchestrator.level("bolt");
    EXPECT_EQ(level.wip, 0);
    EXPECT_EQ(level.stock, 7);
    EXPECT_EQ(log.list_pending().size(), 2u);
}

TEST_F(OrchestratorTest, Out_CoveredByWip_ShouldShortCircuit) {
    // Given stock 20 and WIP 10
    seed(IN, 20);
    seed(WIP, 10);

    // When OUT(6) is recorded
    auto result = orchestrator.record(request(OUT, 6));

    // Then only WIP(-6) exists and no OUT row was written
    EXPECT_TRUE(result.short_circuited);
    EXPECT_EQ(result.created.type(), WIP);
    EXPECT_EQ(result.created.quantity(), -6);
    EXPECT_EQ(transactions_of(OUT), 0u);
    auto level = orchestrator.level("bolt");
    EXPECT_EQ(level.wip, 4);
    EXPECT_EQ(level.stock, 20);
    ASSERT_EQ(sink.rows.size(), 1u);
    EXPECT_EQ(sink.rows[0].type, "WIP");
}

TEST_F(OrchestratorTest, Out_WhenRemainderFailsOffline_ShouldRollBackWip) {
    // Given stock 10, WIP 5 and a queue with room for one operation
    seed(IN, 10);
    seed(WIP, 5);
    OperationLog tiny(store, LogOptions{1});
    EntityWriter limited(cache, tiny, &remote, connectivity);
    TransactionOrchestrator saga(cache, limited, &sink);
    auto before = cache.count(Entity::Transactions);

    // When the OUT(3) remainder cannot be queued
    EXPECT_THROW(saga.record(request(OUT, 8)), QueueFullError);

    // Then the WIP reduction is gone from the cache and the queue
    auto level = saga.level("bolt");
    EXPECT_EQ(level.wip, 5);
    EXPECT_EQ(level.stock, 10);
    EXPECT_EQ(cache.count(Entity::Transactions), before);
    EXPECT_EQ(tiny.size(), 0u);
    EXPECT_TRUE(sink.rows.empty());
}

TEST_F(OrchestratorTest, Out_WhenRemainderRejectedOnline_ShouldRollBackWip) {
    // Given stock 10 and WIP 5, online, with the remote refusing the second insert
    seed(IN, 10);
    seed(WIP, 5);
    connectivity.set_online(true);
    int inserts = 0;
    remote.fail_with = [&inserts](const std::string& method, Entity, const std::string&) {
        if (method == "insert" && ++inserts == 2) {
            throw GrpcError("insufficient_stock:2", grpc::StatusCode::FAILED_PRECONDITION);
        }
    };

    // When OUT(8) is recorded
    EXPECT_THROW(orchestrator.record(request(OUT, 8)), InsufficientStockError);

    // Then WIP=5, stock=10 and the reduction row is gone locally and remotely
    auto level = orchestrator.level("bolt");
    EXPECT_EQ(level.wip, 5);
    EXPECT_EQ(level.stock, 10);
    EXPECT_EQ(transactions_of(WIP), 1u);
    EXPECT_EQ(remote.count(Entity::Transactions), 0);
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(OrchestratorTest, Out_WhenRemainderExceedsStock_ShouldRollBackWip) {
    // Given stock 2 and WIP 3
    seed(IN, 2);
    seed(WIP, 3);

    // When OUT(6) leaves a remainder of 3 against stock 2
    EXPECT_THROW(orchestrator.record(request(OUT, 6)), InsufficientStockError);

    // Then the reduction was undone
    EXPECT_EQ(orchestrator.level("bolt").wip, 3);
    EXPECT_EQ(log.size(), 0u);
}

// =============================================================================
// Edits and catalog
// =============================================================================

TEST_F(OrchestratorTest, UpdateMetadata_ShouldOnlyTouchAllowedColumns) {
    auto created = orchestrator.record(request(IN, 10)).created;

    TransactionPatch patch;
    patch.reason = "recount";
    patch.bill_number = "B-17";
    auto updated = orchestrator.update_metadata(created.id(), patch);

    EXPECT_EQ(updated.reason(), "recount");
    EXPECT_EQ(updated.bill_number(), "B-17");
    EXPECT_EQ(updated.quantity(), 10);
    EXPECT_EQ(updated.type(), IN);
}

TEST_F(OrchestratorTest, Reverse_ShouldDropMovementFromLedger) {
    auto created = orchestrator.record(request(IN, 10)).created;

    orchestrator.reverse(created.id());

    EXPECT_EQ(orchestrator.level("bolt").stock, 0);
}

TEST_F(OrchestratorTest, Out_AfterOldHistoryPruned_ShouldStillSeeThatStock) {
    // Given IN(10) recorded long ago and then pruned from the cache
    Transaction old;
    old.set_id("tx-old");
    old.set_item_id("bolt");
    old.set_type(IN);
    old.set_quantity(10);
    *old.mutable_timestamp() = helpers::from_millis(1000);
    cache.upsert(Entity::Transactions, helpers::to_row(old));
    cache.prune_transactions(3000);

    // When OUT(5) is recorded
    EXPECT_NO_THROW(orchestrator.record(request(OUT, 5)));

    // Then
    EXPECT_EQ(orchestrator.level("bolt").stock, 5);
}

TEST_F(OrchestratorTest, CarriedForwardRow_ShouldNotBeEditable) {
    Transaction old;
    old.set_id("tx-old");
    old.set_item_id("bolt");
    old.set_type(IN);
    old.set_quantity(10);
    *old.mutable_timestamp() = helpers::from_millis(1000);
    cache.upsert(Entity::Transactions, helpers::to_row(old));
    cache.prune_transactions(3000);
    std::string carried;
    for (const auto& tx : cache.transactions()) {
        if (EntityCache::is_carry_forward(tx.id())) carried = tx.id();
    }
    ASSERT_FALSE(carried.empty());

    TransactionPatch patch;
    patch.reason = "edited";
    EXPECT_THROW(orchestrator.update_metadata(carried, patch), InvalidArgumentError);
    EXPECT_THROW(orchestrator.reverse(carried), InvalidArgumentError);
    EXPECT_EQ(orchestrator.level("bolt").stock, 10);
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(OrchestratorTest, CreateItem_WithNewCategoryName_ShouldCreateCategoryOnce) {
    Item first;
    first.set_name("Washer");
    Item second;
    second.set_name("Nut");

    auto a = orchestrator.create_item(first, "Hardware");
    auto b = orchestrator.create_item(second, "Hardware");

    EXPECT_FALSE(a.category_id().empty());
    EXPECT_EQ(a.category_id(), b.category_id());
    EXPECT_EQ(cache.count(Entity::Categories), 2u);
}

TEST_F(OrchestratorTest, CreateItem_WithExistingCategoryName_ShouldReuseIt) {
    Item item;
    item.set_name("Washer");

    auto created = orchestrator.create_item(item, "Fasteners");

    EXPECT_EQ(created.category_id(), "cat-1");
}
