#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "fake_remote_store.hpp"
#include "stockline/conflict_resolver.hpp"
#include "stockline/durable_store.hpp"
#include "stockline/helpers.hpp"
#include "stockline/operation_log.hpp"
#include "stockline/sync_processor.hpp"

using namespace stockline;
using stockline::testing_support::FakeRemoteStore;

class SyncProcessorTest : public ::testing::Test {
protected:
    MemoryStore store;
    FakeRemoteStore remote;
    int64_t now = 1000;
    OperationLog log{store, log_options()};

    LogOptions log_options() {
        LogOptions opts;
        opts.clock = [this] { return now++; };
        return opts;
    }

    PendingOperation queue(const std::string& record_id, Action action = Action::Create,
                           Entity entity = Entity::Transactions) {
        PendingOperation op;
        op.entity = entity;
        op.action = action;
        helpers::set_string(&op.payload, "id", record_id);
        helpers::set_string(&op.payload, "reason", "restock");
        return log.enqueue(op);
    }

    google::protobuf::Struct row(const std::string& id, const std::string& reason) {
        google::protobuf::Struct r;
        helpers::set_string(&r, "id", id);
        helpers::set_string(&r, "reason", reason);
        return r;
    }
};

// =============================================================================
// Replay
// =============================================================================

TEST_F(SyncProcessorTest, Drain_ShouldReplayInCreatedAtOrderAndEmptyLog) {
    queue("tx-1");
    queue("tx-2", Action::Create, Entity::Items);
    queue("tx-1", Action::Update);

    SyncProcessor processor(log, remote);
    auto report = processor.drain();

    EXPECT_EQ(report.processed, 3u);
    EXPECT_EQ(log.size(), 0u);
    EXPECT_EQ(remote.calls("insert"), 2u);
    EXPECT_EQ(remote.calls("update"), 1u);
    EXPECT_TRUE(remote.row(Entity::Items, "tx-2").has_value());
}

TEST_F(SyncProcessorTest, Drain_ShouldReportConfirmedOperations) {
    queue("tx-1");
    std::vector<std::string> synced;
    SyncOptions options;
    options.on_synced = [&](const PendingOperation& op) { synced.push_back(op.record_id()); };

    SyncProcessor processor(log, remote, options);
    processor.drain();

    ASSERT_EQ(synced.size(), 1u);
    EXPECT_EQ(synced[0], "tx-1");
}

TEST_F(SyncProcessorTest, Upsert_OnExistingRow_ShouldFallBackToUpdate) {
    remote.seed(Entity::Categories, row("cat-1", "old"), 5);
    queue("cat-1", Action::Upsert, Entity::Categories);

    SyncProcessor processor(log, remote);
    auto report = processor.drain();

    EXPECT_EQ(report.processed, 1u);
    EXPECT_EQ(remote.calls("update"), 1u);
}

// =============================================================================
// Rejections
// =============================================================================

TEST_F(SyncProcessorTest, Rejection_ShouldMarkConflictAndContinue) {
    auto rejected = queue("tx-1");
    queue("tx-2");
    remote.fail_with = [](const std::string& method, Entity, const std::string& id) {
        if (method == "insert" && id == "tx-1") {
            throw RemoteRejectedError("check constraint violated");
        }
    };

    SyncProcessor processor(log, remote);
    auto report = processor.drain();

    EXPECT_EQ(report.conflicts, 1u);
    EXPECT_EQ(report.processed, 1u);
    auto conflicts = log.list_conflicts();
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].id, rejected.id);
    EXPECT_EQ(conflicts[0].error, std::optional<std::string>("check constraint violated"));
}

TEST_F(SyncProcessorTest, StaleUpdate_ShouldConflictWithoutCallingUpdate) {
    // Given the cached row was read at 100 but the remote now says 200
    remote.seed(Entity::Items, row("item-1", "edited elsewhere"), 200);
    PendingOperation op;
    op.entity = Entity::Items;
    op.action = Action::Update;
    op.payload = row("item-1", "mine");
    op.expected_updated_at = 100;
    log.enqueue(op);

    SyncProcessor processor(log, remote);
    auto report = processor.drain();

    EXPECT_EQ(report.conflicts, 1u);
    EXPECT_EQ(remote.calls("update"), 0u);
    EXPECT_EQ(log.list_conflicts()[0].error,
              std::optional<std::string>("Record has been modified by another user."));
}

TEST_F(SyncProcessorTest, UpdateOfVanishedRecord_ShouldConflict) {
    PendingOperation op;
    op.entity = Entity::Items;
    op.action = Action::Update;
    op.payload = row("item-1", "mine");
    op.expected_updated_at = 100;
    log.enqueue(op);

    SyncProcessor processor(log, remote);
    processor.drain();

    ASSERT_EQ(log.list_conflicts().size(), 1u);
    EXPECT_EQ(log.list_conflicts()[0].error,
              std::optional<std::string>("Record no longer exists."));
}

TEST_F(SyncProcessorTest, DeleteOfVanishedRecord_ShouldCountAsDone) {
    PendingOperation op;
    op.entity = Entity::Transactions;
    op.action = Action::Delete;
    helpers::set_string(&op.payload, "id", "tx-gone");
    op.expected_updated_at = 100;
    log.enqueue(op);

    SyncProcessor processor(log, remote);
    auto report = processor.drain();

    EXPECT_EQ(report.processed, 1u);
    EXPECT_EQ(log.size(), 0u);
}

// =============================================================================
// Transient failures
// =============================================================================

TEST_F(SyncProcessorTest, TransientFailure_ShouldLeavePendingAndEndSweep) {
    queue("tx-1");
    queue("tx-2");
    remote.fail_with = stockline::testing_support::unreachable;

    SyncProcessor processor(log, remote);
    auto report = processor.drain();

    EXPECT_EQ(report.deferred, 1u);
    EXPECT_EQ(remote.calls("insert"), 1u);
    EXPECT_EQ(log.list_pending().size(), 2u);
}

TEST_F(SyncProcessorTest, TransientFailure_PastBudget_ShouldFailAndMoveOn) {
    queue("tx-1");
    queue("tx-2");
    remote.fail_with = [](const std::string& method, Entity, const std::string& id) {
        if (id == "tx-1") throw GrpcError("deadline", grpc::StatusCode::DEADLINE_EXCEEDED);
    };
    SyncOptions options;
    options.retry_budget = 0;

    SyncProcessor processor(log, remote, options);
    auto report = processor.drain();

    EXPECT_EQ(report.failed, 1u);
    EXPECT_EQ(report.processed, 1u);
    EXPECT_EQ(log.list_failed().size(), 1u);
}

TEST_F(SyncProcessorTest, NextDrain_ShouldPickUpDeferredEntries) {
    queue("tx-1");
    remote.fail_with = stockline::testing_support::unreachable;
    SyncProcessor processor(log, remote);
    processor.drain();

    remote.fail_with = nullptr;
    auto report = processor.drain();

    EXPECT_EQ(report.processed, 1u);
    EXPECT_EQ(log.size(), 0u);
}

// =============================================================================
// Single flight
// =============================================================================

TEST_F(SyncProcessorTest, ReentrantDrain_ShouldCoalesceIntoActivePass) {
    queue("tx-1");
    queue("tx-2");
    SyncReport nested;
    SyncProcessor* self = nullptr;
    SyncOptions options;
    options.on_synced = [&](const PendingOperation&) {
        if (!nested.coalesced) nested = self->drain();
    };

    SyncProcessor processor(log, remote, options);
    self = &processor;
    auto report = processor.drain();

    EXPECT_TRUE(nested.coalesced);
    EXPECT_FALSE(report.coalesced);
    EXPECT_EQ(report.processed, 2u);
    EXPECT_EQ(remote.calls_for("insert", "tx-1"), 1u);
    EXPECT_EQ(remote.calls_for("insert", "tx-2"), 1u);
}

TEST_F(SyncProcessorTest, ConcurrentDrains_ShouldSendEachEntryOnce) {
    for (int i = 0; i < 5; ++i) {
        queue("tx-" + std::to_string(i));
    }
    remote.delay = std::chrono::milliseconds(20);
    SyncProcessor processor(log, remote);

    SyncReport first;
    SyncReport second;
    std::thread a([&] { first = processor.drain(); });
    std::thread b([&] { second = processor.drain(); });
    a.join();
    b.join();

    EXPECT_EQ(first.processed + second.processed, 5u);
    EXPECT_EQ(remote.max_in_flight(), 1);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(remote.calls_for("insert", "tx-" + std::to_string(i)), 1u);
    }
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(SyncProcessorTest, EnqueueThenDrainFromManyThreads_ShouldLeaveNothingBehind) {
    // Given writers that each queue one entry and ask for a drain
    SyncProcessor processor(log, remote);
    constexpr int kWriters = 8;
    constexpr int kPerWriter = 25;
    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w] {
            for (int i = 0; i < kPerWriter; ++i) {
                PendingOperation op;
                op.entity = Entity::Transactions;
                op.action = Action::Create;
                op.created_at = w * kPerWriter + i + 1;
                helpers::set_string(&op.payload, "id",
                                    "tx-" + std::to_string(w) + "-" + std::to_string(i));
                log.enqueue(op);
                processor.drain();
            }
        });
    }

    // When every writer is done
    for (auto& t : writers) t.join();

    // Then the last drain request was honoured
    EXPECT_FALSE(processor.active());
    EXPECT_EQ(log.size(), 0u);
    EXPECT_EQ(remote.calls("insert"), static_cast<size_t>(kWriters * kPerWriter));
}

// =============================================================================
// Conflict resolution
// =============================================================================

TEST_F(SyncProcessorTest, RetriedConflict_OnceRemoteFixed_ShouldBecomeDone) {
    // Given an update that conflicted on a stale timestamp
    remote.seed(Entity::Items, row("item-1", "edited elsewhere"), 200);
    PendingOperation op;
    op.entity = Entity::Items;
    op.action = Action::Update;
    op.payload = row("item-1", "mine");
    op.expected_updated_at = 100;
    log.enqueue(op);
    SyncProcessor processor(log, remote);
    processor.drain();
    ConflictResolver resolver(log);
    ASSERT_EQ(resolver.count(), 1u);

    // When the user retries it
    EXPECT_EQ(resolver.retry_all(), 1u);
    auto report = processor.drain();

    // Then it goes through and leaves the conflict list
    EXPECT_EQ(report.processed, 1u);
    EXPECT_TRUE(resolver.list().empty());
    EXPECT_EQ(helpers::string_field(*remote.row(Entity::Items, "item-1"), "reason"), "mine");
}

TEST_F(SyncProcessorTest, DismissedConflict_ShouldNeverReplay) {
    auto op = queue("tx-1");
    remote.fail_with = [](const std::string&, Entity, const std::string&) {
        throw RemoteRejectedError("rejected");
    };
    SyncProcessor processor(log, remote);
    processor.drain();
    ConflictResolver resolver(log);

    EXPECT_TRUE(resolver.dismiss(op.id));
    remote.fail_with = nullptr;
    processor.drain();

    EXPECT_EQ(remote.calls("insert"), 1u);
    EXPECT_EQ(resolver.count(), 0u);
}

TEST_F(SyncProcessorTest, Resolver_ShouldNotTouchEntriesThatAreNotConflicts) {
    // Given one queued entry that has not been tried yet
    auto op = queue("tx-1");
    ConflictResolver resolver(log);

    // When the resolver is asked to drop or retry it
    EXPECT_FALSE(resolver.dismiss(op.id));
    EXPECT_FALSE(resolver.retry(op.id));

    // Then it still syncs normally
    SyncProcessor processor(log, remote);
    processor.drain();
    EXPECT_EQ(remote.calls("insert"), 1u);
    EXPECT_EQ(log.size(), 0u);
}
