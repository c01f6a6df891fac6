#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <thread>
#include "fake_remote_store.hpp"
#include "stockline/connectivity.hpp"
#include "stockline/durable_store.hpp"
#include "stockline/entity_cache.hpp"
#include "stockline/helpers.hpp"
#include "stockline/operation_log.hpp"
#include "stockline/realtime.hpp"
#include "stockline/scheduler.hpp"
#include "stockline/sync_processor.hpp"

using namespace stockline;
using stockline::testing_support::FakeRemoteStore;

namespace {

bool eventually(const std::function<bool()>& condition) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

} // anonymous namespace

class SyncSchedulerTest : public ::testing::Test {
protected:
    MemoryStore store;
    FakeRemoteStore remote;
    OperationLog log{store};
    SyncProcessor processor{log, remote};

    // Long intervals so only explicit wake-ups cause a drain
    SchedulerOptions quiet() {
        SchedulerOptions options;
        options.sync_interval = std::chrono::hours(1);
        options.health_check_interval = std::chrono::hours(1);
        return options;
    }

    void queue(const std::string& id) {
        PendingOperation op;
        op.entity = Entity::Contractors;
        helpers::set_string(&op.payload, "id", id);
        helpers::set_string(&op.payload, "name", "Acme");
        log.enqueue(op);
    }
};

TEST_F(SyncSchedulerTest, Trigger_WhileOnline_ShouldDrain) {
    Connectivity connectivity(true);
    SyncScheduler scheduler(processor, connectivity, nullptr, quiet());
    scheduler.start();
    queue("c-1");

    scheduler.trigger();

    EXPECT_TRUE(eventually([&] { return log.size() == 0; }));
    scheduler.stop();
    EXPECT_FALSE(scheduler.running());
}

TEST_F(SyncSchedulerTest, Trigger_WhileOffline_ShouldLeaveLogAlone) {
    Connectivity connectivity(false);
    SyncScheduler scheduler(processor, connectivity, nullptr, quiet());
    scheduler.start();
    queue("c-1");

    scheduler.trigger();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_EQ(log.size(), 1u);
    EXPECT_EQ(remote.calls("insert"), 0u);
}

TEST_F(SyncSchedulerTest, ComingBackOnline_ShouldDrainWithoutTrigger) {
    Connectivity connectivity(false);
    SyncScheduler scheduler(processor, connectivity, nullptr, quiet());
    scheduler.start();
    queue("c-1");

    connectivity.set_online(true);

    EXPECT_TRUE(eventually([&] { return log.size() == 0; }));
}

TEST_F(SyncSchedulerTest, Interval_ShouldDrainPeriodically) {
    Connectivity connectivity(true);
    SchedulerOptions options = quiet();
    options.sync_interval = std::chrono::milliseconds(20);
    SyncScheduler scheduler(processor, connectivity, nullptr, options);
    scheduler.start();

    queue("c-1");

    EXPECT_TRUE(eventually([&] { return log.size() == 0; }));
}

TEST_F(SyncSchedulerTest, BufferedRemoteChange_ShouldBeAppliedWhenItsWindowCloses) {
    // Given a realtime applier with a short window attached to an idle scheduler
    EntityCache cache(store);
    RealtimeApplier realtime(cache, std::chrono::milliseconds(30));
    Connectivity connectivity(false);
    SyncScheduler scheduler(processor, connectivity, nullptr, quiet());
    scheduler.attach_realtime(&realtime);
    scheduler.start();

    auto change = [](const std::string& id) {
        RemoteChange c;
        c.entity = Entity::Contractors;
        helpers::set_string(&c.row, "id", id);
        helpers::set_string(&c.row, "name", "Acme");
        return c;
    };

    // When two changes arrive back to back and nothing else happens
    EXPECT_EQ(realtime.receive(change("c-1")), 1u);
    EXPECT_EQ(realtime.receive(change("c-2")), 0u);

    // Then the second one lands on its own
    EXPECT_TRUE(eventually([&] { return cache.find(Entity::Contractors, "c-2").has_value(); }));
    EXPECT_FALSE(realtime.deadline().has_value());
}
