#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "ChaosPolicy.hpp"
#include "PromiseScheduler.hpp"

class SchedulerTest : public ::testing::Test {
   protected:
    ChaosRng rng{1234};
    ChaosPolicy chaos{rng};
    PromiseScheduler sched{chaos, SchedulerOptions{10, 1000, false}};
};

TEST_F(SchedulerTest, HandlesAreSequentialAndStartPending) {
    PromiseHandle a = sched.create(1.0, 100, false);
    PromiseHandle b = sched.create(2.0, 100, false);
    EXPECT_EQ(a.id, 1u);
    EXPECT_EQ(b.id, 2u);
    EXPECT_EQ(sched.entry(a).status, PromiseStatus::Pending);
    EXPECT_TRUE(sched.has_pending());
    EXPECT_EQ(sched.size(), 2u);
}

TEST_F(SchedulerTest, UnknownHandleIsALogicError) {
    EXPECT_THROW(sched.entry(PromiseHandle{42}), std::logic_error);
    EXPECT_THROW(sched.entry(PromiseHandle{0}), std::logic_error);
}

TEST_F(SchedulerTest, DefaultTimeoutApplies) {
    PromiseHandle h = sched.create(std::string("x"), std::nullopt, false);
    EXPECT_EQ(sched.entry(h).timeout_ms, 1000u);
}

TEST_F(SchedulerTest, ZeroTimeoutSettlesOnFirstTick) {
    for (int i = 0; i < 50; ++i) {
        PromiseHandle h = sched.create(double(i), 0, false);
        sched.tick();
        EXPECT_NE(sched.entry(h).status, PromiseStatus::Pending) << "promise " << h.id;
    }
}

TEST_F(SchedulerTest, TimeoutBoundsPendingTime) {
    PromiseHandle h = sched.create(1.0, 30, false);
    for (int i = 0; i < 4; ++i) sched.tick();
    // t=40ms > 30ms
    EXPECT_NE(sched.entry(h).status, PromiseStatus::Pending);
    EXPECT_EQ(sched.now_ms(), 40u);
    EXPECT_EQ(sched.tick_count(), 4u);
}

TEST_F(SchedulerTest, AbandonedPromiseCarriesError) {
    PromiseHandle h = sched.create(1.0, 0, false);
    sched.tick();
    const PromiseEntry& e = sched.entry(h);
    if (e.status == PromiseStatus::Abandoned) {
        EXPECT_EQ(e.error.kind, ErrorKind::PromiseAbandoned);
        EXPECT_FALSE(e.error.message.empty());
    } else {
        ASSERT_EQ(e.status, PromiseStatus::Resolved);
        EXPECT_DOUBLE_EQ(std::get<double>(e.value), 1.0);
    }
}

TEST_F(SchedulerTest, WaitersWakeInSuspensionOrder) {
    PromiseHandle h = sched.create(std::string("v"), 0, false);
    std::vector<int> order;
    sched.suspend(h, [&]() { order.push_back(1); });
    sched.suspend(h, [&]() { order.push_back(2); });
    sched.suspend(h, [&]() { order.push_back(3); });
    EXPECT_EQ(sched.suspended_count(), 3u);

    sched.tick();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(sched.suspended_count(), 0u);
}

TEST_F(SchedulerTest, SuspendOnSettledPromiseRunsNextTick) {
    PromiseHandle task = sched.create_task();
    sched.resolve_task(task, 5.0);

    bool ran = false;
    sched.suspend(task, [&]() { ran = true; });
    EXPECT_EQ(sched.suspended_count(), 0u);
    EXPECT_FALSE(ran);
    sched.tick();
    EXPECT_TRUE(ran);
}

TEST_F(SchedulerTest, TaskSettlementWakesWaiters) {
    PromiseHandle task = sched.create_task();
    int woken = 0;
    sched.suspend(task, [&]() { ++woken; });
    sched.reject_task(task, ErrorValue{ErrorKind::TeapotError, "418", std::nullopt});
    sched.tick();
    EXPECT_EQ(woken, 1);
    EXPECT_EQ(sched.entry(task).status, PromiseStatus::Rejected);
}

TEST_F(SchedulerTest, ChaosNeverSettlesTasks) {
    PromiseHandle task = sched.create_task();
    for (int i = 0; i < 100; ++i) sched.tick();
    EXPECT_EQ(sched.entry(task).status, PromiseStatus::Pending);
    EXPECT_FALSE(sched.has_pending());
}

TEST_F(SchedulerTest, UnawaitedRejectedTasksAreReported) {
    PromiseHandle t1 = sched.create_task();
    PromiseHandle t2 = sched.create_task();
    sched.reject_task(t1, ErrorValue{ErrorKind::NameNotFound, "gone", std::nullopt});
    sched.reject_task(t2, ErrorValue{ErrorKind::NameNotFound, "gone", std::nullopt});
    sched.mark_awaited(t2);

    auto unhandled = sched.unhandled_rejections();
    ASSERT_EQ(unhandled.size(), 1u);
    EXPECT_EQ(unhandled[0]->handle, t1);
}

TEST_F(SchedulerTest, RunUntilIdleDrainsEverything) {
    std::vector<PromiseHandle> hs;
    for (int i = 0; i < 10; ++i) hs.push_back(sched.create(double(i), 200, false));
    int woken = 0;
    for (auto h : hs) sched.suspend(h, [&]() { ++woken; });

    sched.run_until_idle();
    EXPECT_FALSE(sched.has_pending());
    EXPECT_EQ(woken, 10);
    for (auto h : hs) EXPECT_NE(sched.entry(h).status, PromiseStatus::Pending);
}

TEST_F(SchedulerTest, RunUntilIdleRethrowsContinuationFailure) {
    PromiseHandle h = sched.create(1.0, 0, false);
    sched.suspend(h, []() { throw std::runtime_error("boom"); });
    EXPECT_THROW(sched.run_until_idle(), std::runtime_error);
}

TEST_F(SchedulerTest, RunUntilIdleWithNothingToDoReturns) {
    sched.run_until_idle();
    EXPECT_EQ(sched.tick_count(), 0u);
}

// A fickle promise flips at most once, on a later tick than it settled.
TEST(SchedulerMindChangeTest, ExplicitMindChangeFlipsOnce) {
    int flipped = 0;
    for (uint64_t seed = 1; seed <= 40; ++seed) {
        ChaosRng rng(seed);
        ChaosPolicy chaos(rng);
        PromiseScheduler sched(chaos);

        PromiseHandle h = sched.create(std::string("yes"), 100000, true);
        while (sched.entry(h).status == PromiseStatus::Pending) sched.tick();
        if (sched.entry(h).status != PromiseStatus::Resolved) continue;

        uint64_t settled = sched.entry(h).settled_tick;
        for (int i = 0; i < 60; ++i) sched.tick();

        const PromiseEntry& e = sched.entry(h);
        if (e.changed_mind) {
            ++flipped;
            EXPECT_EQ(e.status, PromiseStatus::Rejected);
            EXPECT_EQ(e.error.kind, ErrorKind::PromiseRejected);
            EXPECT_GT(sched.tick_count(), settled);
        } else {
            EXPECT_EQ(e.status, PromiseStatus::Resolved);
        }
    }
    EXPECT_GT(flipped, 0);
}

TEST(SchedulerMindChangeTest, SteadyPromiseNeverFlips) {
    ChaosRng rng(3);
    ChaosPolicy chaos(rng);
    PromiseScheduler sched(chaos);

    PromiseHandle h = sched.create(1.0, 0, false);
    for (int i = 0; i < 50; ++i) sched.tick();
    EXPECT_FALSE(sched.entry(h).changed_mind);
    EXPECT_NE(sched.entry(h).status, PromiseStatus::Rejected);
}
