#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "refreshlatch/errors.hpp"
#include "refreshlatch/manual_scheduler.hpp"

namespace {

    using std::chrono::milliseconds;
    using Clock = refreshlatch::Scheduler::Clock;

} // namespace

TEST(ManualScheduler, FiresOnlyOnceDeadlineIsReached) {
    refreshlatch::ManualScheduler scheduler;
    int                           fired = 0;

    scheduler.schedule(milliseconds(100), [&]() { ++fired; });

    EXPECT_EQ(scheduler.advance(milliseconds(99)), 0u);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(scheduler.advance(milliseconds(1)), 1u);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(scheduler.advance(milliseconds(1000)), 0u);
    EXPECT_EQ(fired, 1);
}

TEST(ManualScheduler, NeverFiresInsideSchedule) {
    refreshlatch::ManualScheduler scheduler;
    bool                          fired = false;

    scheduler.schedule(milliseconds(0), [&]() { fired = true; });

    EXPECT_FALSE(fired);
    EXPECT_EQ(scheduler.pending(), 1u);
    EXPECT_EQ(scheduler.run_pending(), 1u);
    EXPECT_TRUE(fired);
}

TEST(ManualScheduler, RunsInDeadlineThenSchedulingOrder) {
    refreshlatch::ManualScheduler scheduler;
    std::vector<std::string>      order;

    scheduler.schedule(milliseconds(200), [&]() { order.emplace_back("late"); });
    scheduler.schedule(milliseconds(100), [&]() { order.emplace_back("first"); });
    scheduler.schedule(milliseconds(100), [&]() { order.emplace_back("second"); });

    scheduler.advance(milliseconds(500));
    EXPECT_EQ(order, (std::vector<std::string>{"first", "second", "late"}));
}

TEST(ManualScheduler, ReportsDeadlineAsNowWhileFiring) {
    refreshlatch::ManualScheduler scheduler;
    Clock::time_point             seen;

    scheduler.schedule(milliseconds(250), [&]() { seen = scheduler.now(); });
    scheduler.advance(milliseconds(1000));

    EXPECT_EQ(seen, Clock::time_point{} + milliseconds(250));
    EXPECT_EQ(scheduler.now(), Clock::time_point{} + milliseconds(1000));
}

TEST(ManualScheduler, CancelledCallbackNeverFires) {
    refreshlatch::ManualScheduler scheduler;
    bool                          fired  = false;
    const auto                    handle = scheduler.schedule(milliseconds(100), [&]() { fired = true; });

    EXPECT_TRUE(scheduler.cancel(handle));
    EXPECT_FALSE(scheduler.cancel(handle));
    scheduler.advance(milliseconds(200));

    EXPECT_FALSE(fired);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST(ManualScheduler, CallbackCanCancelLaterDueCallback) {
    refreshlatch::ManualScheduler scheduler;
    bool                          second_fired = false;
    refreshlatch::TaskHandle      second;

    scheduler.schedule(milliseconds(100), [&]() { scheduler.cancel(second); });
    second = scheduler.schedule(milliseconds(100), [&]() { second_fired = true; });

    EXPECT_EQ(scheduler.advance(milliseconds(100)), 1u);
    EXPECT_FALSE(second_fired);
}

TEST(ManualScheduler, CancelAllIsIdempotent) {
    refreshlatch::ManualScheduler scheduler;
    int                           fired = 0;

    scheduler.cancel_all();
    scheduler.schedule(milliseconds(10), [&]() { ++fired; });
    scheduler.schedule(milliseconds(20), [&]() { ++fired; });
    scheduler.cancel_all();
    scheduler.cancel_all();
    scheduler.advance(milliseconds(100));

    EXPECT_EQ(fired, 0);
    EXPECT_FALSE(scheduler.next_deadline().has_value());
}

TEST(ManualScheduler, ReportsNextDeadline) {
    refreshlatch::ManualScheduler scheduler(Clock::time_point{} + milliseconds(50));

    scheduler.schedule(milliseconds(30), []() {});
    scheduler.schedule(milliseconds(10), []() {});

    EXPECT_EQ(scheduler.next_deadline(), Clock::time_point{} + milliseconds(60));
}

TEST(ManualScheduler, RejectsNegativeDelay) {
    refreshlatch::ManualScheduler scheduler;

    EXPECT_THROW(scheduler.schedule(milliseconds(-1), []() {}), refreshlatch::InvalidConfigurationError);
    EXPECT_THROW(scheduler.advance(milliseconds(-1)), refreshlatch::InvalidConfigurationError);
}

TEST(ManualScheduler, SaturatesDeadlineInsteadOfWrapping) {
    refreshlatch::ManualScheduler scheduler(Clock::time_point{} + milliseconds(1000));
    bool                          fired = false;

    scheduler.schedule(refreshlatch::kMaxDelay, [&]() { fired = true; });

    EXPECT_EQ(scheduler.next_deadline(), Clock::time_point::max());
    scheduler.advance(milliseconds(1));
    EXPECT_FALSE(fired);
}

TEST(ManualScheduler, RejectsDelayBeyondClockRange) {
    refreshlatch::ManualScheduler scheduler;

    EXPECT_THROW(scheduler.schedule(refreshlatch::kMaxDelay + milliseconds(1), []() {}), refreshlatch::InvalidConfigurationError);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST(ManualScheduler, PropagatesCallbackExceptions) {
    refreshlatch::ManualScheduler scheduler;
    bool                          later_fired = false;

    scheduler.schedule(milliseconds(10), []() { throw std::runtime_error("boom"); });
    scheduler.schedule(milliseconds(20), [&]() { later_fired = true; });

    EXPECT_THROW(scheduler.advance(milliseconds(100)), std::runtime_error);
    EXPECT_EQ(scheduler.pending(), 1u);
    scheduler.advance(milliseconds(100));
    EXPECT_TRUE(later_fired);
}
