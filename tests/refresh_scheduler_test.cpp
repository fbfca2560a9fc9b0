#include <gtest/gtest.h>
#include "cliutil/progress/refresh_scheduler.hpp"

using namespace cliutil::progress;

namespace {

Tick tick_after(double delta, bool last = false) {
    Tick tick;
    tick.is_first_call = false;
    tick.delta_time = delta;
    tick.is_last_item = last;
    return tick;
}

}

TEST(RefreshScheduler, disabled_rejects_everything) {
    RefreshScheduler scheduler;
    scheduler.configure(0.5, 5.0, false, false);
    
    EXPECT_FALSE(scheduler.enabled());
    EXPECT_FALSE(scheduler.shouldProcess(Tick{}));
    EXPECT_FALSE(scheduler.shouldProcess(tick_after(100.0, true)));
}

TEST(RefreshScheduler, first_call_is_processed) {
    RefreshScheduler scheduler;
    scheduler.configure(10.0, 10.0, true, false);
    EXPECT_TRUE(scheduler.shouldProcess(Tick{}));
}

TEST(RefreshScheduler, throttles_to_effective_interval) {
    RefreshScheduler scheduler;
    scheduler.configure(0.5, 5.0, true, true);
    
    EXPECT_DOUBLE_EQ(0.5, scheduler.effectiveInterval());
    EXPECT_FALSE(scheduler.shouldProcess(tick_after(0.4)));
    EXPECT_TRUE(scheduler.shouldProcess(tick_after(0.5)));
}

TEST(RefreshScheduler, interval_of_disabled_sink_is_ignored) {
    RefreshScheduler scheduler;
    scheduler.configure(0.5, 5.0, false, true);
    
    EXPECT_DOUBLE_EQ(5.0, scheduler.effectiveInterval());
    EXPECT_FALSE(scheduler.shouldProcess(tick_after(1.0)));
}

TEST(RefreshScheduler, last_item_is_always_processed) {
    RefreshScheduler scheduler;
    scheduler.configure(5.0, 5.0, true, true);
    EXPECT_TRUE(scheduler.shouldProcess(tick_after(0.01, true)));
}

TEST(RefreshScheduler, sinks_are_due_by_time_since_start) {
    RefreshScheduler scheduler;
    scheduler.configure(1.0, 5.0, true, true);
    
    EXPECT_FALSE(scheduler.consoleDue(std::nullopt));
    EXPECT_FALSE(scheduler.consoleDue(0.9));
    EXPECT_TRUE(scheduler.consoleDue(1.0));
    EXPECT_FALSE(scheduler.fileDue(4.9));
    EXPECT_TRUE(scheduler.fileDue(5.0));
}

TEST(RefreshScheduler, disabled_sink_is_never_due) {
    RefreshScheduler scheduler;
    scheduler.configure(0.0, 0.0, true, false);
    EXPECT_FALSE(scheduler.fileDue(100.0));
}
