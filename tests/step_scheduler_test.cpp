#include <gtest/gtest.h>

#include <any>
#include <cstdint>
#include <string>
#include <vector>

#include "scroll/hook_dispatcher.h"
#include "scroll/step_scheduler.h"
#include "scroll/timer_queue.h"
#include "scroll_fakes.h"

using glide::scroll::EasingKind;
using glide::scroll::HookDispatcher;
using glide::scroll::ScrollOptions;
using glide::scroll::StepScheduler;
using glide::scroll::TimerQueue;
using glide::testing::CountingRefresher;
using glide::testing::LeakyTimer;
using glide::testing::RecordingDriver;

namespace {

ScrollOptions make_options(double duration_s, EasingKind easing, bool move_cursor = true, std::any info = {}) {
    ScrollOptions options;
    options.duration_seconds = duration_s;
    options.easing = easing;
    options.move_cursor = move_cursor;
    options.info = std::move(info);
    return options;
}

class StepSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        hooks.add_pre_hook([this](const std::any& info) { log.push_back("pre:" + label(info)); });
        hooks.add_post_hook([this](const std::any& info) { log.push_back("post:" + label(info)); });
    }

    static std::string label(const std::any& info) {
        if (const auto* text = std::any_cast<std::string>(&info)) {
            return *text;
        }
        return "?";
    }

    void drain() {
        while (timers.run_next()) {
        }
    }

    std::size_t count_log(const std::string& entry) const {
        std::size_t n = 0;
        for (const std::string& e : log) {
            if (e == entry) {
                ++n;
            }
        }
        return n;
    }

    RecordingDriver driver;
    CountingRefresher refresher;
    TimerQueue timers;
    HookDispatcher hooks;
    std::vector<std::string> log;
    StepScheduler scheduler{driver, refresher, timers, hooks};
};

} // namespace

TEST_F(StepSchedulerTest, ZeroLinesDoesNothing) {
    scheduler.start_scroll(0, make_options(0.25, EasingKind::Cubic, true, std::string("zero")));

    EXPECT_TRUE(driver.calls.empty());
    EXPECT_TRUE(log.empty());
    EXPECT_FALSE(scheduler.is_active());
    EXPECT_EQ(timers.pending(), 0u);
}

TEST_F(StepSchedulerTest, ZeroLinesStillCancelsRunningAnimation) {
    scheduler.start_scroll(6, make_options(0.2, EasingKind::Linear, true, std::string("a")));
    ASSERT_TRUE(scheduler.is_active());

    scheduler.start_scroll(0, make_options(0.2, EasingKind::Linear, true, std::string("b")));

    EXPECT_FALSE(scheduler.is_active());
    EXPECT_EQ(timers.pending(), 0u);
    EXPECT_EQ(log, (std::vector<std::string>{"pre:a", "post:a"}));
}

TEST_F(StepSchedulerTest, FirstStepRunsSynchronously) {
    scheduler.start_scroll(4, make_options(0.2, EasingKind::Cubic));

    EXPECT_EQ(driver.calls, (std::vector<std::string>{"+1", "c+1"}));
    ASSERT_TRUE(scheduler.state().has_value());
    EXPECT_EQ(scheduler.state()->relative_position, 1);
    EXPECT_EQ(scheduler.state()->total_lines, 4);
    EXPECT_TRUE(scheduler.state()->timer_handle.has_value());
    EXPECT_EQ(timers.pending(), 1u);
}

TEST_F(StepSchedulerTest, RunsForwardToCompletion) {
    scheduler.start_scroll(5, make_options(0.15, EasingKind::Cubic, true, std::string("fwd")));
    drain();

    EXPECT_EQ(driver.count("+1"), 5u);
    EXPECT_EQ(driver.count("-1"), 0u);
    EXPECT_EQ(driver.count("c+1"), 5u);
    EXPECT_EQ(log, (std::vector<std::string>{"pre:fwd", "post:fwd"}));
    EXPECT_FALSE(scheduler.is_active());
    EXPECT_EQ(timers.pending(), 0u);
    EXPECT_EQ(driver.cursor_restores, 1);
    EXPECT_EQ(refresher.marker_clears, 1);
}

TEST_F(StepSchedulerTest, RunsBackwardToCompletion) {
    scheduler.start_scroll(-3, make_options(0.1, EasingKind::Sine));
    drain();

    EXPECT_EQ(driver.calls, (std::vector<std::string>{"-1", "c-1", "-1", "c-1", "-1", "c-1"}));
    EXPECT_FALSE(scheduler.is_active());
}

TEST_F(StepSchedulerTest, ViewportOnlyWhenCursorStays) {
    scheduler.start_scroll(3, make_options(0.1, EasingKind::Quadratic, false));
    drain();

    EXPECT_EQ(driver.calls, (std::vector<std::string>{"+1", "+1", "+1"}));
}

TEST_F(StepSchedulerTest, LinearTenLinesTakesNineIntervals) {
    scheduler.start_scroll(10, make_options(0.25, EasingKind::Linear));

    int fired = 0;
    std::int64_t last = timers.now();
    while (timers.run_next()) {
        EXPECT_EQ(timers.now() - last, 27);
        last = timers.now();
        ++fired;
    }

    EXPECT_EQ(fired, 9);
    EXPECT_EQ(driver.scroll_calls(), 10u);
    EXPECT_NEAR(static_cast<double>(timers.now()), 250.0, 9.0);
}

TEST_F(StepSchedulerTest, OneLineFinishesInsideStart) {
    scheduler.start_scroll(1, make_options(0.3, EasingKind::Cubic, true, std::string("one")));

    EXPECT_FALSE(scheduler.is_active());
    EXPECT_EQ(driver.scroll_calls(), 1u);
    EXPECT_EQ(timers.pending(), 0u);
    EXPECT_EQ(log, (std::vector<std::string>{"pre:one", "post:one"}));
}

TEST_F(StepSchedulerTest, InterruptBeforeFirstTimer) {
    scheduler.start_scroll(5, make_options(0.15, EasingKind::Linear, true, std::string("run")));
    scheduler.interrupt();

    EXPECT_LE(driver.scroll_calls(), 1u);
    EXPECT_FALSE(scheduler.is_active());
    EXPECT_EQ(timers.pending(), 0u);
    EXPECT_EQ(count_log("post:run"), 1u);

    timers.advance_to(10000);
    EXPECT_LE(driver.scroll_calls(), 1u);
    EXPECT_EQ(count_log("post:run"), 1u);
}

TEST_F(StepSchedulerTest, InterruptMidRunStopsMovement) {
    scheduler.start_scroll(8, make_options(0.4, EasingKind::Sine, true, std::string("mid")));
    timers.run_next();
    timers.run_next();
    const std::size_t before = driver.calls.size();

    scheduler.interrupt();
    drain();

    EXPECT_EQ(driver.calls.size(), before);
    EXPECT_EQ(driver.scroll_calls(), 3u);
    EXPECT_EQ(count_log("post:mid"), 1u);
}

TEST_F(StepSchedulerTest, InterruptIsIdempotent) {
    scheduler.start_scroll(4, make_options(0.1, EasingKind::Linear, true, std::string("x")));
    scheduler.interrupt();
    scheduler.interrupt();
    scheduler.interrupt();

    EXPECT_EQ(count_log("post:x"), 1u);
    EXPECT_FALSE(scheduler.is_active());
    EXPECT_EQ(refresher.marker_clears, 3);
}

TEST_F(StepSchedulerTest, InterruptWhenIdleStillResyncsHighlights) {
    scheduler.interrupt();

    EXPECT_EQ(refresher.marker_clears, 1);
    EXPECT_EQ(refresher.refreshes, 1);
    EXPECT_TRUE(log.empty());
    EXPECT_TRUE(driver.calls.empty());
}

TEST_F(StepSchedulerTest, NewRunSupersedesOldOne) {
    scheduler.start_scroll(5, make_options(0.25, EasingKind::Cubic, true, std::string("first")));
    scheduler.start_scroll(-3, make_options(0.1, EasingKind::Cubic, true, std::string("second")));
    drain();

    EXPECT_EQ(driver.count("+1"), 1u);
    EXPECT_EQ(driver.count("-1"), 3u);
    EXPECT_EQ(count_log("post:first"), 1u);
    EXPECT_EQ(count_log("post:second"), 1u);
    EXPECT_EQ(log, (std::vector<std::string>{"pre:first", "post:first", "pre:second", "post:second"}));
}

TEST_F(StepSchedulerTest, PendingInputCancelsAtNextStep) {
    scheduler.start_scroll(6, make_options(0.3, EasingKind::Linear, true, std::string("typed")));
    timers.run_next();
    ASSERT_EQ(driver.scroll_calls(), 2u);

    driver.pending_input = true;
    timers.run_next();

    EXPECT_EQ(driver.scroll_calls(), 2u);
    EXPECT_FALSE(scheduler.is_active());
    EXPECT_EQ(count_log("post:typed"), 1u);
    EXPECT_EQ(scheduler.interrupt_monitor().last_source(), "input");

    drain();
    EXPECT_EQ(driver.scroll_calls(), 2u);
}

TEST_F(StepSchedulerTest, PendingInputBeforeStartSkipsAllMovement) {
    driver.pending_input = true;
    scheduler.start_scroll(3, make_options(0.1, EasingKind::Linear, true, std::string("busy")));

    EXPECT_TRUE(driver.calls.empty());
    EXPECT_EQ(log, (std::vector<std::string>{"pre:busy", "post:busy"}));
}

TEST_F(StepSchedulerTest, RegisteredTriggerInterrupts) {
    bool fire = false;
    scheduler.interrupt_monitor().add_trigger("mouse", [&fire]() { return fire; });

    scheduler.start_scroll(4, make_options(0.2, EasingKind::Cubic, true, std::string("t")));
    fire = true;
    drain();

    EXPECT_EQ(driver.scroll_calls(), 1u);
    EXPECT_EQ(scheduler.interrupt_monitor().last_source(), "mouse");
    EXPECT_EQ(count_log("post:t"), 1u);
}

TEST_F(StepSchedulerTest, PreHookMayCancelTheRun) {
    hooks.add_pre_hook([this](const std::any&) { scheduler.interrupt(); });

    scheduler.start_scroll(3, make_options(0.1, EasingKind::Linear, true, std::string("veto")));

    EXPECT_TRUE(driver.calls.empty());
    EXPECT_FALSE(scheduler.is_active());
    EXPECT_EQ(count_log("post:veto"), 1u);
}

TEST_F(StepSchedulerTest, PostHookMayStartAnotherRun) {
    bool chained = false;
    hooks.add_post_hook([this, &chained](const std::any&) {
        if (!chained) {
            chained = true;
            scheduler.start_scroll(-2, make_options(0.05, EasingKind::Linear, false, std::string("back")));
        }
    });

    scheduler.start_scroll(2, make_options(0.05, EasingKind::Linear, false, std::string("down")));
    drain();

    EXPECT_EQ(driver.calls, (std::vector<std::string>{"+1", "+1", "-1", "-1"}));
    EXPECT_FALSE(scheduler.is_active());
}

TEST_F(StepSchedulerTest, InfoReachesHooksUnchanged) {
    HookDispatcher plain;
    std::vector<int> seen;
    plain.add_pre_hook([&seen](const std::any& info) { seen.push_back(std::any_cast<int>(info)); });
    plain.add_post_hook([&seen](const std::any& info) { seen.push_back(std::any_cast<int>(info) * 10); });
    StepScheduler other(driver, refresher, timers, plain);

    other.start_scroll(2, make_options(0.05, EasingKind::Linear, true, 7));
    while (timers.run_next()) {
    }

    EXPECT_EQ(seen, (std::vector<int>{7, 70}));
}

TEST(StepSchedulerStaleCallbackTest, SupersededCallbackIsIgnored) {
    RecordingDriver driver;
    CountingRefresher refresher;
    LeakyTimer timer;
    HookDispatcher hooks;
    StepScheduler scheduler(driver, refresher, timer, hooks);

    scheduler.start_scroll(5, make_options(0.1, EasingKind::Linear));
    ASSERT_EQ(timer.callbacks.size(), 1u);
    scheduler.start_scroll(-5, make_options(0.1, EasingKind::Linear));
    ASSERT_EQ(timer.callbacks.size(), 2u);
    EXPECT_GE(timer.cancels, 1);

    // Copies: firing a callback may grow the vector.
    const auto stale = timer.callbacks.front();
    const auto current = timer.callbacks.back();

    const std::size_t before = driver.calls.size();
    stale();
    EXPECT_EQ(driver.calls.size(), before);

    current();
    EXPECT_EQ(driver.count("-1"), 2u);
    EXPECT_EQ(driver.count("+1"), 1u);
}
