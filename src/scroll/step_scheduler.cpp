#include "step_scheduler.h"

#include <cstdlib>
#include <utility>

namespace glide::scroll {

namespace {
int sign_of(int value) {
    return value > 0 ? 1 : (value < 0 ? -1 : 0);
}
} // namespace

StepScheduler::StepScheduler(ScrollDriver& driver,
                             HighlightRefresher& refresher,
                             Timer& timer,
                             HookDispatcher& hooks)
    : driver_(driver)
    , refresher_(refresher)
    , timer_(timer)
    , hooks_(hooks)
    , monitor_(driver, [this]() { interrupt(); }) {}

StepScheduler::~StepScheduler() {
    if (state_ && state_->timer_handle) {
        timer_.cancel(*state_->timer_handle);
    }
}

void StepScheduler::start_scroll(int lines, ScrollOptions options) {
    interrupt();
    if (lines == 0) {
        return;
    }

    AnimationState state;
    state.total_lines = lines;
    state.relative_position = 0;
    state.options = std::move(options);
    state.interrupted = false;
    state.generation = ++generation_;
    state_ = std::move(state);

    const std::uint64_t generation = generation_;
    if (hooks_.has_pre_hooks()) {
        hooks_.pre(state_->options.info);
    }

    // A pre hook may have cancelled or replaced this run.
    if (!state_ || state_->generation != generation) {
        return;
    }
    step(generation);
}

void StepScheduler::interrupt() {
    if (state_) {
        if (state_->timer_handle) {
            timer_.cancel(*state_->timer_handle);
            state_->timer_handle.reset();
        }
        state_->interrupted = true;
        finalize();
        return;
    }

    refresher_.notify_post_step();
    refresher_.clear_transient_markers();
}

void StepScheduler::step(std::uint64_t generation) {
    if (!state_ || state_->generation != generation) {
        return;
    }
    // The timer that delivered this step has been consumed.
    state_->timer_handle.reset();

    const int remaining = state_->total_lines - state_->relative_position;
    if (state_->interrupted) {
        finalize();
        return;
    }
    if (monitor_.check(true)) {
        return;
    }
    if (remaining == 0) {
        finalize();
        return;
    }

    const int direction = sign_of(remaining);
    if (direction > 0) {
        driver_.scroll_forward(1);
    } else {
        driver_.scroll_backward(1);
    }
    if (state_->options.move_cursor) {
        driver_.move_cursor_line(direction);
    }

    state_->relative_position += direction;
    refresher_.notify_post_step();

    const int left = state_->total_lines - state_->relative_position;
    if (left == 0) {
        finalize();
        return;
    }

    const int delay_ms = compute_time_step(std::abs(left),
                                           std::abs(state_->total_lines),
                                           state_->options.duration_seconds * 1000.0,
                                           state_->options.easing);
    state_->timer_handle = timer_.schedule_once(delay_ms, [this, generation]() { step(generation); });
}

void StepScheduler::finalize() {
    if (!state_) {
        return;
    }

    AnimationState finished = std::move(*state_);
    state_.reset();
    if (finished.timer_handle) {
        timer_.cancel(*finished.timer_handle);
    }

    driver_.restore_cursor_visibility();
    refresher_.notify_post_step();
    // Step markers only live while a run is moving.
    refresher_.clear_transient_markers();
    if (hooks_.has_post_hooks()) {
        hooks_.post(finished.options.info);
    }
}

} // namespace glide::scroll
