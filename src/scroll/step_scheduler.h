#pragma once

#include <any>
#include <cstdint>
#include <optional>

#include "easing.h"
#include "hook_dispatcher.h"
#include "interrupt_monitor.h"
#include "scroll_driver.h"
#include "timer.h"

namespace glide::scroll {

struct ScrollOptions {
    double duration_seconds = 0.15;
    EasingKind easing = EasingKind::Cubic;
    bool move_cursor = true;
    std::any info;
};

struct AnimationState {
    int total_lines = 0;
    int relative_position = 0;
    ScrollOptions options;
    bool interrupted = false;
    std::optional<TimerHandle> timer_handle;
    std::uint64_t generation = 0;
};

// Plays a signed line displacement back as unit moves spaced by eased delays.
// Runs entirely on the caller's event loop; the Timer decides when steps fire.
class StepScheduler {
public:
    StepScheduler(ScrollDriver& driver, HighlightRefresher& refresher, Timer& timer, HookDispatcher& hooks);
    ~StepScheduler();

    StepScheduler(const StepScheduler&) = delete;
    StepScheduler& operator=(const StepScheduler&) = delete;

    void start_scroll(int lines, ScrollOptions options);
    void interrupt();

    bool is_active() const { return state_.has_value(); }
    const std::optional<AnimationState>& state() const { return state_; }
    std::uint64_t generation() const { return generation_; }

    InterruptMonitor& interrupt_monitor() { return monitor_; }

private:
    void step(std::uint64_t generation);
    void finalize();

    ScrollDriver& driver_;
    HighlightRefresher& refresher_;
    Timer& timer_;
    HookDispatcher& hooks_;
    InterruptMonitor monitor_;

    std::optional<AnimationState> state_;
    std::uint64_t generation_ = 0;
};

} // namespace glide::scroll
