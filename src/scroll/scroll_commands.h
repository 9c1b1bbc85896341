#pragma once

#include <string>

#include "easing.h"
#include "scroll_driver.h"
#include "step_scheduler.h"

namespace glide::scroll {

struct ScrollCommandConfig {
    EasingKind easing = EasingKind::Cubic;
    double line_duration_s = 0.06;
    double half_page_duration_s = 0.15;
    double page_duration_s = 0.25;
    int page_overlap = 2;
    bool move_cursor = true;
};

// Opaque info handed to scroll hooks for runs started by a command.
struct ScrollRequest {
    std::string command;
    int lines = 0;
};

class ScrollCommands {
public:
    ScrollCommands(StepScheduler& scheduler, ScrollDriver& driver, ScrollCommandConfig config);

    void scroll_lines(int lines);
    void half_page_down();
    void half_page_up();
    void page_down();
    void page_up();
    void stop();

    int half_page_lines() const;
    int page_lines() const;

    const ScrollCommandConfig& config() const { return config_; }
    void set_easing(EasingKind easing) { config_.easing = easing; }

private:
    void run(const char* command, int lines, double duration_s);

    StepScheduler& scheduler_;
    ScrollDriver& driver_;
    ScrollCommandConfig config_;
};

} // namespace glide::scroll
