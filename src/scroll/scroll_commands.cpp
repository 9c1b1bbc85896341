#include "scroll_commands.h"

#include <algorithm>
#include <utility>

namespace glide::scroll {

ScrollCommands::ScrollCommands(StepScheduler& scheduler, ScrollDriver& driver, ScrollCommandConfig config)
    : scheduler_(scheduler)
    , driver_(driver)
    , config_(std::move(config)) {}

int ScrollCommands::half_page_lines() const {
    return std::max(1, driver_.query_window_height() / 2);
}

int ScrollCommands::page_lines() const {
    return std::max(1, driver_.query_window_height() - std::max(0, config_.page_overlap));
}

void ScrollCommands::scroll_lines(int lines) {
    run(lines >= 0 ? "scroll-down" : "scroll-up", lines, config_.line_duration_s);
}

void ScrollCommands::half_page_down() {
    run("half-page-down", half_page_lines(), config_.half_page_duration_s);
}

void ScrollCommands::half_page_up() {
    run("half-page-up", -half_page_lines(), config_.half_page_duration_s);
}

void ScrollCommands::page_down() {
    run("page-down", page_lines(), config_.page_duration_s);
}

void ScrollCommands::page_up() {
    run("page-up", -page_lines(), config_.page_duration_s);
}

void ScrollCommands::stop() {
    scheduler_.interrupt();
}

void ScrollCommands::run(const char* command, int lines, double duration_s) {
    ScrollOptions options;
    options.duration_seconds = std::max(0.0, duration_s);
    options.easing = config_.easing;
    options.move_cursor = config_.move_cursor;
    options.info = ScrollRequest{command, lines};
    scheduler_.start_scroll(lines, std::move(options));
}

} // namespace glide::scroll
