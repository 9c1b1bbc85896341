#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include <notcurses/notcurses.h>

#include "../scroll/scroll_driver.h"
#include "text_document.h"
#include "viewport.h"

namespace glide::pager {

struct KeyEvent {
    uint32_t id = 0;
    ncinput input{};
};

// Terminal front end over notcurses' standard plane. Implements the scroll
// collaborators so the step scheduler moves this view directly.
class PagerView final : public scroll::ScrollDriver, public scroll::HighlightRefresher {
public:
    PagerView(notcurses* nc, const TextDocument& document, bool show_status);

    PagerView(const PagerView&) = delete;
    PagerView& operator=(const PagerView&) = delete;

    void scroll_forward(int units) override;
    void scroll_backward(int units) override;
    void move_cursor_line(int delta) override;
    bool query_pending_input() override;
    int query_window_height() const override;
    void restore_cursor_visibility() override;

    void notify_post_step() override;
    void clear_transient_markers() override;

    // Buffered keys first, then waits up to timeout_ms for a new one.
    std::optional<KeyEvent> next_key(int timeout_ms);

    void handle_resize();
    void render(const std::string& status_detail, bool animating);

    bool dirty() const { return dirty_; }
    bool input_error() const { return input_error_; }
    Viewport& viewport() { return viewport_; }

private:
    std::optional<KeyEvent> poll_key(const timespec& ts);
    void draw_status(unsigned int row, unsigned int cols, const std::string& status_detail);

    notcurses* nc_ = nullptr;
    ncplane* plane_ = nullptr;
    const TextDocument& document_;
    bool show_status_ = true;
    Viewport viewport_;
    std::deque<KeyEvent> pending_;
    bool dirty_ = true;
    bool input_error_ = false;
};

} // namespace glide::pager
