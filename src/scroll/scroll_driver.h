#pragma once

namespace glide::scroll {

// Performs the actual movement for the scheduler. Moving past the edge of the
// buffer is the driver's concern and is silently ignored there.
class ScrollDriver {
public:
    virtual ~ScrollDriver() = default;

    virtual void scroll_forward(int units) = 0;
    virtual void scroll_backward(int units) = 0;
    virtual void move_cursor_line(int delta) = 0;

    virtual bool query_pending_input() = 0;
    virtual int query_window_height() const = 0;

    virtual void restore_cursor_visibility() {}
};

class HighlightRefresher {
public:
    virtual ~HighlightRefresher() = default;

    virtual void notify_post_step() = 0;
    virtual void clear_transient_markers() {}
};

} // namespace glide::scroll
