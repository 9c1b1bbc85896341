#pragma once

#include <cstddef>
#include <set>

namespace glide::pager {

// Window onto a document of line_count lines. Scrolling and cursor motion are
// independent so a step can shift both by one row; settle() pulls the cursor
// back inside the visible rows afterwards. Moves past either end are clamped.
class Viewport {
public:
    Viewport(std::size_t line_count, int height);

    void set_height(int height);
    void set_line_count(std::size_t line_count);

    // Both return how many lines actually moved.
    int scroll_by(int delta);
    int move_cursor(int delta);

    void settle();

    void jump_to_top();
    void jump_to_bottom();

    std::size_t top_line() const { return top_line_; }
    std::size_t cursor_line() const { return cursor_line_; }
    std::size_t max_top_line() const;
    std::size_t line_count() const { return line_count_; }
    int height() const { return height_; }

    // Percentage of the document above the bottom of the window.
    int percent_through() const;

    void mark_line(std::size_t line) { markers_.insert(line); }
    void clear_markers() { markers_.clear(); }
    bool is_marked(std::size_t line) const { return markers_.count(line) != 0; }
    std::size_t marker_count() const { return markers_.size(); }

private:
    std::size_t line_count_ = 0;
    int height_ = 1;
    std::size_t top_line_ = 0;
    std::size_t cursor_line_ = 0;
    std::set<std::size_t> markers_;
};

} // namespace glide::pager
