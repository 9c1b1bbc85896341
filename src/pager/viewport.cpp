#include "viewport.h"

#include <algorithm>

namespace glide::pager {

Viewport::Viewport(std::size_t line_count, int height)
    : line_count_(line_count)
    , height_(std::max(1, height)) {}

void Viewport::set_height(int height) {
    height_ = std::max(1, height);
    top_line_ = std::min(top_line_, max_top_line());
    settle();
}

void Viewport::set_line_count(std::size_t line_count) {
    line_count_ = line_count;
    top_line_ = std::min(top_line_, max_top_line());
    cursor_line_ = line_count_ == 0 ? 0 : std::min(cursor_line_, line_count_ - 1);
    settle();
}

std::size_t Viewport::max_top_line() const {
    const std::size_t rows = static_cast<std::size_t>(height_);
    return line_count_ > rows ? line_count_ - rows : 0;
}

int Viewport::scroll_by(int delta) {
    const std::size_t before = top_line_;
    if (delta >= 0) {
        top_line_ = std::min(max_top_line(), top_line_ + static_cast<std::size_t>(delta));
    } else {
        const std::size_t back = static_cast<std::size_t>(-static_cast<long long>(delta));
        top_line_ = back > top_line_ ? 0 : top_line_ - back;
    }
    return static_cast<int>(static_cast<long long>(top_line_) - static_cast<long long>(before));
}

int Viewport::move_cursor(int delta) {
    if (line_count_ == 0) {
        return 0;
    }
    const std::size_t before = cursor_line_;
    if (delta >= 0) {
        cursor_line_ = std::min(line_count_ - 1, cursor_line_ + static_cast<std::size_t>(delta));
    } else {
        const std::size_t back = static_cast<std::size_t>(-static_cast<long long>(delta));
        cursor_line_ = back > cursor_line_ ? 0 : cursor_line_ - back;
    }
    return static_cast<int>(static_cast<long long>(cursor_line_) - static_cast<long long>(before));
}

void Viewport::jump_to_top() {
    top_line_ = 0;
    cursor_line_ = 0;
}

void Viewport::jump_to_bottom() {
    top_line_ = max_top_line();
    cursor_line_ = line_count_ == 0 ? 0 : line_count_ - 1;
}

int Viewport::percent_through() const {
    if (line_count_ == 0) {
        return 100;
    }
    const std::size_t bottom = std::min(line_count_, top_line_ + static_cast<std::size_t>(height_));
    return static_cast<int>((bottom * 100) / line_count_);
}

void Viewport::settle() {
    if (line_count_ == 0) {
        cursor_line_ = 0;
        return;
    }
    const std::size_t rows = static_cast<std::size_t>(height_);
    const std::size_t last_visible = std::min(line_count_ - 1, top_line_ + rows - 1);
    cursor_line_ = std::clamp(cursor_line_, top_line_, last_visible);
}

} // namespace glide::pager
