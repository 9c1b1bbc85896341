#include "pager_view.h"

#include <algorithm>
#include <sstream>

namespace glide::pager {

namespace {
int text_rows(unsigned int rows, bool show_status) {
    const int total = static_cast<int>(rows);
    return std::max(1, show_status ? total - 1 : total);
}
} // namespace

PagerView::PagerView(notcurses* nc, const TextDocument& document, bool show_status)
    : nc_(nc)
    , plane_(notcurses_stdplane(nc))
    , document_(document)
    , show_status_(show_status)
    , viewport_(document.line_count(), 1) {
    handle_resize();
}

void PagerView::scroll_forward(int units) {
    viewport_.scroll_by(units);
}

void PagerView::scroll_backward(int units) {
    viewport_.scroll_by(-units);
}

void PagerView::move_cursor_line(int delta) {
    viewport_.move_cursor(delta);
}

bool PagerView::query_pending_input() {
    if (!pending_.empty()) {
        return true;
    }
    const timespec ts{0, 0};
    if (auto key = poll_key(ts)) {
        pending_.push_back(*key);
    }
    return !pending_.empty();
}

int PagerView::query_window_height() const {
    return viewport_.height();
}

void PagerView::restore_cursor_visibility() {
    viewport_.settle();
    dirty_ = true;
}

void PagerView::notify_post_step() {
    viewport_.settle();
    viewport_.mark_line(viewport_.cursor_line());
    dirty_ = true;
}

void PagerView::clear_transient_markers() {
    if (viewport_.marker_count() > 0) {
        viewport_.clear_markers();
        dirty_ = true;
    }
}

std::optional<KeyEvent> PagerView::next_key(int timeout_ms) {
    if (!pending_.empty()) {
        KeyEvent key = pending_.front();
        pending_.pop_front();
        return key;
    }
    const int wait_ms = std::max(0, timeout_ms);
    const timespec ts{wait_ms / 1000, static_cast<long>(wait_ms % 1000) * 1000000L};
    return poll_key(ts);
}

std::optional<KeyEvent> PagerView::poll_key(const timespec& ts) {
    while (true) {
        KeyEvent key;
        key.id = notcurses_get(nc_, &ts, &key.input);
        if (key.id == 0) {
            return std::nullopt;
        }
        if (key.id == static_cast<uint32_t>(-1)) {
            input_error_ = true;
            return std::nullopt;
        }
        if (key.input.evtype == NCTYPE_RELEASE) {
            continue;
        }
        return key;
    }
}

void PagerView::handle_resize() {
    unsigned int rows = 0;
    unsigned int cols = 0;
    ncplane_dim_yx(plane_, &rows, &cols);
    viewport_.set_height(text_rows(rows, show_status_));
    dirty_ = true;
}

void PagerView::render(const std::string& status_detail, bool animating) {
    unsigned int rows = 0;
    unsigned int cols = 0;
    ncplane_dim_yx(plane_, &rows, &cols);
    ncplane_erase(plane_);

    const int visible = text_rows(rows, show_status_);
    for (int row = 0; row < visible; ++row) {
        const std::size_t line = viewport_.top_line() + static_cast<std::size_t>(row);
        if (line >= document_.line_count()) {
            ncplane_set_styles(plane_, NCSTYLE_NONE);
            ncplane_putstr_yx(plane_, row, 0, "~");
            continue;
        }

        if (line == viewport_.cursor_line()) {
            ncplane_set_styles(plane_, NCSTYLE_BOLD);
            ncplane_set_bg_rgb8(plane_, 0x30, 0x30, 0x48);
        } else if (animating && viewport_.is_marked(line)) {
            ncplane_set_styles(plane_, NCSTYLE_NONE);
            ncplane_set_bg_rgb8(plane_, 0x1c, 0x1c, 0x26);
        } else {
            ncplane_set_styles(plane_, NCSTYLE_NONE);
            ncplane_set_bg_default(plane_);
        }

        // Fill the row so the background covers the full width.
        std::string text = document_.line(line);
        if (text.size() < cols) {
            text.append(cols - text.size(), ' ');
        }
        ncplane_putnstr_yx(plane_, row, 0, cols, text.c_str());
        ncplane_set_bg_default(plane_);
    }

    ncplane_set_styles(plane_, NCSTYLE_NONE);
    if (show_status_ && rows > 1) {
        draw_status(rows - 1, cols, status_detail);
    }
    dirty_ = false;
}

void PagerView::draw_status(unsigned int row, unsigned int cols, const std::string& status_detail) {
    std::ostringstream oss;
    oss << ' ' << (document_.name().empty() ? "[stdin]" : document_.name())
        << "  line " << (document_.empty() ? 0 : viewport_.cursor_line() + 1) << '/' << document_.line_count()
        << "  " << viewport_.percent_through() << '%';
    if (!status_detail.empty()) {
        oss << "  " << status_detail;
    }

    std::string status = oss.str();
    if (status.size() < cols) {
        status.append(cols - status.size(), ' ');
    }
    ncplane_set_styles(plane_, NCSTYLE_REVERSE);
    ncplane_putnstr_yx(plane_, static_cast<int>(row), 0, cols, status.c_str());
    ncplane_set_styles(plane_, NCSTYLE_NONE);
}

} // namespace glide::pager
