#include "timer_queue.h"

#include <algorithm>
#include <utility>

namespace glide::scroll {

TimerQueue::TimerQueue(std::int64_t now_ms)
    : now_ms_(now_ms) {}

TimerHandle TimerQueue::schedule_once(int delay_ms, TimerCallback callback) {
    Entry entry;
    entry.handle = next_handle_++;
    entry.due_ms = now_ms_ + std::max(0, delay_ms);
    entry.callback = std::move(callback);
    entries_.push_back(std::move(entry));
    return entries_.back().handle;
}

void TimerQueue::cancel(TimerHandle handle) {
    if (handle == kInvalidTimer) {
        return;
    }
    entries_.erase(std::remove_if(entries_.begin(),
                                  entries_.end(),
                                  [handle](const Entry& entry) { return entry.handle == handle; }),
                   entries_.end());
}

std::optional<std::size_t> TimerQueue::earliest_due(std::int64_t limit_ms) const {
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const Entry& entry = entries_[i];
        if (entry.due_ms > limit_ms) {
            continue;
        }
        // Equal deadlines fire in scheduling order; handles only grow.
        if (!best || entry.due_ms < entries_[*best].due_ms ||
            (entry.due_ms == entries_[*best].due_ms && entry.handle < entries_[*best].handle)) {
            best = i;
        }
    }
    return best;
}

std::size_t TimerQueue::advance_to(std::int64_t now_ms) {
    std::size_t fired = 0;
    const std::int64_t target = std::max(now_ms_, now_ms);

    while (const auto index = earliest_due(target)) {
        Entry entry = std::move(entries_[*index]);
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(*index));
        now_ms_ = std::max(now_ms_, entry.due_ms);
        if (entry.callback) {
            entry.callback();
        }
        ++fired;
    }

    now_ms_ = target;
    return fired;
}

bool TimerQueue::run_next() {
    const auto deadline = next_deadline();
    if (!deadline) {
        return false;
    }
    return advance_to(*deadline) > 0;
}

std::optional<std::int64_t> TimerQueue::next_deadline() const {
    if (entries_.empty()) {
        return std::nullopt;
    }
    const auto it = std::min_element(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) {
        return a.due_ms < b.due_ms;
    });
    return it->due_ms;
}

bool TimerQueue::is_pending(TimerHandle handle) const {
    return std::any_of(entries_.begin(), entries_.end(), [handle](const Entry& entry) {
        return entry.handle == handle;
    });
}

} // namespace glide::scroll
