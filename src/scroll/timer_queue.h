#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "timer.h"

namespace glide::scroll {

// Timer driven by an externally supplied millisecond clock. The pager feeds it
// steady_clock time; tests advance it by hand.
class TimerQueue final : public Timer {
public:
    explicit TimerQueue(std::int64_t now_ms = 0);

    TimerHandle schedule_once(int delay_ms, TimerCallback callback) override;
    void cancel(TimerHandle handle) override;

    // Runs every callback due at or before now_ms, in deadline order. Callbacks
    // scheduled while running are honoured if they are also due.
    std::size_t advance_to(std::int64_t now_ms);

    // Jumps the clock to the next deadline and runs what is due there.
    bool run_next();

    std::optional<std::int64_t> next_deadline() const;
    std::int64_t now() const { return now_ms_; }
    std::size_t pending() const { return entries_.size(); }
    bool is_pending(TimerHandle handle) const;

private:
    struct Entry {
        TimerHandle handle = kInvalidTimer;
        std::int64_t due_ms = 0;
        TimerCallback callback;
    };

    std::optional<std::size_t> earliest_due(std::int64_t limit_ms) const;

    std::vector<Entry> entries_;
    std::int64_t now_ms_ = 0;
    TimerHandle next_handle_ = 1;
};

} // namespace glide::scroll
