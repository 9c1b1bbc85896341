#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "scroll_driver.h"

namespace glide::scroll {

// Decides at the top of every step whether the running animation should be
// abandoned. A positive check has already invoked the interrupt action.
class InterruptMonitor {
public:
    using Trigger = std::function<bool()>;

    InterruptMonitor(ScrollDriver& driver, std::function<void()> on_interrupt);

    bool check(bool animation_active);

    void add_trigger(std::string name, Trigger trigger);
    void clear_triggers();
    std::size_t trigger_count() const { return triggers_.size(); }

    // Name of the source that fired last, "input" for pending host input.
    const std::string& last_source() const { return last_source_; }

private:
    struct NamedTrigger {
        std::string name;
        Trigger trigger;
    };

    ScrollDriver& driver_;
    std::function<void()> on_interrupt_;
    std::vector<NamedTrigger> triggers_;
    std::string last_source_;
};

} // namespace glide::scroll
