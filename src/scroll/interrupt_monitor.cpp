#include "interrupt_monitor.h"

#include <utility>

namespace glide::scroll {

InterruptMonitor::InterruptMonitor(ScrollDriver& driver, std::function<void()> on_interrupt)
    : driver_(driver)
    , on_interrupt_(std::move(on_interrupt)) {}

bool InterruptMonitor::check(bool animation_active) {
    if (!animation_active) {
        return false;
    }

    std::string source;
    if (driver_.query_pending_input()) {
        source = "input";
    } else {
        for (const NamedTrigger& entry : triggers_) {
            if (entry.trigger && entry.trigger()) {
                source = entry.name;
                break;
            }
        }
    }

    if (source.empty()) {
        return false;
    }

    last_source_ = std::move(source);
    if (on_interrupt_) {
        on_interrupt_();
    }
    return true;
}

void InterruptMonitor::add_trigger(std::string name, Trigger trigger) {
    triggers_.push_back(NamedTrigger{std::move(name), std::move(trigger)});
}

void InterruptMonitor::clear_triggers() {
    triggers_.clear();
}

} // namespace glide::scroll
