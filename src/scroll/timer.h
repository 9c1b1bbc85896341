#pragma once

#include <cstdint>
#include <functional>

namespace glide::scroll {

using TimerHandle = std::uint64_t;
using TimerCallback = std::function<void()>;

inline constexpr TimerHandle kInvalidTimer = 0;

// One-shot deferred callbacks on the host's event loop. After cancel() returns
// the callback for that handle must never run.
class Timer {
public:
    virtual ~Timer() = default;

    virtual TimerHandle schedule_once(int delay_ms, TimerCallback callback) = 0;
    virtual void cancel(TimerHandle handle) = 0;
};

} // namespace glide::scroll
