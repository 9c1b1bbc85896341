#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace glide::scroll {

enum class EasingKind {
    Linear,
    Quadratic,
    Cubic,
    Sine,
};

// Forward curves, progress in [0,1] -> eased progress in [0,1].
double ease(EasingKind kind, double progress);

// Inverse curves, eased progress -> position fraction. Only used to sample
// per-step delays.
double inverse_ease(EasingKind kind, double eased);

// Delay in milliseconds before the step that follows, given how many lines are
// still left to move. Never returns less than 1.
int compute_time_step(int remaining_lines, int total_lines, double duration_ms, EasingKind easing);

std::optional<EasingKind> parse_easing_kind(std::string_view name);
std::string to_string(EasingKind kind);

inline constexpr int kIdleTimeStepMs = 1000;

} // namespace glide::scroll
