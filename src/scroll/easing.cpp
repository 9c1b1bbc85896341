#include "easing.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace glide::scroll {

namespace {
constexpr double kPi = 3.14159265358979323846;

double clamp01(double value) {
    return std::clamp(value, 0.0, 1.0);
}

std::string lowercase(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char ch : value) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

// floor()ed delay to whole milliseconds, at least 1, never past INT_MAX.
int to_delay_ms(double delay) {
    if (std::isnan(delay) || delay < 1.0) {
        return 1;
    }
    constexpr double kMaxDelay = static_cast<double>(std::numeric_limits<int>::max());
    if (delay >= kMaxDelay) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(delay);
}

} // namespace

double ease(EasingKind kind, double progress) {
    const double p = clamp01(progress);
    switch (kind) {
    case EasingKind::Quadratic:
        return p * p;
    case EasingKind::Cubic: {
        const double u = 1.0 - p;
        return 1.0 - u * u * u;
    }
    case EasingKind::Sine:
        return 1.0 - std::cos(p * kPi / 2.0);
    case EasingKind::Linear:
    default:
        return p;
    }
}

double inverse_ease(EasingKind kind, double eased) {
    const double x = clamp01(eased);
    switch (kind) {
    case EasingKind::Quadratic:
        return 1.0 - std::sqrt(1.0 - x);
    case EasingKind::Cubic:
        return 1.0 - std::cbrt(1.0 - x);
    case EasingKind::Sine:
        return 2.0 * std::asin(x) / kPi;
    case EasingKind::Linear:
    default:
        return x;
    }
}

int compute_time_step(int remaining_lines, int total_lines, double duration_ms, EasingKind easing) {
    if (remaining_lines < 1) {
        return kIdleTimeStepMs;
    }

    if (easing == EasingKind::Linear) {
        const int intervals = std::max(1, total_lines - 1);
        return to_delay_ms(std::floor(duration_ms / static_cast<double>(intervals)));
    }

    const double range = static_cast<double>(std::max(1, std::abs(total_lines)));
    const double x1 = (range - remaining_lines) / range;
    const double x2 = (range - remaining_lines + 1) / range;
    return to_delay_ms(std::floor(duration_ms * (inverse_ease(easing, x2) - inverse_ease(easing, x1))));
}

std::optional<EasingKind> parse_easing_kind(std::string_view name) {
    const std::string cleaned = lowercase(name);
    if (cleaned == "linear") {
        return EasingKind::Linear;
    }
    if (cleaned == "quadratic" || cleaned == "quad") {
        return EasingKind::Quadratic;
    }
    if (cleaned == "cubic") {
        return EasingKind::Cubic;
    }
    if (cleaned == "sine" || cleaned == "sin") {
        return EasingKind::Sine;
    }
    return std::nullopt;
}

std::string to_string(EasingKind kind) {
    switch (kind) {
    case EasingKind::Quadratic:
        return "quadratic";
    case EasingKind::Cubic:
        return "cubic";
    case EasingKind::Sine:
        return "sine";
    case EasingKind::Linear:
    default:
        return "linear";
    }
}

} // namespace glide::scroll
