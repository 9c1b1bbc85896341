#pragma once

#include <string>
#include <vector>

#include "scroll/easing.h"

namespace glide {

struct ScrollConfig {
    scroll::EasingKind easing = scroll::EasingKind::Cubic;
    double line_duration_s = 0.06;
    double half_page_duration_s = 0.15;
    double page_duration_s = 0.25;
    int page_overlap = 2;
    bool move_cursor = true;
};

struct PagerConfig {
    double target_fps = 60.0;
    bool show_status = true;
    int tab_width = 4;
};

struct PluginConfig {
    std::vector<std::string> autoload{};
    std::string directory{};
    bool safe_mode = false;
};

struct RuntimeConfig {
    std::string trace_file{};
};

struct AppConfig {
    ScrollConfig scroll{};
    PagerConfig pager{};
    PluginConfig plugins{};
    RuntimeConfig runtime{};
};

struct ConfigLoadResult {
    AppConfig config{};
    bool loaded_file = false;
    std::vector<std::string> warnings{};
};

ConfigLoadResult load_app_config(const std::string& path);

} // namespace glide
