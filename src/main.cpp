#include <algorithm>
#include <chrono>
#include <clocale>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

#include <unistd.h>

#include <cxxopts.hpp>
#include <notcurses/notcurses.h>

#include "config.h"
#include "pager/pager_view.h"
#include "pager/text_document.h"
#include "plugins.h"
#include "scroll/hook_dispatcher.h"
#include "scroll/scroll_commands.h"
#include "scroll/step_scheduler.h"
#include "scroll/timer_queue.h"

namespace {

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

// Returns false when the key asks to quit.
bool dispatch_key(const glide::pager::KeyEvent& key,
                  glide::scroll::ScrollCommands& commands,
                  glide::pager::PagerView& view) {
    switch (key.id) {
    case 'q':
    case 'Q':
        return false;
    case 'j':
    case NCKEY_DOWN:
    case NCKEY_ENTER:
        commands.scroll_lines(1);
        break;
    case 'k':
    case NCKEY_UP:
        commands.scroll_lines(-1);
        break;
    case 'd':
        commands.half_page_down();
        break;
    case 'u':
        commands.half_page_up();
        break;
    case ' ':
    case 'f':
    case NCKEY_PGDOWN:
        commands.page_down();
        break;
    case 'b':
    case NCKEY_PGUP:
        commands.page_up();
        break;
    case 'g':
    case NCKEY_HOME:
        commands.stop();
        view.viewport().jump_to_top();
        break;
    case 'G':
    case NCKEY_END:
        commands.stop();
        view.viewport().jump_to_bottom();
        break;
    case NCKEY_ESC:
        commands.stop();
        break;
    case NCKEY_RESIZE:
        view.handle_resize();
        break;
    default:
        break;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::setlocale(LC_ALL, "");

    cxxopts::Options options("glide", "Pager with eased smooth scrolling");
    options.add_options()
        ("c,config", "Path to configuration file", cxxopts::value<std::string>()->default_value("glide.toml"))
        ("e,easing", "Easing curve: linear, quadratic, cubic or sine", cxxopts::value<std::string>())
        ("no-move-cursor", "Scroll the view without moving the cursor")
        ("file", "File to page; - or none reads stdin", cxxopts::value<std::string>())
        ("h,help", "Print usage");
    options.parse_positional({"file"});
    options.positional_help("[FILE|-]");

    std::string config_path;
    std::string file_path;
    std::string easing_override;
    bool no_move_cursor = false;

    try {
        const auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        config_path = result["config"].as<std::string>();
        if (result.count("easing")) {
            easing_override = result["easing"].as<std::string>();
        }
        if (result.count("file")) {
            file_path = result["file"].as<std::string>();
        }
        no_move_cursor = result.count("no-move-cursor") > 0;
    } catch (const cxxopts::exceptions::exception& ex) {
        std::cerr << ex.what() << std::endl;
        std::cerr << options.help() << std::endl;
        return 1;
    }

    const bool read_stdin = file_path.empty() || file_path == "-";
    if (read_stdin && isatty(STDIN_FILENO)) {
        std::cerr << "No file given and stdin is a terminal" << std::endl;
        std::cerr << options.help() << std::endl;
        return 1;
    }

    const glide::ConfigLoadResult config_result = glide::load_app_config(config_path);
    glide::AppConfig config = config_result.config;
    if (!config_result.loaded_file) {
        std::clog << "[config] using built-in defaults (missing '" << config_path << "')" << std::endl;
    } else {
        std::clog << "[config] loaded '" << config_path << "'" << std::endl;
    }
    for (const std::string& warning : config_result.warnings) {
        std::cerr << "[config] " << warning << std::endl;
    }

    if (!easing_override.empty()) {
        if (const auto kind = glide::scroll::parse_easing_kind(easing_override)) {
            config.scroll.easing = *kind;
        } else {
            std::cerr << "Unknown easing '" << easing_override << "'" << std::endl;
            return 1;
        }
    }
    if (no_move_cursor) {
        config.scroll.move_cursor = false;
    }

    glide::pager::TextDocument document;
    try {
        if (read_stdin) {
            document = glide::pager::TextDocument::from_stream(std::cin, std::string{}, config.pager.tab_width);
        } else {
            document = glide::pager::TextDocument::load_file(file_path, config.pager.tab_width);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[pager] " << ex.what() << std::endl;
        return 1;
    }
    std::clog << "[pager] '" << file_path << "' has " << document.line_count() << " lines" << std::endl;

    glide::scroll::HookDispatcher hooks;
    glide::PluginManager plugin_manager;
    glide::register_builtin_plugins(plugin_manager);
    plugin_manager.load_from_config(config);
    for (const std::string& warning : plugin_manager.warnings()) {
        std::cerr << "[plugin] " << warning << std::endl;
    }
    plugin_manager.attach(hooks);

    notcurses_options opts{};
    opts.flags = NCOPTION_SUPPRESS_BANNERS;
    notcurses* nc = notcurses_init(&opts, nullptr);
    if (!nc) {
        std::cerr << "Failed to initialize notcurses" << std::endl;
        return 1;
    }

    const auto start_time = std::chrono::steady_clock::now();
    glide::pager::PagerView view(nc, document, config.pager.show_status);
    glide::scroll::TimerQueue timers(elapsed_ms(start_time));
    glide::scroll::StepScheduler scheduler(view, view, timers, hooks);

    glide::scroll::ScrollCommandConfig command_config;
    command_config.easing = config.scroll.easing;
    command_config.line_duration_s = config.scroll.line_duration_s;
    command_config.half_page_duration_s = config.scroll.half_page_duration_s;
    command_config.page_duration_s = config.scroll.page_duration_s;
    command_config.page_overlap = config.scroll.page_overlap;
    command_config.move_cursor = config.scroll.move_cursor;
    glide::scroll::ScrollCommands commands(scheduler, view, command_config);

    const int frame_ms = std::max(1, static_cast<int>(1000.0 / config.pager.target_fps));
    const std::string easing_label = glide::scroll::to_string(config.scroll.easing);

    int exit_code = 0;
    bool running = true;
    while (running) {
        timers.advance_to(elapsed_ms(start_time));

        if (view.dirty()) {
            view.render(easing_label, scheduler.is_active());
            if (notcurses_render(nc) != 0) {
                std::cerr << "Failed to render frame" << std::endl;
                exit_code = 1;
                break;
            }
        }

        // Block on input until the next step is due.
        int wait_ms = frame_ms;
        if (const auto deadline = timers.next_deadline()) {
            wait_ms = static_cast<int>(std::clamp<std::int64_t>(*deadline - elapsed_ms(start_time), 0, frame_ms));
        }

        while (const auto key = view.next_key(wait_ms)) {
            if (!dispatch_key(*key, commands, view)) {
                running = false;
                break;
            }
            wait_ms = 0;
        }
        if (view.input_error()) {
            std::cerr << "Failed to read input" << std::endl;
            exit_code = 1;
            running = false;
        }
    }

    scheduler.interrupt();

    if (notcurses_stop(nc) != 0) {
        std::cerr << "Failed to stop notcurses cleanly" << std::endl;
        return 1;
    }

    return exit_code;
}
