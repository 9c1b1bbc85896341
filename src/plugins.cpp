#include "plugins.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include "scroll/scroll_commands.h"

namespace glide {
namespace {

class ScrollTraceLogPlugin final : public Plugin {
public:
    std::string id() const override { return "scroll-trace-log"; }

    void on_load(const AppConfig& config) override {
        start_ = std::chrono::steady_clock::now();
        open_log(config);
        if (!log_) {
            enabled_ = false;
            std::clog << "[plugin] scroll-trace-log failed to open '" << log_path_ << "'; disabling plugin"
                      << std::endl;
            return;
        }
        enabled_ = true;
        std::clog << "[plugin] scroll-trace-log -> '" << log_path_ << "'" << std::endl;
        log_ << "\n=== scroll-trace-log session started ===\n";
        log_.flush();
    }

    void on_scroll_start(const std::any& info) override { write_line("start", info); }
    void on_scroll_finish(const std::any& info) override { write_line("finish", info); }

private:
    void open_log(const AppConfig& config) {
        std::filesystem::path base_path;
        if (!config.plugins.directory.empty()) {
            base_path = std::filesystem::path(config.plugins.directory);
            std::error_code ec;
            std::filesystem::create_directories(base_path, ec);
            if (ec) {
                std::clog << "[plugin] scroll-trace-log failed to create directory '" << base_path.string()
                          << "' (" << ec.message() << ")" << std::endl;
                base_path.clear();
            }
        }

        std::filesystem::path target_path;
        if (!config.runtime.trace_file.empty()) {
            target_path = config.runtime.trace_file;
            if (target_path.is_relative() && !base_path.empty()) {
                target_path = base_path / target_path;
            }
        } else {
            target_path = base_path.empty() ? std::filesystem::path("glide-scroll-trace.log")
                                            : base_path / "glide-scroll-trace.log";
        }

        log_path_ = target_path.string();
        log_.open(target_path, std::ios::out | std::ios::app);
    }

    void write_line(const char* phase, const std::any& info) {
        if (!enabled_ || !log_) {
            return;
        }
        const double elapsed_s =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();

        std::ostringstream line;
        line << std::fixed << std::setprecision(3) << elapsed_s << "s " << phase;
        if (const auto* request = std::any_cast<scroll::ScrollRequest>(&info)) {
            line << " command=" << request->command << " lines=" << request->lines;
        }
        log_ << line.str() << '\n';
        log_.flush();
    }

    bool enabled_ = false;
    std::ofstream log_;
    std::string log_path_;
    std::chrono::steady_clock::time_point start_{};
};

} // namespace

void PluginManager::register_factory(const std::string& id, PluginFactory factory) {
    factories_[id] = std::move(factory);
}

void PluginManager::load_from_config(const AppConfig& config) {
    warnings_.clear();
    active_.clear();
    if (config.plugins.safe_mode) {
        warnings_.push_back("Plug-ins disabled by plugins.safe_mode");
        return;
    }

    std::vector<std::string> requested = config.plugins.autoload;
    if (!config.runtime.trace_file.empty()) {
        if (std::find(requested.begin(), requested.end(), "scroll-trace-log") == requested.end()) {
            requested.push_back("scroll-trace-log");
        }
    }

    for (const std::string& id : requested) {
        auto it = factories_.find(id);
        if (it == factories_.end()) {
            warnings_.push_back("Unknown plugin '" + id + "'");
            continue;
        }
        std::unique_ptr<Plugin> plugin = it->second();
        if (!plugin) {
            warnings_.push_back("Factory for plugin '" + id + "' returned null");
            continue;
        }
        plugin->on_load(config);
        active_.push_back(std::move(plugin));
    }
}

void PluginManager::attach(scroll::HookDispatcher& hooks) {
    for (const std::unique_ptr<Plugin>& plugin : active_) {
        Plugin* raw = plugin.get();
        hooks.add_pre_hook([raw](const std::any& info) { raw->on_scroll_start(info); });
        hooks.add_post_hook([raw](const std::any& info) { raw->on_scroll_finish(info); });
    }
}

void register_builtin_plugins(PluginManager& manager) {
    manager.register_factory("scroll-trace-log", []() { return std::make_unique<ScrollTraceLogPlugin>(); });
}

} // namespace glide
