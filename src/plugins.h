#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.h"
#include "scroll/hook_dispatcher.h"

namespace glide {

class Plugin {
public:
    virtual ~Plugin() = default;

    virtual std::string id() const = 0;
    virtual void on_load(const AppConfig& config) = 0;
    virtual void on_scroll_start(const std::any& info) { (void)info; }
    virtual void on_scroll_finish(const std::any& info) { (void)info; }
};

using PluginFactory = std::function<std::unique_ptr<Plugin>()>;

class PluginManager {
public:
    void register_factory(const std::string& id, PluginFactory factory);
    void load_from_config(const AppConfig& config);

    // Wires every loaded plug-in into the scroll hooks.
    void attach(scroll::HookDispatcher& hooks);

    const std::vector<std::string>& warnings() const { return warnings_; }
    std::size_t active_count() const { return active_.size(); }

private:
    std::unordered_map<std::string, PluginFactory> factories_;
    std::vector<std::unique_ptr<Plugin>> active_;
    std::vector<std::string> warnings_;
};

void register_builtin_plugins(PluginManager& manager);

} // namespace glide
