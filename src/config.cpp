#include "config.h"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <toml.hpp>

namespace glide {
namespace {

int node_line(const toml::node& node) {
    return static_cast<int>(node.source().begin.line);
}

const toml::node* find_node(const toml::table& table, std::string_view key) {
    return table.at_path(key).node();
}

void warn_invalid(std::string_view key,
                  const toml::node& node,
                  std::string_view expected,
                  std::vector<std::string>& warnings) {
    std::ostringstream oss;
    oss << "Invalid " << node.type() << " for '" << key << "' at line " << node_line(node) << " (expected "
        << expected << "); keeping default";
    warnings.push_back(oss.str());
}

void read_bool(const toml::table& table, std::string_view key, bool& out, std::vector<std::string>& warnings) {
    if (const toml::node* node = find_node(table, key)) {
        if (const std::optional<bool> value = node->value_exact<bool>()) {
            out = *value;
        } else {
            warn_invalid(key, *node, "boolean", warnings);
        }
    }
}

void read_int(const toml::table& table,
              std::string_view key,
              int min_value,
              int& out,
              std::vector<std::string>& warnings) {
    if (const toml::node* node = find_node(table, key)) {
        const std::optional<std::int64_t> value = node->value_exact<std::int64_t>();
        if (!value || *value < min_value || *value > std::numeric_limits<int>::max()) {
            std::ostringstream expected;
            expected << "integer >= " << min_value;
            warn_invalid(key, *node, expected.str(), warnings);
            return;
        }
        out = static_cast<int>(*value);
    }
}

// Integers are accepted as whole seconds. Infinity and NaN are refused.
void read_seconds(const toml::table& table, std::string_view key, double& out, std::vector<std::string>& warnings) {
    if (const toml::node* node = find_node(table, key)) {
        const std::optional<double> value = node->value<double>();
        if (!value || !std::isfinite(*value) || *value < 0.0) {
            warn_invalid(key, *node, "finite seconds >= 0", warnings);
            return;
        }
        out = *value;
    }
}

void read_string(const toml::table& table, std::string_view key, std::string& out, std::vector<std::string>& warnings) {
    if (const toml::node* node = find_node(table, key)) {
        if (const std::optional<std::string> value = node->value_exact<std::string>()) {
            out = *value;
        } else {
            warn_invalid(key, *node, "string", warnings);
        }
    }
}

void load_scroll_section(const toml::table& table, ScrollConfig& section, std::vector<std::string>& warnings) {
    if (const toml::node* node = find_node(table, "scroll.easing")) {
        const std::optional<std::string> name = node->value_exact<std::string>();
        if (!name) {
            warn_invalid("scroll.easing", *node, "easing name", warnings);
        } else if (const auto kind = scroll::parse_easing_kind(*name)) {
            section.easing = *kind;
        } else {
            std::ostringstream oss;
            oss << "Unknown easing '" << *name << "' at line " << node_line(*node) << "; using '"
                << scroll::to_string(section.easing) << "'";
            warnings.push_back(oss.str());
        }
    }

    read_seconds(table, "scroll.line_duration_s", section.line_duration_s, warnings);
    read_seconds(table, "scroll.half_page_duration_s", section.half_page_duration_s, warnings);
    read_seconds(table, "scroll.page_duration_s", section.page_duration_s, warnings);
    read_int(table, "scroll.page_overlap", 0, section.page_overlap, warnings);
    read_bool(table, "scroll.move_cursor", section.move_cursor, warnings);
}

void load_pager_section(const toml::table& table, PagerConfig& pager, std::vector<std::string>& warnings) {
    if (const toml::node* node = find_node(table, "pager.target_fps")) {
        const std::optional<double> fps = node->value<double>();
        if (!fps || !std::isfinite(*fps) || *fps <= 0.0) {
            warn_invalid("pager.target_fps", *node, "frames per second > 0", warnings);
        } else {
            pager.target_fps = *fps;
        }
    }
    read_bool(table, "pager.show_status", pager.show_status, warnings);
    read_int(table, "pager.tab_width", 1, pager.tab_width, warnings);
}

void load_plugin_section(const toml::table& table, PluginConfig& plugins, std::vector<std::string>& warnings) {
    if (const toml::node* node = find_node(table, "plugins.autoload")) {
        if (const toml::array* ids = node->as_array()) {
            plugins.autoload.clear();
            for (const toml::node& entry : *ids) {
                const std::optional<std::string> id = entry.value_exact<std::string>();
                if (!id) {
                    std::ostringstream oss;
                    oss << "Ignoring non-string plug-in id in 'plugins.autoload' at line " << node_line(entry);
                    warnings.push_back(oss.str());
                    continue;
                }
                if (!id->empty()) {
                    plugins.autoload.push_back(*id);
                }
            }
        } else {
            std::ostringstream oss;
            oss << "'plugins.autoload' at line " << node_line(*node) << " must be an array";
            warnings.push_back(oss.str());
        }
    }

    read_string(table, "plugins.directory", plugins.directory, warnings);
    read_bool(table, "plugins.safe_mode", plugins.safe_mode, warnings);
}

} // namespace

ConfigLoadResult load_app_config(const std::string& path) {
    ConfigLoadResult result;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return result;
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
        result.loaded_file = true;
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse '" << path << "': " << err.description() << " (line " << err.source().begin.line
            << ", column " << err.source().begin.column << ")";
        result.warnings.push_back(oss.str());
        return result;
    }

    load_scroll_section(table, result.config.scroll, result.warnings);
    load_pager_section(table, result.config.pager, result.warnings);
    load_plugin_section(table, result.config.plugins, result.warnings);
    read_string(table, "runtime.trace_file", result.config.runtime.trace_file, result.warnings);

    return result;
}

} // namespace glide
