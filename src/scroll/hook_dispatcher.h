#pragma once

#include <any>
#include <functional>
#include <vector>

namespace glide::scroll {

using ScrollHook = std::function<void(const std::any& info)>;

class HookDispatcher {
public:
    void add_pre_hook(ScrollHook hook);
    void add_post_hook(ScrollHook hook);
    void clear();

    bool has_pre_hooks() const { return !pre_hooks_.empty(); }
    bool has_post_hooks() const { return !post_hooks_.empty(); }

    void pre(const std::any& info) const;
    void post(const std::any& info) const;

private:
    std::vector<ScrollHook> pre_hooks_;
    std::vector<ScrollHook> post_hooks_;
};

} // namespace glide::scroll
