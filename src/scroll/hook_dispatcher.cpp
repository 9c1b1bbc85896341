#include "hook_dispatcher.h"

#include <utility>

namespace glide::scroll {

void HookDispatcher::add_pre_hook(ScrollHook hook) {
    if (hook) {
        pre_hooks_.push_back(std::move(hook));
    }
}

void HookDispatcher::add_post_hook(ScrollHook hook) {
    if (hook) {
        post_hooks_.push_back(std::move(hook));
    }
}

void HookDispatcher::clear() {
    pre_hooks_.clear();
    post_hooks_.clear();
}

void HookDispatcher::pre(const std::any& info) const {
    // Copy so a hook may register further hooks without invalidating the loop.
    const std::vector<ScrollHook> hooks = pre_hooks_;
    for (const ScrollHook& hook : hooks) {
        hook(info);
    }
}

void HookDispatcher::post(const std::any& info) const {
    const std::vector<ScrollHook> hooks = post_hooks_;
    for (const ScrollHook& hook : hooks) {
        hook(info);
    }
}

} // namespace glide::scroll
