#include "activation_dispatcher.hpp"
#include "deep_link_url.hpp"

namespace statisfy {

ActivationEvent activation_from_launch(const LaunchInvocation& invocation, std::string_view scheme) {
    ActivationEvent event;
    for (const auto& arg : invocation.args) {
        if (has_scheme(arg, scheme)) {
            event.urls.push_back(arg);
        }
    }
    return event;
}

void ActivationDispatcher::set_listener(ActivationCallback callback) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(callback);
    if (!listener_) return;

    for (const auto& event : held_) {
        listener_(event);
    }
    held_.clear();
}

void ActivationDispatcher::deliver(ActivationEvent event) {
    if (event.urls.empty()) return;

    std::lock_guard lock(mutex_);
    current_ = event.urls;
    if (listener_) {
        listener_(event);
    } else {
        held_.push_back(std::move(event));
    }
}

std::vector<std::string> ActivationDispatcher::current() const {
    std::lock_guard lock(mutex_);
    return current_;
}

} // namespace statisfy
