#include "deep_link_bridge.hpp"
#include "deep_link_url.hpp"
#include <cassert>
#include <spdlog/spdlog.h>

namespace statisfy {

DeepLinkBridge::DeepLinkBridge(ISchemeRegistrar* registrar,
                               IInstanceGuard* guard,
                               std::string scheme,
                               std::string event_name)
    : registrar_(registrar)
    , guard_(guard)
    , scheme_(std::move(scheme))
    , event_name_(std::move(event_name)) {

    assert(registrar_ && "ISchemeRegistrar must not be null");
    assert(guard_ && "IInstanceGuard must not be null");
}

void DeepLinkBridge::start(std::shared_ptr<AppHandle> handle) {
    {
        std::lock_guard lock(publish_mutex_);
        handle_ = std::move(handle);
    }

    registrar_->on_activate([this](const ActivationEvent& event) {
        publish_activation(event);
    });

    guard_->set_handoff_callback([this](const LaunchInvocation& invocation) {
        publish_invocation(invocation);
    });

    spdlog::debug("Deep-link bridge started for {}:// on '{}'", scheme_, event_name_);
}

void DeepLinkBridge::publish_activation(const ActivationEvent& event) {
    std::lock_guard lock(publish_mutex_);
    spdlog::info("Activation with {} URL(s)", event.urls.size());

    for (const auto& candidate : event.urls) {
        if (auto url = parse_deep_link(candidate, scheme_)) {
            publish_locked(*url);
        } else {
            ++dropped_;
            spdlog::warn("Dropping malformed deep link '{}'", candidate);
        }
    }
}

void DeepLinkBridge::publish_invocation(const LaunchInvocation& invocation) {
    std::function<void(const LaunchInvocation&)> on_handoff;
    {
        std::lock_guard lock(publish_mutex_);
        size_t count = 0;
        for (const auto& arg : invocation.args) {
            if (auto url = parse_deep_link(arg, scheme_)) {
                publish_locked(*url);
                ++count;
            } else if (has_scheme(arg, scheme_)) {
                ++dropped_;
                spdlog::warn("Dropping malformed deep link '{}'", arg);
            }
        }
        spdlog::info("Second launch forwarded {} deep link(s)", count);
        on_handoff = on_handoff_;
    }

    if (on_handoff) {
        on_handoff(invocation);
    }
}

void DeepLinkBridge::set_on_handoff(std::function<void(const LaunchInvocation&)> callback) {
    std::lock_guard lock(publish_mutex_);
    on_handoff_ = std::move(callback);
}

void DeepLinkBridge::publish_locked(const std::string& url) {
    if (!handle_) {
        spdlog::debug("Bridge not started, dropping {}", url);
        return;
    }
    spdlog::debug("Publishing '{}': {}", event_name_, url);
    handle_->emit(event_name_, url);
    ++published_;
}

} // namespace statisfy
