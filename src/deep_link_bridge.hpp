#pragma once

#include "activation_event.hpp"
#include "app_handle.hpp"
#include "interfaces/i_instance_guard.hpp"
#include "interfaces/i_scheme_registrar.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace statisfy {

// Relays scheme activations and forwarded launches to the AppHandle.
//
// Both sources end up as one emission per URL under the same event name,
// so listeners cannot tell a cold activation from a second launch. Batches
// are published whole and in arrival order.
class DeepLinkBridge {
public:
    // Non-owning: registrar and guard must outlive the bridge
    DeepLinkBridge(ISchemeRegistrar* registrar,
                   IInstanceGuard* guard,
                   std::string scheme,
                   std::string event_name);
    ~DeepLinkBridge() = default;

    DeepLinkBridge(const DeepLinkBridge&) = delete;
    DeepLinkBridge& operator=(const DeepLinkBridge&) = delete;

    // Subscribes to both sources; events go to `handle` from now on
    void start(std::shared_ptr<AppHandle> handle);

    void publish_activation(const ActivationEvent& event);
    void publish_invocation(const LaunchInvocation& invocation);

    // Called after the URLs of a forwarded launch were published
    void set_on_handoff(std::function<void(const LaunchInvocation&)> callback);

    [[nodiscard]] size_t published_count() const { return published_; }
    [[nodiscard]] size_t dropped_count() const { return dropped_; }

private:
    void publish_locked(const std::string& url);

    ISchemeRegistrar* registrar_ = nullptr;
    IInstanceGuard* guard_ = nullptr;
    std::string scheme_;
    std::string event_name_;

    std::mutex publish_mutex_;
    std::shared_ptr<AppHandle> handle_;
    std::function<void(const LaunchInvocation&)> on_handoff_;

    std::atomic<size_t> published_{0};
    std::atomic<size_t> dropped_{0};
};

} // namespace statisfy
