#pragma once

#include "activation_event.hpp"
#include "launch_invocation.hpp"
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace statisfy {

// Arguments of `invocation` that claim `scheme`, as one activation.
// The OS passes scheme URLs to a freshly launched handler this way.
[[nodiscard]] ActivationEvent activation_from_launch(const LaunchInvocation& invocation,
                                                     std::string_view scheme);

// Listener slot shared by the scheme registrars. Activations delivered
// before a listener exists are held and replayed, in order, to the first one.
class ActivationDispatcher {
public:
    void set_listener(ActivationCallback callback);
    void deliver(ActivationEvent event);

    [[nodiscard]] std::vector<std::string> current() const;

private:
    mutable std::mutex mutex_;
    ActivationCallback listener_;
    std::vector<ActivationEvent> held_;
    std::vector<std::string> current_;
};

} // namespace statisfy
