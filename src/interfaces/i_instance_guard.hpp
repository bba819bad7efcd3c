#pragma once

#include "../launch_invocation.hpp"
#include <functional>

namespace statisfy {

enum class InstanceRole {
    Primary,
    Secondary
};

using HandoffCallback = std::function<void(const LaunchInvocation&)>;

class IInstanceGuard {
public:
    virtual ~IInstanceGuard() = default;

    // Decides the role of this process. A secondary has already handed
    // `invocation` to the primary when this returns.
    // Throws HandoffError if the handoff failed and the lock could not be taken over.
    virtual InstanceRole acquire(const LaunchInvocation& invocation) = 0;

    // Primary side: called with every invocation forwarded by a secondary
    virtual void set_handoff_callback(HandoffCallback callback) = 0;
};

} // namespace statisfy
