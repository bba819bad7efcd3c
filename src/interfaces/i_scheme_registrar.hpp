#pragma once

#include "../activation_event.hpp"
#include "../errors.hpp"
#include "../launch_invocation.hpp"
#include <string>
#include <vector>

namespace statisfy {

class ISchemeRegistrar {
public:
    virtual ~ISchemeRegistrar() = default;

    // Associates `scheme` with this application at the OS level.
    // Idempotent within a process.
    virtual RegistrationResult register_scheme(const std::string& scheme) = 0;
    [[nodiscard]] virtual bool is_registered(const std::string& scheme) const = 0;

    // Listener for scheme activations; may be invoked on any thread
    virtual void on_activate(ActivationCallback callback) = 0;

    // Entry point for activations carried by this process's own command line
    virtual void notify_launch(const LaunchInvocation& invocation) = 0;

    // URLs of the most recent activation
    [[nodiscard]] virtual std::vector<std::string> current() const = 0;
};

} // namespace statisfy
