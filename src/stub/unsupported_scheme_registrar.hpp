#pragma once

#include "../interfaces/i_scheme_registrar.hpp"
#include "../activation_dispatcher.hpp"
#include "../config.hpp"

namespace statisfy {

// For platforms without a registration backend: registration always reports
// Unsupported, launch-time activations are still forwarded.
class UnsupportedSchemeRegistrar : public ISchemeRegistrar {
public:
    explicit UnsupportedSchemeRegistrar(const AppConfig& config);
    ~UnsupportedSchemeRegistrar() override = default;

    RegistrationResult register_scheme(const std::string& scheme) override;
    [[nodiscard]] bool is_registered(const std::string& scheme) const override;

    void on_activate(ActivationCallback callback) override;
    void notify_launch(const LaunchInvocation& invocation) override;
    [[nodiscard]] std::vector<std::string> current() const override;

private:
    std::string scheme_;
    ActivationDispatcher dispatcher_;
};

} // namespace statisfy
